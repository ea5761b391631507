// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace blocksub::rpc {

//! JSON-RPC server address as given on the command line, e.g. ws://localhost:8546
struct Endpoint {
    std::string scheme;
    std::string host;
    uint16_t port{0};
    std::string target{"/"};

    //! \throws std::invalid_argument on malformed URL or unsupported scheme (only http and ws)
    static Endpoint parse(std::string_view url);

    //! host:port, as expected by the Host header and the websocket handshake
    std::string authority() const;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& out, const Endpoint& endpoint);

}  // namespace blocksub::rpc
