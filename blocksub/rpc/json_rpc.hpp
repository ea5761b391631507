// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <blocksub/types/header.hpp>

namespace blocksub::rpc {

inline constexpr int kParseError{-32700};
inline constexpr int kInvalidRequest{-32600};

//! Error object returned by the server, or a malformed response (code kInvalidRequest/kParseError)
class JsonRpcError : public std::runtime_error {
  public:
    JsonRpcError(int code, const std::string& message);

    int code() const noexcept { return code_; }

  private:
    int code_;
};

//! {"jsonrpc":"2.0","id":id,"method":method,"params":params}
nlohmann::json make_request(uint64_t id, std::string_view method, nlohmann::json params);

//! Extracts the result of the response to request id
//! \throws JsonRpcError on malformed JSON, id mismatch or error response
nlohmann::json decode_response(std::string_view content, uint64_t id);

//! Decodes a header object as returned by eth_getBlockByNumber or the newHeads subscription
//! \throws JsonRpcError if a required field is missing or malformed
HeaderPtr decode_header(const nlohmann::json& json);

}  // namespace blocksub::rpc
