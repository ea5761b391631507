// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint.hpp"

#include <charconv>
#include <stdexcept>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace blocksub::rpc {

static constexpr uint16_t kDefaultPort{80};

static std::invalid_argument invalid_url(std::string_view url, std::string_view reason) {
    return std::invalid_argument{absl::StrCat("invalid endpoint URL '", url, "': ", reason)};
}

Endpoint Endpoint::parse(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        throw invalid_url(url, "missing scheme");
    }
    Endpoint endpoint;
    endpoint.scheme = absl::AsciiStrToLower(url.substr(0, scheme_end));
    if (endpoint.scheme == "https" || endpoint.scheme == "wss") {
        throw invalid_url(url, "TLS is not supported");
    }
    if (endpoint.scheme != "http" && endpoint.scheme != "ws") {
        throw invalid_url(url, "unsupported scheme");
    }

    auto rest = url.substr(scheme_end + 3);
    const auto target_start = rest.find('/');
    if (target_start != std::string_view::npos) {
        endpoint.target = std::string{rest.substr(target_start)};
        rest = rest.substr(0, target_start);
    }

    std::string_view host = rest;
    endpoint.port = kDefaultPort;
    // IPv6 literals come bracketed: [::1]:8545
    const auto closing_bracket = rest.rfind(']');
    const auto port_separator = rest.rfind(':');
    if (port_separator != std::string_view::npos && (closing_bracket == std::string_view::npos || port_separator > closing_bracket)) {
        host = rest.substr(0, port_separator);
        const auto port = rest.substr(port_separator + 1);
        const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), endpoint.port);
        if (port.empty() || ec != std::errc{} || ptr != port.data() + port.size() || endpoint.port == 0) {
            throw invalid_url(url, "invalid port");
        }
    }
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) {
        throw invalid_url(url, "missing host");
    }
    endpoint.host = std::string{host};
    return endpoint;
}

std::string Endpoint::authority() const {
    if (host.find(':') != std::string::npos) {
        return absl::StrCat("[", host, "]:", port);
    }
    return absl::StrCat(host, ":", port);
}

std::string Endpoint::to_string() const {
    return absl::StrCat(scheme, "://", authority(), target);
}

std::ostream& operator<<(std::ostream& out, const Endpoint& endpoint) {
    return out << endpoint.to_string();
}

}  // namespace blocksub::rpc
