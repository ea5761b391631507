// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc.hpp"

#include <memory>
#include <optional>
#include <utility>

#include <absl/strings/str_cat.h>

#include <blocksub/common/util.hpp>

namespace blocksub::rpc {

JsonRpcError::JsonRpcError(int code, const std::string& message)
    : std::runtime_error(absl::StrCat("JSON-RPC error ", code, ": ", message)), code_(code) {}

nlohmann::json make_request(uint64_t id, std::string_view method, nlohmann::json params) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", std::move(params)},
    };
}

nlohmann::json decode_response(std::string_view content, uint64_t id) {
    auto response = nlohmann::json::parse(content, nullptr, /* allow_exceptions = */ false);
    if (response.is_discarded()) {
        throw JsonRpcError{kParseError, absl::StrCat("invalid JSON response: ", abridge(content, 64))};
    }
    if (!response.is_object()) {
        throw JsonRpcError{kInvalidRequest, "response is not an object"};
    }
    if (const auto error = response.find("error"); error != response.end() && !error->is_null()) {
        const int code = error->value("code", 0);
        throw JsonRpcError{code, error->value("message", std::string{"unknown error"})};
    }
    const auto response_id = response.find("id");
    if (response_id == response.end() || !response_id->is_number_unsigned() || response_id->get<uint64_t>() != id) {
        throw JsonRpcError{kInvalidRequest, absl::StrCat("response id mismatch, expected ", id)};
    }
    const auto result = response.find("result");
    if (result == response.end()) {
        throw JsonRpcError{kInvalidRequest, "response has neither result nor error"};
    }
    return std::move(*result);
}

static uint64_t quantity_field(const nlohmann::json& json, const char* name) {
    const auto field = json.find(name);
    if (field == json.end() || !field->is_string()) {
        throw JsonRpcError{kInvalidRequest, absl::StrCat("header field '", name, "' missing")};
    }
    const auto value = from_quantity(field->get<std::string>());
    if (!value) {
        throw JsonRpcError{kInvalidRequest, absl::StrCat("header field '", name, "' is not a quantity")};
    }
    return *value;
}

static evmc::bytes32 hash_field(const nlohmann::json& json, const char* name) {
    const auto field = json.find(name);
    if (field == json.end() || !field->is_string()) {
        throw JsonRpcError{kInvalidRequest, absl::StrCat("header field '", name, "' missing")};
    }
    const auto& hex = field->get_ref<const std::string&>();
    const auto hash = has_hex_prefix(hex) && hex.size() == 66 ? bytes32_from_hex(hex) : std::nullopt;
    if (!hash) {
        throw JsonRpcError{kInvalidRequest, absl::StrCat("header field '", name, "' is not a 32-byte hash")};
    }
    return *hash;
}

HeaderPtr decode_header(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw JsonRpcError{kInvalidRequest, "header is not an object"};
    }
    Header header{
        .number = quantity_field(json, "number"),
        .hash = hash_field(json, "hash"),
        .parent_hash = hash_field(json, "parentHash"),
        .timestamp = quantity_field(json, "timestamp"),
        .payload = json.dump(),
    };
    return std::make_shared<const Header>(std::move(header));
}

}  // namespace blocksub::rpc
