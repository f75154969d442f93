#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"

namespace mode_server::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

// Trims, decodes and requires a JSON object. Errors carry PARSE_ERROR or INVALID_REQUEST.
core::Expected<nlohmann::json> parse_message(std::string_view payload);

// Compact JSON followed by exactly one newline.
std::string serialize_message(const nlohmann::json& message);

// Checks the version literal, the method field and the id type.
std::optional<core::RpcError> validate_request(const nlohmann::json& message);

bool is_notification(const nlohmann::json& message);

// The request id when it has a legal type, otherwise null.
nlohmann::json request_id_of(const nlohmann::json& message);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const core::RpcError& error);

}  // namespace mode_server::mcp
