#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"

namespace mode_server::mcp {

// Every check returns a validation-kind error, or nullopt when the input is acceptable.

std::optional<core::RpcError> validate_mode_slug(const std::string& slug);
std::optional<core::RpcError> validate_session_id(const std::string& session_id);

// Requires "<scheme>://..." when a scheme is given.
std::optional<core::RpcError> validate_uri(const std::string& uri, const std::string& expected_scheme = {});

// Required keys, declared property types, enums, array item types and one level of
// nested object properties. Keys absent from the schema are accepted.
std::optional<core::RpcError> validate_tool_args(const std::string& tool_name, const nlohmann::json& args,
                                                 const nlohmann::json& schema);

}  // namespace mode_server::mcp
