#include "mcp/validation.hpp"

#include <string_view>

#include "modes/mode.hpp"
#include "session/session_manager.hpp"

namespace mode_server::mcp {
namespace {

bool matches_type(const nlohmann::json& value, std::string_view type) {
  if (type == "string") {
    return value.is_string();
  }
  if (type == "number") {
    return value.is_number();
  }
  if (type == "integer") {
    return value.is_number_integer();
  }
  if (type == "boolean") {
    return value.is_boolean();
  }
  if (type == "object") {
    return value.is_object();
  }
  if (type == "array") {
    return value.is_array();
  }
  if (type == "null") {
    return value.is_null();
  }
  return false;
}

std::optional<core::RpcError> check_type(const nlohmann::json& value, const nlohmann::json& property_schema,
                                         const std::string& param_name) {
  const auto type_it = property_schema.find("type");
  if (type_it == property_schema.end() || !type_it->is_string()) {
    return std::nullopt;
  }

  const auto& type = type_it->get_ref<const std::string&>();
  if (matches_type(value, type)) {
    return std::nullopt;
  }
  return core::validation_error("Parameter '" + param_name + "' must be of type " + type + ", got " +
                                value.type_name());
}

std::optional<core::RpcError> check_required(const nlohmann::json& args, const nlohmann::json& schema,
                                             const std::string& context) {
  const auto required_it = schema.find("required");
  if (required_it == schema.end() || !required_it->is_array()) {
    return std::nullopt;
  }

  for (const auto& name : *required_it) {
    if (name.is_string() && !args.contains(name.get<std::string>())) {
      return core::validation_error("Missing required " + context + ": " + name.get<std::string>());
    }
  }
  return std::nullopt;
}

std::string render_enum_value(const nlohmann::json& value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

}  // namespace

std::optional<core::RpcError> validate_mode_slug(const std::string& slug) {
  if (slug.empty()) {
    return core::validation_error("Mode slug must be a non-empty string");
  }
  if (slug.size() > 50) {
    return core::validation_error("Mode slug is too long (max 50 characters)");
  }
  if (!modes::is_valid_slug(slug)) {
    return core::validation_error("Mode slug must contain only alphanumeric characters, hyphens, and underscores");
  }
  return std::nullopt;
}

std::optional<core::RpcError> validate_session_id(const std::string& session_id) {
  if (session_id.empty()) {
    return core::validation_error("Session ID must be a non-empty string");
  }
  if (session_id.rfind(session::kSessionIdPrefix, 0) != 0) {
    return core::validation_error(std::string("Session ID must start with '") + session::kSessionIdPrefix + "'");
  }
  if (session_id.size() < 5) {
    return core::validation_error("Session ID is too short");
  }
  return std::nullopt;
}

std::optional<core::RpcError> validate_uri(const std::string& uri, const std::string& expected_scheme) {
  if (uri.empty()) {
    return core::validation_error("URI must be a non-empty string");
  }

  const auto separator = uri.find("://");
  if (separator == std::string::npos) {
    return core::validation_error("URI must contain '://' separator");
  }

  const std::string scheme = uri.substr(0, separator);
  if (!expected_scheme.empty() && scheme != expected_scheme) {
    return core::validation_error("URI scheme must be '" + expected_scheme + "', got '" + scheme + "'");
  }
  return std::nullopt;
}

std::optional<core::RpcError> validate_tool_args(const std::string& tool_name, const nlohmann::json& args,
                                                 const nlohmann::json& schema) {
  if (!args.is_object()) {
    return core::validation_error("Arguments for " + tool_name + " must be an object");
  }

  if (auto error = check_required(args, schema, "parameter for " + tool_name)) {
    return error;
  }

  const auto properties_it = schema.find("properties");
  if (properties_it == schema.end() || !properties_it->is_object()) {
    return std::nullopt;
  }

  for (const auto& [param_name, value] : args.items()) {
    const auto property_it = properties_it->find(param_name);
    if (property_it == properties_it->end()) {
      continue;
    }
    const auto& property = *property_it;

    if (auto error = check_type(value, property, param_name)) {
      return error;
    }

    if (const auto enum_it = property.find("enum"); enum_it != property.end() && enum_it->is_array()) {
      bool found = false;
      std::string allowed;
      for (const auto& candidate : *enum_it) {
        found = found || candidate == value;
        if (!allowed.empty()) {
          allowed += ", ";
        }
        allowed += render_enum_value(candidate);
      }
      if (!found) {
        return core::validation_error("Parameter '" + param_name + "' must be one of: " + allowed + ", got '" +
                                      render_enum_value(value) + "'");
      }
    }

    if (value.is_array()) {
      if (const auto items_it = property.find("items"); items_it != property.end() && items_it->is_object()) {
        std::size_t index = 0;
        for (const auto& item : value) {
          if (auto error = check_type(item, *items_it, param_name + "[" + std::to_string(index) + "]")) {
            error->data = "Invalid array item in '" + param_name + "': " + error->data.get<std::string>();
            return error;
          }
          ++index;
        }
      }
    }

    if (value.is_object()) {
      if (auto error = check_required(value, property, "property in '" + param_name + "'")) {
        return error;
      }
      const auto nested_it = property.find("properties");
      if (nested_it != property.end() && nested_it->is_object()) {
        for (const auto& [nested_name, nested_value] : value.items()) {
          const auto nested_schema = nested_it->find(nested_name);
          if (nested_schema == nested_it->end()) {
            continue;
          }
          if (auto error = check_type(nested_value, *nested_schema, param_name + "." + nested_name)) {
            return error;
          }
        }
      }
    }
  }

  return std::nullopt;
}

}  // namespace mode_server::mcp
