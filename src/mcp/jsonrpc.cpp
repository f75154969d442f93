#include "mcp/jsonrpc.hpp"

#include <cctype>

namespace mode_server::mcp {

namespace {

bool is_valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

std::string_view trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace

core::Expected<nlohmann::json> parse_message(const std::string_view payload) {
  const auto text = trim(payload);
  if (text.empty()) {
    return core::protocol_error(core::ErrorCode::parse_error, "Empty message");
  }

  nlohmann::json message;
  try {
    message = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& ex) {
    return core::protocol_error(core::ErrorCode::parse_error, "Invalid JSON", ex.what());
  }

  if (!message.is_object()) {
    return core::protocol_error(core::ErrorCode::invalid_request, "Message must be a JSON object");
  }

  return message;
}

std::string serialize_message(const nlohmann::json& message) {
  std::string out = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  out.push_back('\n');
  return out;
}

std::optional<core::RpcError> validate_request(const nlohmann::json& message) {
  const auto jsonrpc_it = message.find("jsonrpc");
  if (jsonrpc_it == message.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    return core::protocol_error(core::ErrorCode::invalid_request, "Invalid JSON-RPC version, must be '2.0'");
  }

  const auto method_it = message.find("method");
  if (method_it == message.end()) {
    return core::protocol_error(core::ErrorCode::invalid_request, "Missing 'method' field");
  }

  if (!method_it->is_string()) {
    return core::protocol_error(core::ErrorCode::invalid_request, "Method must be a string");
  }

  if (const auto id_it = message.find("id"); id_it != message.end() && !is_valid_id(*id_it)) {
    return core::protocol_error(core::ErrorCode::invalid_request, "Request id must be a string, integer or null");
  }

  return std::nullopt;
}

bool is_notification(const nlohmann::json& message) {
  return !message.contains("id");
}

nlohmann::json request_id_of(const nlohmann::json& message) {
  const auto id_it = message.find("id");
  if (id_it == message.end() || !is_valid_id(*id_it)) {
    return nullptr;
  }
  return *id_it;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const core::RpcError& error) {
  nlohmann::json body{{"code", core::to_int(error.code)}, {"message", error.message}};
  if (!error.data.is_null()) {
    body["data"] = error.data;
  }
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", std::move(body)}};
}

}  // namespace mode_server::mcp
