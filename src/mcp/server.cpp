#include "mcp/server.hpp"

#include <exception>
#include <iostream>
#include <unordered_map>
#include <utility>
#include <variant>

#include "mcp/jsonrpc.hpp"

namespace mode_server::mcp {

std::optional<RequestMethod> parse_request_method(const std::string& name) {
  static const std::unordered_map<std::string, RequestMethod> kMethods = {
      {"initialize", RequestMethod::initialize},
      {"resources/list", RequestMethod::resources_list},
      {"resources/read", RequestMethod::resources_read},
      {"tools/list", RequestMethod::tools_list},
      {"tools/call", RequestMethod::tools_call},
  };
  const auto it = kMethods.find(name);
  if (it == kMethods.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<NotificationMethod> parse_notification_method(const std::string& name) {
  static const std::unordered_map<std::string, NotificationMethod> kMethods = {
      {"notifications/initialized", NotificationMethod::initialized},
      {"cancelled", NotificationMethod::cancelled},
  };
  const auto it = kMethods.find(name);
  if (it == kMethods.end()) {
    return std::nullopt;
  }
  return it->second;
}

Server::Server(core::ServerConfig config, ModeSupplier supplier)
    : config_(std::move(config)),
      supplier_(std::move(supplier)),
      registry_(supplier_()),
      policy_(registry_),
      sessions_(config_.session_timeout, config_.cleanup_interval),
      resources_(registry_, policy_),
      tools_(sessions_, registry_, policy_) {
  std::cerr << "[server] " << config_.server_name << " " << config_.server_version << " loaded "
            << registry_.size() << " modes: " << registry_.slug_list() << '\n';
}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err, std::atomic<bool>* reload_requested) {
  sessions_.start();
  err << "[server] waiting for messages on stdin\n";

  std::string line;
  while (std::getline(in, line)) {
    if (reload_requested != nullptr && reload_requested->exchange(false)) {
      reload_modes();
    }
    if (line.empty()) {
      continue;
    }

    const auto reply = handle_line(line);
    if (reply.has_value()) {
      out << serialize_message(*reply);
      out.flush();
    }
  }

  err << "[server] end of input, shutting down\n";
  sessions_.stop();
  sessions_.cleanup_all();
  err << "[server] shutdown complete: " << server_info().dump() << '\n';
  return 0;
}

std::optional<nlohmann::json> Server::handle_line(const std::string& line) {
  if (line.empty()) {
    return std::nullopt;
  }

  auto parsed = parse_message(line);
  if (const auto* error = std::get_if<core::RpcError>(&parsed)) {
    std::cerr << "[server] protocol error: " << error->message << '\n';
    return make_error_response(nullptr, *error);
  }
  const auto message = std::get<nlohmann::json>(std::move(parsed));

  if (auto error = validate_request(message)) {
    std::cerr << "[server] protocol error: " << error->message << '\n';
    return make_error_response(request_id_of(message), *error);
  }

  if (is_notification(message)) {
    handle_notification(message);
    return std::nullopt;
  }
  return handle_request(message);
}

nlohmann::json Server::handle_request(const nlohmann::json& message) {
  const nlohmann::json id = request_id_of(message);
  const auto& method = message.at("method").get_ref<const std::string&>();
  if (config_.debug_logging) {
    std::cerr << "[server] request " << method << " (id=" << id.dump() << ")\n";
  }

  const auto kind = parse_request_method(method);
  if (!kind.has_value()) {
    std::cerr << "[server] unknown method: " << method << '\n';
    return make_error_response(id,
                               core::protocol_error(core::ErrorCode::method_not_found, "Method not found: " + method));
  }

  const auto params_it = message.find("params");
  const nlohmann::json params = params_it != message.end() ? *params_it : nlohmann::json::object();

  core::Expected<nlohmann::json> outcome = core::internal_error("no result");
  try {
    if (!params.is_object()) {
      outcome = core::validation_error("params must be an object");
    } else {
      outcome = dispatch(*kind, params);
    }
  } catch (const std::exception& ex) {
    outcome = core::internal_error(ex.what());
  }

  if (const auto* error = std::get_if<core::RpcError>(&outcome)) {
    return translate_error(id, method, *error);
  }
  return make_result_response(id, std::get<nlohmann::json>(outcome));
}

nlohmann::json Server::translate_error(const nlohmann::json& id, const std::string& method,
                                       const core::RpcError& error) const {
  switch (error.kind) {
    case core::ErrorKind::validation:
      std::cerr << "[server] validation error in " << method << ": " << error.data.dump() << '\n';
      return make_error_response(id, core::validation_error(error.data.is_string() ? error.data.get<std::string>()
                                                                                   : error.data.dump()));
    case core::ErrorKind::protocol:
      std::cerr << "[server] protocol error in " << method << ": " << error.message << '\n';
      return make_error_response(id, error);
    case core::ErrorKind::internal:
      break;
  }

  std::cerr << "[server] internal error in " << method << ": " << error.data.dump() << '\n';
  return make_error_response(id, core::internal_error(error.data.is_string() ? error.data.get<std::string>()
                                                                             : error.data.dump()));
}

core::Expected<nlohmann::json> Server::dispatch(const RequestMethod method, const nlohmann::json& params) {
  switch (method) {
    case RequestMethod::initialize:
      return handle_initialize(params);
    case RequestMethod::resources_list:
      return nlohmann::json{{"resources", resources_.list_resources()}};
    case RequestMethod::resources_read:
      return handle_resources_read(params);
    case RequestMethod::tools_list:
      return nlohmann::json{{"tools", tools_.list_tools()}};
    case RequestMethod::tools_call:
      return handle_tools_call(params);
  }
  return core::internal_error("unhandled request method");
}

void Server::handle_notification(const nlohmann::json& message) {
  const auto& method = message.at("method").get_ref<const std::string&>();
  const auto kind = parse_notification_method(method);
  if (!kind.has_value()) {
    if (config_.debug_logging) {
      std::cerr << "[server] unknown notification: " << method << '\n';
    }
    return;
  }

  const auto params_it = message.find("params");
  const nlohmann::json params =
      params_it != message.end() && params_it->is_object() ? *params_it : nlohmann::json::object();

  try {
    switch (*kind) {
      case NotificationMethod::initialized:
        std::cerr << "[server] client initialization complete\n";
        break;
      case NotificationMethod::cancelled:
        handle_cancelled(params);
        break;
    }
  } catch (const std::exception& ex) {
    std::cerr << "[server] notification " << method << " failed: " << ex.what() << '\n';
  }
}

core::Expected<nlohmann::json> Server::handle_initialize(const nlohmann::json& params) {
  std::string client_name = "unknown";
  if (const auto client_it = params.find("clientInfo"); client_it != params.end() && client_it->is_object()) {
    if (const auto name_it = client_it->find("name"); name_it != client_it->end() && name_it->is_string()) {
      client_name = name_it->get<std::string>();
    }
  }
  std::string client_protocol = "unknown";
  if (const auto version_it = params.find("protocolVersion");
      version_it != params.end() && version_it->is_string()) {
    client_protocol = version_it->get<std::string>();
  }
  std::cerr << "[server] initialize request from " << client_name << " (protocol: " << client_protocol << ")\n";

  initialized_ = true;
  return nlohmann::json{
      {"protocolVersion", kProtocolVersion},
      {"serverInfo", {{"name", config_.server_name}, {"version", config_.server_version}}},
      {"capabilities",
       {{"resources", {{"listChanged", false}}}, {"tools", {{"listChanged", false}}}}},
  };
}

core::Expected<nlohmann::json> Server::handle_resources_read(const nlohmann::json& params) const {
  const auto uri_it = params.find("uri");
  if (uri_it == params.end() || !uri_it->is_string() || uri_it->get_ref<const std::string&>().empty()) {
    return core::validation_error("Missing required parameter: uri");
  }
  return resources_.read_resource(uri_it->get<std::string>());
}

core::Expected<nlohmann::json> Server::handle_tools_call(const nlohmann::json& params) {
  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string() || name_it->get_ref<const std::string&>().empty()) {
    return core::validation_error("Missing required parameter: name");
  }

  nlohmann::json arguments = nlohmann::json::object();
  if (const auto args_it = params.find("arguments"); args_it != params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      return core::validation_error("arguments must be an object");
    }
    arguments = *args_it;
  }

  const auto& name = name_it->get_ref<const std::string&>();
  auto result = tools_.call_tool(name, arguments);
  if (config_.debug_logging && !core::is_error(result)) {
    std::cerr << "[server] tool '" << name << "' executed\n";
  }
  return result;
}

void Server::handle_cancelled(const nlohmann::json& params) const {
  const auto request_it = params.find("requestId");
  const std::string request_id = request_it != params.end() ? request_it->dump() : "null";
  std::string reason = "No reason provided";
  if (const auto reason_it = params.find("reason"); reason_it != params.end() && reason_it->is_string()) {
    reason = reason_it->get<std::string>();
  }
  std::cerr << "[server] request " << request_id << " cancelled: " << reason << '\n';
}

bool Server::reload_modes() {
  try {
    registry_.reload(supplier_());
  } catch (const std::exception& ex) {
    std::cerr << "[server] mode reload failed, keeping " << registry_.size() << " modes: " << ex.what() << '\n';
    return false;
  }
  std::cerr << "[server] reloaded " << registry_.size() << " modes: " << registry_.slug_list() << '\n';
  return true;
}

nlohmann::json Server::server_info() const {
  return nlohmann::json{
      {"name", config_.server_name},
      {"version", config_.server_version},
      {"initialized", initialized_},
      {"project_root", config_.project_root.empty() ? nlohmann::json(nullptr) : nlohmann::json(config_.project_root)},
      {"modes_available", registry_.size()},
      {"active_sessions", sessions_.session_count()},
      {"session_stats", sessions_.stats().to_json()},
  };
}

}  // namespace mode_server::mcp
