#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "mcp/resources.hpp"
#include "mcp/tools.hpp"
#include "modes/mode.hpp"
#include "modes/policy.hpp"
#include "modes/registry.hpp"
#include "session/session_manager.hpp"

namespace mode_server::mcp {

inline constexpr const char* kProtocolVersion = "2024-11-05";

enum class RequestMethod : std::uint8_t {
  initialize,
  resources_list,
  resources_read,
  tools_list,
  tools_call,
};

enum class NotificationMethod : std::uint8_t {
  initialized,
  cancelled,
};

std::optional<RequestMethod> parse_request_method(const std::string& name);
std::optional<NotificationMethod> parse_notification_method(const std::string& name);

class Server {
 public:
  // Called at construction and on every reload.
  using ModeSupplier = std::function<std::vector<modes::Mode>()>;

  Server(core::ServerConfig config, ModeSupplier supplier);

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // One decoded frame in, at most one reply frame out. Notifications never reply.
  std::optional<nlohmann::json> handle_line(const std::string& line);

  // Serves until end of input. reload_requested is polled before every frame.
  int run(std::istream& in, std::ostream& out, std::ostream& err, std::atomic<bool>* reload_requested = nullptr);

  // Keeps the current table when the supplier throws.
  bool reload_modes();

  [[nodiscard]] nlohmann::json server_info() const;

  session::SessionManager& sessions() noexcept { return sessions_; }
  [[nodiscard]] const modes::ModeRegistry& registry() const noexcept { return registry_; }
  [[nodiscard]] bool initialized() const noexcept { return initialized_; }

 private:
  nlohmann::json handle_request(const nlohmann::json& message);
  void handle_notification(const nlohmann::json& message);
  core::Expected<nlohmann::json> dispatch(RequestMethod method, const nlohmann::json& params);

  core::Expected<nlohmann::json> handle_initialize(const nlohmann::json& params);
  core::Expected<nlohmann::json> handle_resources_read(const nlohmann::json& params) const;
  core::Expected<nlohmann::json> handle_tools_call(const nlohmann::json& params);
  void handle_cancelled(const nlohmann::json& params) const;

  nlohmann::json translate_error(const nlohmann::json& id, const std::string& method, const core::RpcError& error) const;

  core::ServerConfig config_;
  ModeSupplier supplier_;
  modes::ModeRegistry registry_;
  modes::PolicyEngine policy_;
  session::SessionManager sessions_;
  ResourceHandler resources_;
  ToolHandler tools_;
  bool initialized_{false};
};

}  // namespace mode_server::mcp
