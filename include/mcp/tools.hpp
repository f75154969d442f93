#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "modes/policy.hpp"
#include "modes/registry.hpp"
#include "session/session_manager.hpp"

namespace mode_server::mcp {

enum class ToolKind : std::uint8_t {
  list_modes,
  get_mode_info,
  create_task,
  switch_mode,
  get_task_info,
  validate_tool_use,
  complete_task,
};

struct ToolDefinition {
  ToolKind kind;
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

std::optional<ToolKind> parse_tool_kind(const std::string& name);

// Fixed, ordered tool catalogue.
const std::vector<ToolDefinition>& tool_definitions();

class ToolHandler {
 public:
  ToolHandler(session::SessionManager& sessions, const modes::ModeRegistry& registry,
              const modes::PolicyEngine& policy);

  [[nodiscard]] nlohmann::json list_tools() const;

  // Arguments are checked against the tool's input schema before dispatch.
  core::Expected<nlohmann::json> call_tool(const std::string& name, const nlohmann::json& arguments);

 private:
  core::Expected<nlohmann::json> list_modes(const nlohmann::json& args) const;
  core::Expected<nlohmann::json> get_mode_info(const nlohmann::json& args) const;
  core::Expected<nlohmann::json> create_task(const nlohmann::json& args);
  core::Expected<nlohmann::json> switch_mode(const nlohmann::json& args);
  core::Expected<nlohmann::json> get_task_info(const nlohmann::json& args);
  core::Expected<nlohmann::json> validate_tool_use(const nlohmann::json& args);
  core::Expected<nlohmann::json> complete_task(const nlohmann::json& args);

  core::Expected<std::shared_ptr<session::Session>> require_session(const std::string& session_id,
                                                                    const char* label = "Session");

  session::SessionManager& sessions_;
  const modes::ModeRegistry& registry_;
  const modes::PolicyEngine& policy_;
};

}  // namespace mode_server::mcp
