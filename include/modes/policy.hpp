#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "modes/mode.hpp"
#include "modes/registry.hpp"
#include "modes/task.hpp"

namespace mode_server::modes {

struct ToolDecision {
  bool allowed{true};
  std::string reason{};
  std::optional<core::ErrorCode> code{};
};

// known is false for names outside the static tool table.
struct ToolCategory {
  bool known{false};
  bool always_allowed{false};
  ToolGroup group{ToolGroup::read};
};

ToolCategory categorize_tool(const std::string& tool_name);
bool is_file_mutating_tool(const std::string& tool_name);

class PolicyEngine {
 public:
  explicit PolicyEngine(const ModeRegistry& registry);

  [[nodiscard]] bool can_use_tool(const Task& task, const std::string& tool_name) const;
  [[nodiscard]] bool can_edit_file(const Task& task, const std::string& path) const;

  // The only gate callers go through before a tool may run.
  [[nodiscard]] ToolDecision validate_tool_use(const Task& task, const std::string& tool_name,
                                               const nlohmann::json& args = nlohmann::json::object()) const;

  [[nodiscard]] std::string system_prompt(const Task& task) const;
  [[nodiscard]] std::string system_prompt_for(const std::string& mode_slug) const;

  // Unknown slug fails without creating anything. A parent must be allowed to delegate.
  core::Expected<Task> create_task(const std::string& mode_slug, const std::string& initial_message = {},
                                   Task* parent = nullptr) const;

  std::optional<core::RpcError> switch_mode(Task& task, const std::string& new_mode_slug) const;

 private:
  [[nodiscard]] std::string mode_display_name(const Task& task) const;

  const ModeRegistry& registry_;
};

}  // namespace mode_server::modes
