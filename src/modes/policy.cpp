#include "modes/policy.hpp"

#include <string_view>
#include <unordered_map>
#include <utility>

namespace mode_server::modes {
namespace {

const std::unordered_map<std::string, ToolCategory>& tool_table() {
  static const std::unordered_map<std::string, ToolCategory> kTools = {
      {"read_file", {true, false, ToolGroup::read}},
      {"list_files", {true, false, ToolGroup::read}},
      {"list_code_definition_names", {true, false, ToolGroup::read}},
      {"search_files", {true, false, ToolGroup::read}},
      {"write_to_file", {true, false, ToolGroup::edit}},
      {"apply_diff", {true, false, ToolGroup::edit}},
      {"insert_content", {true, false, ToolGroup::edit}},
      {"browser_action", {true, false, ToolGroup::browser}},
      {"execute_command", {true, false, ToolGroup::command}},
      {"use_mcp_tool", {true, false, ToolGroup::integration}},
      {"access_mcp_resource", {true, false, ToolGroup::integration}},
      {"switch_mode", {true, false, ToolGroup::delegation}},
      {"new_task", {true, false, ToolGroup::delegation}},
      {"ask_followup_question", {true, true, ToolGroup::read}},
      {"attempt_completion", {true, true, ToolGroup::read}},
      {"update_todo_list", {true, true, ToolGroup::read}},
  };
  return kTools;
}

constexpr std::string_view kFallbackPrompt = "You are a helpful AI assistant.";

}  // namespace

ToolCategory categorize_tool(const std::string& tool_name) {
  const auto& table = tool_table();
  const auto it = table.find(tool_name);
  if (it == table.end()) {
    return ToolCategory{};
  }
  return it->second;
}

bool is_file_mutating_tool(const std::string& tool_name) {
  return tool_name == "write_to_file" || tool_name == "apply_diff" || tool_name == "insert_content";
}

PolicyEngine::PolicyEngine(const ModeRegistry& registry) : registry_(registry) {}

bool PolicyEngine::can_use_tool(const Task& task, const std::string& tool_name) const {
  const auto mode = registry_.find(task.mode_slug());
  if (mode == nullptr) {
    return true;
  }

  const ToolCategory category = categorize_tool(tool_name);
  if (!category.known) {
    return false;
  }
  if (category.always_allowed) {
    return true;
  }
  return mode->is_group_enabled(category.group);
}

bool PolicyEngine::can_edit_file(const Task& task, const std::string& path) const {
  const auto mode = registry_.find(task.mode_slug());
  if (mode == nullptr) {
    return true;
  }
  return mode->can_edit_file(path);
}

ToolDecision PolicyEngine::validate_tool_use(const Task& task, const std::string& tool_name,
                                             const nlohmann::json& args) const {
  if (!can_use_tool(task, tool_name)) {
    return ToolDecision{.allowed = false,
                        .reason = "Tool '" + tool_name + "' is not available in mode '" + mode_display_name(task) + "'",
                        .code = core::ErrorCode::tool_restriction_error};
  }

  if (!is_file_mutating_tool(tool_name) || !args.is_object()) {
    return ToolDecision{};
  }

  const auto path_it = args.find("path");
  if (path_it == args.end() || !path_it->is_string()) {
    return ToolDecision{};
  }

  const auto& path = path_it->get_ref<const std::string&>();
  if (can_edit_file(task, path)) {
    return ToolDecision{};
  }

  std::string restriction = "unknown";
  if (const auto mode = registry_.find(task.mode_slug()); mode != nullptr) {
    const GroupEntry* edit = mode->group_entry(ToolGroup::edit);
    if (edit != nullptr && edit->file_pattern.has_value()) {
      restriction = edit->file_pattern->expression();
    }
  }

  return ToolDecision{.allowed = false,
                      .reason = "Cannot edit file '" + path + "' in mode '" + mode_display_name(task) +
                                "'. File must match pattern: " + restriction,
                      .code = core::ErrorCode::file_restriction_error};
}

std::string PolicyEngine::system_prompt(const Task& task) const {
  return system_prompt_for(task.mode_slug());
}

std::string PolicyEngine::system_prompt_for(const std::string& mode_slug) const {
  const auto mode = registry_.find(mode_slug);
  if (mode == nullptr) {
    return std::string(kFallbackPrompt);
  }

  std::string prompt = mode->role_definition();

  if (!mode->custom_instructions().empty()) {
    prompt += "\n\n## Mode Instructions\n\n" + mode->custom_instructions();
  }

  if (!mode->when_to_use().empty()) {
    prompt += "\n\n## When to Use This Mode\n\n" + mode->when_to_use();
  }

  if (!mode->groups().empty()) {
    std::string groups;
    for (const auto& entry : mode->groups()) {
      if (!groups.empty()) {
        groups += ", ";
      }
      groups += to_string(entry.group);
      if (entry.file_pattern.has_value()) {
        groups += " (restricted to: " + entry.file_pattern->expression() + ")";
      }
    }
    prompt += "\n\n## Available Tool Groups\n\n" + groups;
  }

  return prompt;
}

core::Expected<Task> PolicyEngine::create_task(const std::string& mode_slug, const std::string& initial_message,
                                               Task* parent) const {
  if (!registry_.contains(mode_slug)) {
    return core::validation_error("Invalid mode '" + mode_slug + "'. Available: " + registry_.slug_list());
  }

  if (parent != nullptr) {
    const ToolDecision decision = validate_tool_use(*parent, "new_task");
    if (!decision.allowed) {
      return core::protocol_error(*decision.code, decision.reason);
    }
  }

  Task task(mode_slug, parent != nullptr ? std::optional<std::string>(parent->id()) : std::nullopt);
  if (!initial_message.empty()) {
    task.add_message("user", initial_message);
  }

  if (parent != nullptr) {
    parent->add_child(task.id());
  }

  return task;
}

std::optional<core::RpcError> PolicyEngine::switch_mode(Task& task, const std::string& new_mode_slug) const {
  if (!registry_.contains(new_mode_slug)) {
    return core::validation_error("Invalid mode: " + new_mode_slug + ". Available: " + registry_.slug_list());
  }

  if (is_terminal(task.state())) {
    return core::validation_error(std::string("Cannot switch mode of a ") + to_string(task.state()) + " task");
  }

  const ToolDecision decision = validate_tool_use(task, "switch_mode");
  if (!decision.allowed) {
    return core::protocol_error(*decision.code, decision.reason);
  }

  task.switch_mode(new_mode_slug);
  return std::nullopt;
}

std::string PolicyEngine::mode_display_name(const Task& task) const {
  const auto mode = registry_.find(task.mode_slug());
  return mode != nullptr ? mode->name() : task.mode_slug();
}

}  // namespace mode_server::modes
