#include "mcp/tools.hpp"

#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <utility>
#include <variant>

#include "core/timestamp.hpp"
#include "mcp/validation.hpp"
#include "modes/task.hpp"

namespace mode_server::mcp {
namespace {

constexpr std::size_t kMessagePreviewLength = 100;
constexpr const char* kEnabledMark = "✓";
constexpr const char* kDisabledMark = "✗";

nlohmann::json string_property(const char* description) {
  return nlohmann::json{{"type", "string"}, {"description", description}};
}

nlohmann::json boolean_property(const char* description) {
  return nlohmann::json{{"type", "boolean"}, {"description", description}};
}

nlohmann::json text_result(const std::string& text, nlohmann::json metadata) {
  return nlohmann::json{{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
                        {"metadata", std::move(metadata)}};
}

// First kMessagePreviewLength code points; never splits a UTF-8 sequence.
std::string preview_text(const std::string& content) {
  std::size_t code_points = 0;
  for (std::size_t i = 0; i < content.size(); ++i) {
    if ((static_cast<unsigned char>(content[i]) & 0xC0U) == 0x80U) {
      continue;
    }
    if (code_points == kMessagePreviewLength) {
      return content.substr(0, i) + "...";
    }
    ++code_points;
  }
  return content;
}

std::string group_summary(const modes::GroupEntry& entry) {
  std::string out = modes::to_string(entry.group);
  if (entry.file_pattern.has_value()) {
    out += " (" + entry.file_pattern->expression() + ")";
  }
  return out;
}

}  // namespace

std::optional<ToolKind> parse_tool_kind(const std::string& name) {
  static const std::unordered_map<std::string, ToolKind> kKinds = {
      {"list_modes", ToolKind::list_modes},
      {"get_mode_info", ToolKind::get_mode_info},
      {"create_task", ToolKind::create_task},
      {"switch_mode", ToolKind::switch_mode},
      {"get_task_info", ToolKind::get_task_info},
      {"validate_tool_use", ToolKind::validate_tool_use},
      {"complete_task", ToolKind::complete_task},
  };
  const auto it = kKinds.find(name);
  if (it == kKinds.end()) {
    return std::nullopt;
  }
  return it->second;
}

const std::vector<ToolDefinition>& tool_definitions() {
  static const std::vector<ToolDefinition> kDefinitions = {
      {ToolKind::list_modes, "list_modes", "List all available modes with their metadata",
       {{"type", "object"},
        {"properties",
         {{"source",
           {{"type", "string"},
            {"enum", {"builtin", "global", "project", "all"}},
            {"description", "Filter modes by source (default: all)"}}}}}}},
      {ToolKind::get_mode_info, "get_mode_info", "Get detailed information about a specific mode",
       {{"type", "object"},
        {"properties",
         {{"mode_slug", string_property("Slug of the mode to get info for")},
          {"include_system_prompt", boolean_property("Include the full system prompt (default: false)")}}},
        {"required", {"mode_slug"}}}},
      {ToolKind::create_task, "create_task", "Create a new task in a specific mode",
       {{"type", "object"},
        {"properties",
         {{"mode_slug", string_property("Mode to use for this task")},
          {"initial_message", string_property("Initial user message for the task")},
          {"parent_session_id", string_property("Parent session ID if this is a subtask")}}},
        {"required", {"mode_slug"}}}},
      {ToolKind::switch_mode, "switch_mode", "Switch a task to a different mode",
       {{"type", "object"},
        {"properties",
         {{"session_id", string_property("Session ID of the task")},
          {"new_mode_slug", string_property("Slug of the mode to switch to")},
          {"reason", string_property("Reason for switching modes (optional)")}}},
        {"required", {"session_id", "new_mode_slug"}}}},
      {ToolKind::get_task_info, "get_task_info", "Get information about a task/session",
       {{"type", "object"},
        {"properties",
         {{"session_id", string_property("Session ID")},
          {"include_messages", boolean_property("Include conversation history (default: false)")},
          {"include_hierarchy", boolean_property("Include parent/child task info (default: false)")}}},
        {"required", {"session_id"}}}},
      {ToolKind::validate_tool_use, "validate_tool_use", "Check if a tool can be used in the current mode",
       {{"type", "object"},
        {"properties",
         {{"session_id", string_property("Session ID")},
          {"tool_name", string_property("Name of the tool to validate")},
          {"file_path", string_property("File path (for edit operations)")}}},
        {"required", {"session_id", "tool_name"}}}},
      {ToolKind::complete_task, "complete_task", "Mark a task as completed or failed",
       {{"type", "object"},
        {"properties",
         {{"session_id", string_property("Session ID")},
          {"status",
           {{"type", "string"},
            {"enum", {"completed", "failed", "cancelled"}},
            {"description", "Final status of the task"}}},
          {"result", string_property("Completion result or error message")}}},
        {"required", {"session_id", "status"}}}},
  };
  return kDefinitions;
}

ToolHandler::ToolHandler(session::SessionManager& sessions, const modes::ModeRegistry& registry,
                         const modes::PolicyEngine& policy)
    : sessions_(sessions), registry_(registry), policy_(policy) {}

nlohmann::json ToolHandler::list_tools() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : tool_definitions()) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return tools;
}

core::Expected<nlohmann::json> ToolHandler::call_tool(const std::string& name, const nlohmann::json& arguments) {
  const auto kind = parse_tool_kind(name);
  if (!kind.has_value()) {
    std::string available;
    for (const auto& tool : tool_definitions()) {
      if (!available.empty()) {
        available += ", ";
      }
      available += tool.name;
    }
    return core::validation_error("Unknown tool: " + name + ". Available tools: " + available);
  }

  for (const auto& tool : tool_definitions()) {
    if (tool.kind != *kind) {
      continue;
    }
    if (auto error = validate_tool_args(tool.name, arguments, tool.input_schema)) {
      return *error;
    }
    break;
  }

  switch (*kind) {
    case ToolKind::list_modes:
      return list_modes(arguments);
    case ToolKind::get_mode_info:
      return get_mode_info(arguments);
    case ToolKind::create_task:
      return create_task(arguments);
    case ToolKind::switch_mode:
      return switch_mode(arguments);
    case ToolKind::get_task_info:
      return get_task_info(arguments);
    case ToolKind::validate_tool_use:
      return validate_tool_use(arguments);
    case ToolKind::complete_task:
      return complete_task(arguments);
  }
  return core::internal_error("unhandled tool kind for " + name);
}

core::Expected<std::shared_ptr<session::Session>> ToolHandler::require_session(const std::string& session_id,
                                                                               const char* label) {
  if (auto error = validate_session_id(session_id)) {
    return *error;
  }
  auto session = sessions_.get_session(session_id);
  if (session == nullptr) {
    return core::validation_error(std::string(label) + " not found: " + session_id);
  }
  return session;
}

core::Expected<nlohmann::json> ToolHandler::list_modes(const nlohmann::json& args) const {
  const std::string source_filter = args.value("source", std::string("all"));

  std::ostringstream text;
  text << "Available modes:\n";
  std::size_t index = 0;
  for (const auto& mode : registry_.all()) {
    if (source_filter != "all" && source_filter != modes::to_string(mode->source())) {
      continue;
    }
    ++index;
    text << '\n' << index << ". " << mode->slug() << " (" << mode->name() << ") - " << modes::to_string(mode->source());
    if (!mode->description().empty()) {
      text << "\n   Description: " << mode->description();
    }

    std::string groups;
    for (const auto& entry : mode->groups()) {
      if (!groups.empty()) {
        groups += ", ";
      }
      groups += group_summary(entry);
    }
    text << "\n   Tool groups: " << groups << '\n';
  }

  return text_result(text.str(), {{"count", index}, {"source", source_filter}});
}

core::Expected<nlohmann::json> ToolHandler::get_mode_info(const nlohmann::json& args) const {
  const std::string slug = args.at("mode_slug").get<std::string>();
  const bool include_system_prompt = args.value("include_system_prompt", false);

  if (auto error = validate_mode_slug(slug)) {
    return *error;
  }
  const auto mode = registry_.find(slug);
  if (mode == nullptr) {
    return core::validation_error("Mode not found: " + slug + ". Available: " + registry_.slug_list());
  }

  std::ostringstream text;
  text << "Mode: " << mode->name() << " (" << mode->slug() << ")\n";
  text << "Source: " << modes::to_string(mode->source());
  if (!mode->description().empty()) {
    text << "\nDescription: " << mode->description();
  }
  if (!mode->when_to_use().empty()) {
    text << "\n\nWhen to use:\n" << mode->when_to_use();
  }

  text << "\n\nTool Groups:";
  for (const auto group : modes::kAllToolGroups) {
    const modes::GroupEntry* entry = mode->group_entry(group);
    text << '\n' << (entry != nullptr ? kEnabledMark : kDisabledMark) << ' ' << modes::to_string(group);
    if (entry == nullptr) {
      continue;
    }
    if (entry->file_pattern.has_value()) {
      text << " (restricted to: " << entry->file_pattern->expression() << ")";
    }
    if (!entry->description.empty()) {
      text << " - " << entry->description;
    }
  }

  if (!mode->custom_instructions().empty()) {
    text << "\n\nCustom Instructions:\n" << mode->custom_instructions();
  }
  if (include_system_prompt) {
    text << "\n\nSystem Prompt:\n" << policy_.system_prompt_for(slug);
  }

  return text_result(text.str(), {{"mode_slug", mode->slug()}, {"source", modes::to_string(mode->source())}});
}

core::Expected<nlohmann::json> ToolHandler::create_task(const nlohmann::json& args) {
  const std::string slug = args.at("mode_slug").get<std::string>();
  const std::string initial_message = args.value("initial_message", std::string());
  const std::string parent_session_id = args.value("parent_session_id", std::string());

  if (auto error = validate_mode_slug(slug)) {
    return *error;
  }

  std::shared_ptr<session::Session> parent;
  if (!parent_session_id.empty()) {
    auto resolved = require_session(parent_session_id, "Parent session");
    if (const auto* error = std::get_if<core::RpcError>(&resolved)) {
      return *error;
    }
    parent = std::get<std::shared_ptr<session::Session>>(std::move(resolved));
  }

  auto created = policy_.create_task(slug, initial_message, parent != nullptr ? &parent->task() : nullptr);
  if (const auto* error = std::get_if<core::RpcError>(&created)) {
    return *error;
  }

  const auto session = sessions_.create_session(std::get<modes::Task>(std::move(created)));
  const modes::Task& task = session->task();
  const auto mode = registry_.find(slug);

  std::ostringstream text;
  text << "Task created successfully\n\n"
       << "Session ID: " << session->id() << '\n'
       << "Task ID: " << task.id() << '\n'
       << "Mode: " << slug << " (" << (mode != nullptr ? mode->name() : "Unknown") << ")\n"
       << "State: " << modes::to_string(task.state()) << '\n';
  if (parent != nullptr) {
    text << "Parent Session: " << parent->id() << '\n';
  }
  text << "\nUse this session_id for subsequent operations.";

  return text_result(text.str(), {{"session_id", session->id()}, {"task_id", task.id()}, {"mode_slug", slug}});
}

core::Expected<nlohmann::json> ToolHandler::switch_mode(const nlohmann::json& args) {
  const std::string session_id = args.at("session_id").get<std::string>();
  const std::string new_slug = args.at("new_mode_slug").get<std::string>();
  const std::string reason = args.value("reason", std::string());

  if (auto error = validate_mode_slug(new_slug)) {
    return *error;
  }
  auto resolved = require_session(session_id);
  if (const auto* error = std::get_if<core::RpcError>(&resolved)) {
    return *error;
  }
  const auto session = std::get<std::shared_ptr<session::Session>>(std::move(resolved));
  modes::Task& task = session->task();
  const std::string old_slug = task.mode_slug();

  if (auto error = policy_.switch_mode(task, new_slug)) {
    return *error;
  }
  task.mark_running();
  if (!reason.empty()) {
    task.metadata()["mode_switch_reason"] = reason;
  }

  std::ostringstream text;
  text << "Mode switched successfully\n\n"
       << "Session: " << session_id << '\n'
       << "Old mode: " << old_slug << '\n'
       << "New mode: " << new_slug << '\n';
  if (!reason.empty()) {
    text << "Reason: " << reason << '\n';
  }

  if (const auto mode = registry_.find(new_slug); mode != nullptr) {
    text << "\nNew tool groups:\n";
    for (const auto group : modes::kAllToolGroups) {
      const modes::GroupEntry* entry = mode->group_entry(group);
      text << (entry != nullptr ? kEnabledMark : kDisabledMark) << ' ' << modes::to_string(group);
      if (entry == nullptr) {
        text << " (not available)";
      } else if (entry->file_pattern.has_value()) {
        text << " (restricted to: " << entry->file_pattern->expression() << ")";
      }
      text << '\n';
    }
  }

  return text_result(text.str(), {{"old_mode", old_slug}, {"new_mode", new_slug}});
}

core::Expected<nlohmann::json> ToolHandler::get_task_info(const nlohmann::json& args) {
  const std::string session_id = args.at("session_id").get<std::string>();
  const bool include_messages = args.value("include_messages", false);
  const bool include_hierarchy = args.value("include_hierarchy", false);

  auto resolved = require_session(session_id);
  if (const auto* error = std::get_if<core::RpcError>(&resolved)) {
    return *error;
  }
  const auto session = std::get<std::shared_ptr<session::Session>>(std::move(resolved));
  const modes::Task& task = session->task();
  const auto mode = registry_.find(task.mode_slug());

  std::ostringstream text;
  text << "Task Information\n\n"
       << "Session ID: " << session->id() << '\n'
       << "Task ID: " << task.id() << '\n'
       << "Mode: " << task.mode_slug() << " (" << (mode != nullptr ? mode->name() : "Unknown") << ")\n"
       << "State: " << modes::to_string(task.state()) << '\n'
       << "Created: " << core::format_iso8601(task.created_at());
  if (task.completed_at().has_value()) {
    text << "\nCompleted: " << core::format_iso8601(*task.completed_at());
  }

  text << std::fixed << std::setprecision(0);
  text << "\n\nSession Age: " << session->age_seconds() << "s";
  text << "\nIdle Time: " << session->idle_seconds() << "s";

  if (include_hierarchy) {
    text << "\n\nHierarchy:";
    if (task.parent_task_id().has_value()) {
      text << "\n  Parent Task: " << *task.parent_task_id();
    }
    if (!task.child_task_ids().empty()) {
      std::string children;
      for (const auto& child : task.child_task_ids()) {
        if (!children.empty()) {
          children += ", ";
        }
        children += child;
      }
      text << "\n  Child Tasks: " << children;
    }
  }

  if (include_messages) {
    text << "\n\nConversation History (" << task.messages().size() << " messages):";
    std::size_t index = 0;
    for (const auto& message : task.messages()) {
      ++index;
      text << "\n\n" << index << ". [" << message.role << "] " << core::format_iso8601(message.timestamp);
      text << "\n   " << preview_text(message.content);
    }
  }

  return text_result(text.str(), {{"session_id", session->id()},
                                  {"task_id", task.id()},
                                  {"mode", task.mode_slug()},
                                  {"state", modes::to_string(task.state())},
                                  {"message_count", task.messages().size()}});
}

core::Expected<nlohmann::json> ToolHandler::validate_tool_use(const nlohmann::json& args) {
  const std::string session_id = args.at("session_id").get<std::string>();
  const std::string tool_name = args.at("tool_name").get<std::string>();
  const std::string file_path = args.value("file_path", std::string());

  auto resolved = require_session(session_id);
  if (const auto* error = std::get_if<core::RpcError>(&resolved)) {
    return *error;
  }
  const auto session = std::get<std::shared_ptr<session::Session>>(std::move(resolved));
  modes::Task& task = session->task();
  task.mark_running();

  nlohmann::json tool_args = nlohmann::json::object();
  if (!file_path.empty()) {
    tool_args["path"] = file_path;
  }
  const modes::ToolDecision decision = policy_.validate_tool_use(task, tool_name, tool_args);

  const auto mode = registry_.find(task.mode_slug());
  const std::string mode_name = mode != nullptr ? mode->name() : task.mode_slug();

  std::string text;
  if (decision.allowed) {
    text = std::string(kEnabledMark) + " Tool '" + tool_name + "' is allowed in mode '" + mode_name + "'";
    if (!file_path.empty()) {
      text += " for file '" + file_path + "'";
    }
  } else {
    text = std::string(kDisabledMark) + " " + decision.reason;
  }

  nlohmann::json metadata{{"allowed", decision.allowed},
                          {"tool_name", tool_name},
                          {"mode", task.mode_slug()},
                          {"error", nullptr},
                          {"code", nullptr},
                          {"error_type", nullptr}};
  if (!decision.allowed) {
    metadata["error"] = decision.reason;
    if (decision.code.has_value()) {
      metadata["code"] = core::to_int(*decision.code);
      metadata["error_type"] = core::error_code_name(*decision.code);
    }
  }
  return text_result(text, std::move(metadata));
}

core::Expected<nlohmann::json> ToolHandler::complete_task(const nlohmann::json& args) {
  const std::string session_id = args.at("session_id").get<std::string>();
  const std::string status = args.at("status").get<std::string>();
  const std::string result = args.value("result", std::string());

  auto resolved = require_session(session_id);
  if (const auto* error = std::get_if<core::RpcError>(&resolved)) {
    return *error;
  }
  const auto session = std::get<std::shared_ptr<session::Session>>(std::move(resolved));
  modes::Task& task = session->task();

  const auto target = modes::parse_task_state(status);
  if (!target.has_value() || !modes::is_terminal(*target)) {
    return core::validation_error("Invalid status: " + status + ". Must be one of: completed, failed, cancelled");
  }
  if (!task.finish(*target)) {
    return core::validation_error("Task " + task.id() + " is already " + modes::to_string(task.state()));
  }
  if (!result.empty()) {
    task.metadata()["completion_result"] = result;
  }

  std::ostringstream text;
  text << "Task " << status << "\n\n"
       << "Session ID: " << session_id << '\n'
       << "Task ID: " << task.id() << '\n'
       << "Final State: " << modes::to_string(task.state()) << '\n';
  if (task.completed_at().has_value()) {
    text << "Completed At: " << core::format_iso8601(*task.completed_at()) << '\n';
  }
  if (!result.empty()) {
    text << "\nResult:\n" << result;
  }

  return text_result(text.str(),
                     {{"session_id", session_id}, {"task_id", task.id()}, {"status", modes::to_string(task.state())}});
}

}  // namespace mode_server::mcp
