#include "modes/task.hpp"

#include <chrono>
#include <utility>

#include "core/ids.hpp"

namespace mode_server::modes {

const char* to_string(const TaskState state) noexcept {
  switch (state) {
    case TaskState::pending:
      return "pending";
    case TaskState::running:
      return "running";
    case TaskState::completed:
      return "completed";
    case TaskState::failed:
      return "failed";
    case TaskState::cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::optional<TaskState> parse_task_state(const std::string& name) {
  for (const auto state : {TaskState::pending, TaskState::running, TaskState::completed, TaskState::failed,
                           TaskState::cancelled}) {
    if (name == to_string(state)) {
      return state;
    }
  }
  return std::nullopt;
}

Task::Task(std::string mode_slug, std::optional<std::string> parent_task_id)
    : id_(core::random_uuid()),
      mode_slug_(std::move(mode_slug)),
      parent_task_id_(std::move(parent_task_id)),
      created_at_(std::chrono::system_clock::now()) {}

const Message& Task::add_message(std::string role, std::string content, nlohmann::json metadata) {
  messages_.push_back(Message{.role = std::move(role),
                              .content = std::move(content),
                              .timestamp = std::chrono::system_clock::now(),
                              .metadata = std::move(metadata)});
  return messages_.back();
}

void Task::switch_mode(const std::string& new_mode_slug) {
  const std::string old_mode = mode_slug_;
  mode_slug_ = new_mode_slug;
  add_message("system", "Mode switched from " + old_mode + " to " + new_mode_slug,
              nlohmann::json{{"mode_change", {{"from", old_mode}, {"to", new_mode_slug}}}});
}

void Task::add_child(const std::string& child_task_id) {
  child_task_ids_.push_back(child_task_id);
}

bool Task::mark_running() {
  if (state_ != TaskState::pending) {
    return false;
  }
  state_ = TaskState::running;
  return true;
}

bool Task::finish(const TaskState terminal_state) {
  if (!is_terminal(terminal_state) || is_terminal(state_)) {
    return false;
  }
  if (state_ == TaskState::pending) {
    state_ = TaskState::running;
  }
  state_ = terminal_state;
  completed_at_ = std::chrono::system_clock::now();
  return true;
}

nlohmann::json Task::to_json() const {
  nlohmann::json messages = nlohmann::json::array();
  for (const auto& message : messages_) {
    messages.push_back({{"role", message.role},
                        {"content", message.content},
                        {"timestamp", core::format_iso8601(message.timestamp)},
                        {"metadata", message.metadata}});
  }

  return nlohmann::json{
      {"task_id", id_},
      {"mode_slug", mode_slug_},
      {"messages", std::move(messages)},
      {"parent_task_id", parent_task_id_.has_value() ? nlohmann::json(*parent_task_id_) : nlohmann::json(nullptr)},
      {"child_task_ids", child_task_ids_},
      {"state", to_string(state_)},
      {"created_at", core::format_iso8601(created_at_)},
      {"completed_at",
       completed_at_.has_value() ? nlohmann::json(core::format_iso8601(*completed_at_)) : nlohmann::json(nullptr)},
      {"metadata", metadata_},
  };
}

}  // namespace mode_server::modes
