#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/timestamp.hpp"

namespace mode_server::modes {

enum class TaskState : std::uint8_t {
  pending,
  running,
  completed,
  failed,
  cancelled,
};

[[nodiscard]] const char* to_string(TaskState state) noexcept;
std::optional<TaskState> parse_task_state(const std::string& name);
[[nodiscard]] constexpr bool is_terminal(TaskState state) noexcept {
  return state == TaskState::completed || state == TaskState::failed || state == TaskState::cancelled;
}

struct Message {
  std::string role;
  std::string content;
  core::WallTime timestamp{};
  nlohmann::json metadata = nlohmann::json::object();
};

class Task {
 public:
  explicit Task(std::string mode_slug, std::optional<std::string> parent_task_id = std::nullopt);

  [[nodiscard]] const std::string& id() const noexcept { return id_; }
  [[nodiscard]] const std::string& mode_slug() const noexcept { return mode_slug_; }
  [[nodiscard]] TaskState state() const noexcept { return state_; }
  [[nodiscard]] const std::vector<Message>& messages() const noexcept { return messages_; }
  [[nodiscard]] const std::optional<std::string>& parent_task_id() const noexcept { return parent_task_id_; }
  [[nodiscard]] const std::vector<std::string>& child_task_ids() const noexcept { return child_task_ids_; }
  [[nodiscard]] core::WallTime created_at() const noexcept { return created_at_; }
  [[nodiscard]] const std::optional<core::WallTime>& completed_at() const noexcept { return completed_at_; }
  [[nodiscard]] nlohmann::json& metadata() noexcept { return metadata_; }
  [[nodiscard]] const nlohmann::json& metadata() const noexcept { return metadata_; }

  const Message& add_message(std::string role, std::string content, nlohmann::json metadata = nlohmann::json::object());

  // Appends a system message recording the old and new slug.
  void switch_mode(const std::string& new_mode_slug);

  void add_child(const std::string& child_task_id);

  // pending -> running. False from any other state.
  bool mark_running();

  // Moves to a terminal state, passing through running when still pending.
  // False when the task is already terminal or the target is not terminal.
  bool finish(TaskState terminal_state);

  [[nodiscard]] nlohmann::json to_json() const;

 private:
  std::string id_;
  std::string mode_slug_;
  std::vector<Message> messages_{};
  std::optional<std::string> parent_task_id_{};
  std::vector<std::string> child_task_ids_{};
  TaskState state_{TaskState::pending};
  core::WallTime created_at_{};
  std::optional<core::WallTime> completed_at_{};
  nlohmann::json metadata_ = nlohmann::json::object();
};

}  // namespace mode_server::modes
