#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/timestamp.hpp"
#include "modes/task.hpp"

namespace mode_server::session {

inline constexpr const char* kSessionIdPrefix = "ses_";
inline constexpr std::size_t kSessionIdSuffixLength = 12;

class Session {
 public:
  Session(std::string id, modes::Task task);

  [[nodiscard]] const std::string& id() const noexcept { return id_; }
  [[nodiscard]] modes::Task& task() noexcept { return task_; }
  [[nodiscard]] const modes::Task& task() const noexcept { return task_; }
  [[nodiscard]] nlohmann::json& metadata() noexcept { return metadata_; }
  [[nodiscard]] core::SteadyTime created_at() const noexcept { return created_at_; }
  [[nodiscard]] core::SteadyTime last_accessed() const noexcept { return last_accessed_; }

  // Never moves last_accessed backwards.
  void touch(core::SteadyTime now = std::chrono::steady_clock::now()) noexcept;

  [[nodiscard]] bool is_expired(std::chrono::milliseconds timeout,
                                core::SteadyTime now = std::chrono::steady_clock::now()) const noexcept;
  [[nodiscard]] double age_seconds(core::SteadyTime now = std::chrono::steady_clock::now()) const noexcept;
  [[nodiscard]] double idle_seconds(core::SteadyTime now = std::chrono::steady_clock::now()) const noexcept;

 private:
  std::string id_;
  modes::Task task_;
  core::SteadyTime created_at_;
  core::SteadyTime last_accessed_;
  nlohmann::json metadata_ = nlohmann::json::object();
};

struct SessionStats {
  std::size_t total_sessions{0};
  double timeout_seconds{0.0};
  double cleanup_interval_seconds{0.0};
  std::uint64_t evicted_total{0};
  bool has_sessions{false};
  double oldest_age_seconds{0.0};
  double newest_age_seconds{0.0};
  double max_idle_seconds{0.0};
  double min_idle_seconds{0.0};
  double avg_idle_seconds{0.0};

  [[nodiscard]] nlohmann::json to_json() const;
};

class SessionManager {
 public:
  using SweepObserver = std::function<void(const SessionStats&)>;

  SessionManager(std::chrono::milliseconds timeout, std::chrono::milliseconds cleanup_interval);
  ~SessionManager();

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // Launches the sweep thread. No-op when already running.
  void start();

  // Returns only after the sweep thread has exited. No-op when stopped.
  void stop();

  [[nodiscard]] bool running() const;

  // Called on the sweep thread after every sweep.
  void set_sweep_observer(SweepObserver observer);

  std::shared_ptr<Session> create_session(modes::Task task);

  // Expired sessions are evicted here and reported as absent; live ones are touched.
  std::shared_ptr<Session> get_session(const std::string& session_id);
  std::shared_ptr<Session> get_session_by_task(const std::string& task_id);

  bool destroy_session(const std::string& session_id);

  [[nodiscard]] std::vector<std::shared_ptr<Session>> list_sessions() const;
  [[nodiscard]] std::size_t session_count() const;

  // Evicts every expired session now. Returns how many were removed.
  std::size_t sweep_expired();

  // Shutdown only. Returns how many were removed.
  std::size_t cleanup_all();

  [[nodiscard]] SessionStats stats() const;

  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }
  [[nodiscard]] std::chrono::milliseconds cleanup_interval() const noexcept { return cleanup_interval_; }

 private:
  void sweep_loop();
  std::string allocate_session_id_locked() const;
  bool remove_locked(const std::string& session_id);
  SessionStats stats_locked() const;

  const std::chrono::milliseconds timeout_;
  const std::chrono::milliseconds cleanup_interval_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_{};
  std::unordered_map<std::string, std::string> task_to_session_{};
  std::uint64_t evicted_total_{0};

  mutable std::mutex lifecycle_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};
  bool running_{false};
  std::thread sweeper_{};
  SweepObserver observer_{};
};

}  // namespace mode_server::session
