#include "session/session_manager.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

#include "core/config.hpp"
#include "core/ids.hpp"

namespace mode_server::session {

Session::Session(std::string id, modes::Task task)
    : id_(std::move(id)),
      task_(std::move(task)),
      created_at_(std::chrono::steady_clock::now()),
      last_accessed_(created_at_) {}

void Session::touch(const core::SteadyTime now) noexcept {
  if (now > last_accessed_) {
    last_accessed_ = now;
  }
}

bool Session::is_expired(const std::chrono::milliseconds timeout, const core::SteadyTime now) const noexcept {
  return std::chrono::duration_cast<std::chrono::milliseconds>(now - last_accessed_) > timeout;
}

double Session::age_seconds(const core::SteadyTime now) const noexcept {
  return core::seconds_between(created_at_, now);
}

double Session::idle_seconds(const core::SteadyTime now) const noexcept {
  return core::seconds_between(last_accessed_, now);
}

nlohmann::json SessionStats::to_json() const {
  nlohmann::json out{{"total_sessions", total_sessions},
                     {"timeout_seconds", timeout_seconds},
                     {"cleanup_interval_seconds", cleanup_interval_seconds},
                     {"evicted_total", evicted_total}};
  if (has_sessions) {
    out["oldest_session_age_seconds"] = oldest_age_seconds;
    out["newest_session_age_seconds"] = newest_age_seconds;
    out["max_idle_time_seconds"] = max_idle_seconds;
    out["min_idle_time_seconds"] = min_idle_seconds;
    out["avg_idle_time_seconds"] = avg_idle_seconds;
  }
  return out;
}

SessionManager::SessionManager(const std::chrono::milliseconds timeout,
                               const std::chrono::milliseconds cleanup_interval)
    : timeout_(timeout), cleanup_interval_(cleanup_interval) {}

SessionManager::~SessionManager() { stop(); }

void SessionManager::start() {
  const std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    std::cerr << "[session] session manager already running\n";
    return;
  }

  stop_requested_ = false;
  sweeper_ = std::thread([this]() { sweep_loop(); });
  running_ = true;
  std::cerr << "[session] session manager started (timeout_ms=" << timeout_.count()
            << " cleanup_interval_ms=" << cleanup_interval_.count() << ")\n";
}

void SessionManager::stop() {
  std::thread sweeper;
  {
    const std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_) {
      return;
    }
    stop_requested_ = true;
    running_ = false;
    sweeper = std::move(sweeper_);
  }

  stop_cv_.notify_all();
  if (sweeper.joinable()) {
    sweeper.join();
  }
  std::cerr << "[session] session manager stopped\n";
}

bool SessionManager::running() const {
  const std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return running_;
}

void SessionManager::set_sweep_observer(SweepObserver observer) {
  const std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  observer_ = std::move(observer);
}

std::shared_ptr<Session> SessionManager::create_session(modes::Task task) {
  std::shared_ptr<Session> session;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    session = std::make_shared<Session>(allocate_session_id_locked(), std::move(task));
    sessions_.emplace(session->id(), session);
    task_to_session_[session->task().id()] = session->id();
  }

  std::cerr << "[session] created session " << session->id() << " for task " << session->task().id()
            << " in mode '" << session->task().mode_slug() << "'\n";
  return session;
}

std::shared_ptr<Session> SessionManager::get_session(const std::string& session_id) {
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }

  const auto now = std::chrono::steady_clock::now();
  if (it->second->is_expired(timeout_, now)) {
    std::cerr << "[session] session " << session_id << " has expired\n";
    remove_locked(session_id);
    ++evicted_total_;
    return nullptr;
  }

  it->second->touch(now);
  return it->second;
}

std::shared_ptr<Session> SessionManager::get_session_by_task(const std::string& task_id) {
  std::string session_id;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = task_to_session_.find(task_id);
    if (it == task_to_session_.end()) {
      return nullptr;
    }
    session_id = it->second;
  }
  return get_session(session_id);
}

bool SessionManager::destroy_session(const std::string& session_id) {
  const std::lock_guard<std::mutex> lock(mutex_);
  return remove_locked(session_id);
}

std::vector<std::shared_ptr<Session>> SessionManager::list_sessions() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<Session>> out;
  out.reserve(sessions_.size());
  for (const auto& [_, session] : sessions_) {
    out.push_back(session);
  }
  return out;
}

std::size_t SessionManager::session_count() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::size_t SessionManager::sweep_expired() {
  std::size_t removed = 0;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::string> expired;
    for (const auto& [id, session] : sessions_) {
      if (session->is_expired(timeout_, now)) {
        expired.push_back(id);
      }
    }
    for (const auto& id : expired) {
      if (remove_locked(id)) {
        ++removed;
      }
    }
    evicted_total_ += removed;
  }

  if (removed > 0) {
    std::cerr << "[session] evicted " << removed << " expired session(s)\n";
  }
  return removed;
}

std::size_t SessionManager::cleanup_all() {
  std::size_t removed = 0;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    removed = sessions_.size();
    sessions_.clear();
    task_to_session_.clear();
  }
  std::cerr << "[session] cleaned up all " << removed << " session(s)\n";
  return removed;
}

SessionStats SessionManager::stats() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return stats_locked();
}

SessionStats SessionManager::stats_locked() const {
  SessionStats stats{};
  stats.total_sessions = sessions_.size();
  stats.timeout_seconds = std::chrono::duration<double>(timeout_).count();
  stats.cleanup_interval_seconds = std::chrono::duration<double>(cleanup_interval_).count();
  stats.evicted_total = evicted_total_;

  if (sessions_.empty()) {
    return stats;
  }

  const auto now = std::chrono::steady_clock::now();
  stats.has_sessions = true;
  stats.oldest_age_seconds = 0.0;
  stats.newest_age_seconds = -1.0;
  stats.max_idle_seconds = 0.0;
  stats.min_idle_seconds = -1.0;
  double idle_sum = 0.0;
  for (const auto& [_, session] : sessions_) {
    const double age = session->age_seconds(now);
    const double idle = session->idle_seconds(now);
    stats.oldest_age_seconds = std::max(stats.oldest_age_seconds, age);
    stats.newest_age_seconds = stats.newest_age_seconds < 0.0 ? age : std::min(stats.newest_age_seconds, age);
    stats.max_idle_seconds = std::max(stats.max_idle_seconds, idle);
    stats.min_idle_seconds = stats.min_idle_seconds < 0.0 ? idle : std::min(stats.min_idle_seconds, idle);
    idle_sum += idle;
  }
  stats.avg_idle_seconds = idle_sum / static_cast<double>(sessions_.size());
  return stats;
}

void SessionManager::sweep_loop() {
  std::cerr << "[session] sweep loop running (interval_ms=" << cleanup_interval_.count() << ")\n";

  for (;;) {
    SweepObserver observer;
    {
      std::unique_lock<std::mutex> lock(lifecycle_mutex_);
      if (stop_cv_.wait_for(lock, std::min(cleanup_interval_, core::kMaxSessionDuration),
                            [this]() { return stop_requested_; })) {
        break;
      }
      observer = observer_;
    }

    try {
      sweep_expired();
      if (observer) {
        observer(stats());
      }
    } catch (const std::exception& ex) {
      std::cerr << "[session] sweep iteration failed: " << ex.what() << '\n';
    }
  }

  std::cerr << "[session] sweep loop exited\n";
}

std::string SessionManager::allocate_session_id_locked() const {
  for (;;) {
    std::string id = std::string(kSessionIdPrefix) + core::random_hex(kSessionIdSuffixLength);
    if (sessions_.find(id) == sessions_.end()) {
      return id;
    }
  }
}

bool SessionManager::remove_locked(const std::string& session_id) {
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return false;
  }

  const auto task_it = task_to_session_.find(it->second->task().id());
  if (task_it != task_to_session_.end() && task_it->second == session_id) {
    task_to_session_.erase(task_it);
  }
  sessions_.erase(it);
  std::cerr << "[session] removed session " << session_id << '\n';
  return true;
}

}  // namespace mode_server::session
