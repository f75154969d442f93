#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <hiredis/hiredis.h>

#include "modes/task.hpp"
#include "session/session_manager.hpp"
#include "sinks/redis_stats.hpp"

using mode_server::modes::Task;
using mode_server::session::Session;
using mode_server::session::SessionManager;
using mode_server::session::SessionStats;
using mode_server::sinks::RedisStatsOptions;
using mode_server::sinks::RedisStatsSink;

namespace {

struct RedisMockState {
  std::vector<std::string> last_argv{};
  std::vector<std::string> commands{};
  int command_argv_calls{0};
  bool fail_publish{false};
};

RedisMockState g_redis_mock{};

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char* format, ...) {
  g_redis_mock.commands.emplace_back(format);
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_STATUS;
  return reply;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = g_redis_mock.fail_publish ? REDIS_REPLY_ERROR : REDIS_REPLY_ARRAY;
  return reply;
}

void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

using std::chrono::milliseconds;

int test_create_get_destroy() {
  const char* name = "test_create_get_destroy";
  SessionManager manager(std::chrono::hours(1), std::chrono::minutes(5));

  const auto session = manager.create_session(Task("code"));
  if (session == nullptr || session->id().rfind("ses_", 0) != 0 || session->id().size() != 16) {
    return fail(name, "session id should be ses_ plus 12 hex characters");
  }
  for (const char c : session->id().substr(4)) {
    if (std::strchr("0123456789abcdef", c) == nullptr) {
      return fail(name, "session id suffix should be lowercase hex");
    }
  }

  if (manager.get_session(session->id()) != session) {
    return fail(name, "get_session should return the created session");
  }
  if (manager.get_session_by_task(session->task().id()) != session) {
    return fail(name, "reverse lookup by task id should find the session");
  }
  if (manager.get_session("ses_000000000000") != nullptr) {
    return fail(name, "unknown ids should not resolve");
  }

  if (!manager.destroy_session(session->id())) {
    return fail(name, "destroy should report removal");
  }
  if (manager.destroy_session(session->id())) {
    return fail(name, "second destroy should be a no-op");
  }
  if (manager.get_session(session->id()) != nullptr || manager.get_session_by_task(session->task().id()) != nullptr) {
    return fail(name, "destroyed session should not resolve");
  }

  const auto a = manager.create_session(Task("code"));
  const auto b = manager.create_session(Task("ask"));
  if (a->id() == b->id() || manager.session_count() != 2 || manager.list_sessions().size() != 2) {
    return fail(name, "sessions should be distinct and listed");
  }
  if (manager.cleanup_all() != 2 || manager.session_count() != 0) {
    return fail(name, "cleanup_all should empty the table");
  }

  return 0;
}

int test_lazy_eviction_on_lookup() {
  const char* name = "test_lazy_eviction_on_lookup";
  SessionManager manager(milliseconds(30), std::chrono::minutes(5));

  const auto session = manager.create_session(Task("code"));
  const std::string id = session->id();
  const std::string task_id = session->task().id();
  std::this_thread::sleep_for(milliseconds(80));

  if (manager.get_session(id) != nullptr) {
    return fail(name, "expired session should not be returned");
  }
  if (manager.session_count() != 0 || manager.get_session_by_task(task_id) != nullptr) {
    return fail(name, "expired session should be evicted from both tables");
  }
  if (manager.stats().evicted_total != 1) {
    return fail(name, "lazy eviction should be counted");
  }
  if (session->task().mode_slug() != "code") {
    return fail(name, "a held session should stay usable after eviction");
  }

  return 0;
}

int test_touch_is_monotonic() {
  const char* name = "test_touch_is_monotonic";
  Session session("ses_abcdefabcdef", Task("code"));
  const auto accessed = session.last_accessed();

  session.touch(accessed - std::chrono::seconds(10));
  if (session.last_accessed() != accessed) {
    return fail(name, "touch must not move last_accessed backwards");
  }

  session.touch(accessed + std::chrono::seconds(5));
  if (session.last_accessed() != accessed + std::chrono::seconds(5)) {
    return fail(name, "touch should advance last_accessed");
  }

  const auto now = accessed + std::chrono::seconds(5);
  if (session.is_expired(std::chrono::seconds(1), now) ||
      !session.is_expired(std::chrono::seconds(1), now + std::chrono::seconds(2))) {
    return fail(name, "expiry should follow idle time");
  }
  if (session.is_expired(std::chrono::seconds(1), now + std::chrono::seconds(1))) {
    return fail(name, "idle time equal to the timeout is not expired");
  }

  return 0;
}

int test_sweep_evicts_idle_sessions() {
  const char* name = "test_sweep_evicts_idle_sessions";
  SessionManager manager(milliseconds(50), milliseconds(50));

  std::atomic<int> observed{0};
  manager.set_sweep_observer([&observed](const SessionStats&) { observed.fetch_add(1); });
  manager.start();

  (void)manager.create_session(Task("code"));
  (void)manager.create_session(Task("ask"));

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (manager.session_count() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(20));
  }

  manager.stop();

  if (manager.session_count() != 0) {
    return fail(name, "idle sessions should be evicted by the sweep without any lookup");
  }
  if (manager.stats().evicted_total != 2) {
    return fail(name, "sweep evictions should be counted");
  }
  if (observed.load() == 0) {
    return fail(name, "sweep observer should be notified");
  }
  if (manager.running()) {
    return fail(name, "manager should report stopped");
  }

  return 0;
}

int test_start_stop_idempotent() {
  const char* name = "test_start_stop_idempotent";
  SessionManager manager(std::chrono::hours(1), std::chrono::hours(1));

  manager.stop();
  manager.start();
  manager.start();
  if (!manager.running()) {
    return fail(name, "manager should be running after start");
  }

  const auto begin = std::chrono::steady_clock::now();
  manager.stop();
  manager.stop();
  if (manager.running()) {
    return fail(name, "manager should be stopped");
  }
  if (std::chrono::steady_clock::now() - begin > std::chrono::seconds(5)) {
    return fail(name, "stop should interrupt the sweep wait");
  }

  manager.start();
  if (!manager.running()) {
    return fail(name, "manager should restart after stop");
  }
  return 0;
}

int test_very_long_durations() {
  const char* name = "test_very_long_durations";
  const milliseconds very_long(10000000000000LL);

  SessionManager manager(very_long, very_long);
  std::atomic<int> sweeps{0};
  manager.set_sweep_observer([&sweeps](const SessionStats&) { sweeps.fetch_add(1); });
  manager.start();

  const auto session = manager.create_session(Task("code"));
  if (manager.get_session(session->id()) != session) {
    return fail(name, "a fresh session must not expire under a very long timeout");
  }

  const Session idle("ses_abcdefabcdef", Task("code"));
  if (idle.is_expired(very_long, idle.last_accessed() + std::chrono::hours(24 * 365))) {
    return fail(name, "idle time below the timeout must not count as expired");
  }

  std::this_thread::sleep_for(milliseconds(100));
  const auto begin = std::chrono::steady_clock::now();
  manager.stop();
  if (sweeps.load() != 0) {
    return fail(name, "sweep should keep waiting under a very long interval");
  }
  if (std::chrono::steady_clock::now() - begin > std::chrono::seconds(5)) {
    return fail(name, "stop should interrupt a very long sweep wait");
  }

  return 0;
}

int test_stats_snapshot() {
  const char* name = "test_stats_snapshot";
  SessionManager manager(std::chrono::seconds(60), std::chrono::seconds(30));

  const auto empty = manager.stats();
  if (empty.total_sessions != 0 || empty.has_sessions || empty.timeout_seconds != 60.0 ||
      empty.cleanup_interval_seconds != 30.0) {
    return fail(name, "empty stats mismatch");
  }
  if (empty.to_json().contains("avg_idle_time_seconds")) {
    return fail(name, "idle figures should be omitted without sessions");
  }

  (void)manager.create_session(Task("code"));
  std::this_thread::sleep_for(milliseconds(20));
  (void)manager.create_session(Task("ask"));

  const auto stats = manager.stats();
  if (stats.total_sessions != 2 || !stats.has_sessions) {
    return fail(name, "stats should count live sessions");
  }
  if (stats.oldest_age_seconds < stats.newest_age_seconds || stats.max_idle_seconds < stats.min_idle_seconds) {
    return fail(name, "min/max ordering mismatch");
  }
  if (stats.avg_idle_seconds < stats.min_idle_seconds || stats.avg_idle_seconds > stats.max_idle_seconds) {
    return fail(name, "average idle should sit between min and max");
  }

  const auto json = stats.to_json();
  if (json["total_sessions"] != 2 || !json.contains("oldest_session_age_seconds") ||
      !json.contains("max_idle_time_seconds")) {
    return fail(name, "stats json fields mismatch");
  }

  return 0;
}

int test_redis_stats_sink_publish() {
  const char* name = "test_redis_stats_sink_publish";
  g_redis_mock = RedisMockState{};

  RedisStatsSink sink(RedisStatsOptions{.key_prefix = "test:modes"});
  SessionStats stats{};
  stats.total_sessions = 3;
  stats.evicted_total = 7;
  stats.has_sessions = true;
  stats.max_idle_seconds = 4.5;
  stats.avg_idle_seconds = 2.0;
  stats.oldest_age_seconds = 9.0;

  if (!sink.publish(stats)) {
    return fail(name, "publish should succeed against the mock");
  }

  std::size_t creates = 0;
  for (const auto& command : g_redis_mock.commands) {
    if (command.rfind("TS.CREATE", 0) == 0) {
      ++creates;
    }
  }
  if (creates != RedisStatsSink::metric_suffixes().size()) {
    return fail(name, "each series should be created on first connect");
  }

  const auto& argv = g_redis_mock.last_argv;
  if (argv.size() != 1 + (RedisStatsSink::metric_suffixes().size() * 3) || argv[0] != "TS.MADD") {
    return fail(name, "publish should send one TS.MADD with three args per metric");
  }
  if (argv[1] != "test:modes:sessions:count" || argv[3] != std::to_string(3.0)) {
    return fail(name, "session count sample mismatch");
  }
  if (argv[4] != "test:modes:sessions:evicted_total" || argv[6] != std::to_string(7.0)) {
    return fail(name, "evicted total sample mismatch");
  }
  if (argv[2] != argv[5]) {
    return fail(name, "all samples should share one timestamp");
  }

  g_redis_mock.commands.clear();
  if (!sink.publish(stats) || !g_redis_mock.commands.empty()) {
    return fail(name, "schema should only be created once");
  }

  g_redis_mock.fail_publish = true;
  const int calls_before = g_redis_mock.command_argv_calls;
  if (sink.publish(stats)) {
    return fail(name, "error reply should be reported as a failed publish");
  }
  if (g_redis_mock.command_argv_calls != calls_before + 2) {
    return fail(name, "failed publish should retry once after reconnecting");
  }
  g_redis_mock.fail_publish = false;

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_create_get_destroy(); rc != 0) return rc;
  if (int rc = test_lazy_eviction_on_lookup(); rc != 0) return rc;
  if (int rc = test_touch_is_monotonic(); rc != 0) return rc;
  if (int rc = test_sweep_evicts_idle_sessions(); rc != 0) return rc;
  if (int rc = test_start_stop_idempotent(); rc != 0) return rc;
  if (int rc = test_very_long_durations(); rc != 0) return rc;
  if (int rc = test_stats_snapshot(); rc != 0) return rc;
  if (int rc = test_redis_stats_sink_publish(); rc != 0) return rc;

  std::cout << "[PASS] session unit tests\n";
  return 0;
}
