#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "session/session_manager.hpp"

struct redisContext;

namespace mode_server::sinks {

struct RedisStatsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"mode-server"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes session table gauges as RedisTimeSeries samples.
class RedisStatsSink {
 public:
  explicit RedisStatsSink(RedisStatsOptions options = {});
  ~RedisStatsSink();

  RedisStatsSink(const RedisStatsSink&) = delete;
  RedisStatsSink& operator=(const RedisStatsSink&) = delete;
  RedisStatsSink(RedisStatsSink&&) noexcept;
  RedisStatsSink& operator=(RedisStatsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const session::SessionStats& stats);

  [[nodiscard]] static const std::vector<std::string>& metric_suffixes();

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool prepare_connection();
  bool ensure_schema();
  bool publish_impl(const session::SessionStats& stats);

  RedisStatsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> madd_args_;
  std::vector<const char*> madd_argv_;
  std::vector<std::size_t> madd_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
  bool last_publish_ok_{true};
};

}  // namespace mode_server::sinks
