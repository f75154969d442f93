#include "sinks/redis_stats.hpp"

#include "core/timestamp.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace mode_server::sinks {
namespace {

constexpr std::size_t kMetricCount = 5;
constexpr std::size_t kCommandArgCount = 1 + (kMetricCount * 3);

double sanitize_value(const double value) {
  return std::isfinite(value) ? value : 0.0;
}

std::string series_key(const std::string& key_prefix, const std::string& suffix) {
  return key_prefix + ":" + suffix;
}

// Takes ownership of reply.
bool reply_ok(redisReply* reply, const char* command) {
  if (reply == nullptr) {
    std::cerr << "[redis] " << command << " got no reply\n";
    return false;
  }
  const bool rejected = reply->type == REDIS_REPLY_ERROR;
  if (rejected) {
    std::cerr << "[redis] " << command << " rejected: " << (reply->str != nullptr ? reply->str : "unknown") << '\n';
  }
  freeReplyObject(reply);
  return !rejected;
}

}  // namespace

const std::vector<std::string>& RedisStatsSink::metric_suffixes() {
  static const std::vector<std::string> kMetricSuffixes = {
      "sessions:count",
      "sessions:evicted_total",
      "sessions:max_idle_s",
      "sessions:avg_idle_s",
      "sessions:oldest_age_s",
  };
  return kMetricSuffixes;
}

RedisStatsSink::RedisStatsSink(RedisStatsOptions options) : options_(std::move(options)) {
  madd_args_.reserve(kCommandArgCount);
  madd_argv_.reserve(kCommandArgCount);
  madd_argv_len_.reserve(kCommandArgCount);
}

RedisStatsSink::~RedisStatsSink() = default;

RedisStatsSink::RedisStatsSink(RedisStatsSink&&) noexcept = default;
RedisStatsSink& RedisStatsSink::operator=(RedisStatsSink&&) noexcept = default;

bool RedisStatsSink::check_connectivity() {
  return ensure_connected();
}

void RedisStatsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisStatsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisStatsSink::reconnect() {
  context_.reset();

  const timeval timeout{
      .tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000),
      .tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000),
  };
  const bool use_socket = !options_.unix_socket.empty();
  std::unique_ptr<redisContext, ContextDeleter> fresh(
      use_socket ? redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout)
                 : redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout));

  if (fresh == nullptr || fresh->err != REDIS_OK) {
    std::cerr << "[redis] cannot reach "
              << (use_socket ? options_.unix_socket : options_.host + ":" + std::to_string(options_.port)) << ": "
              << (fresh != nullptr ? fresh->errstr : "context allocation failed") << '\n';
    return false;
  }

  context_ = std::move(fresh);
  if (!prepare_connection() || !ensure_schema()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisStatsSink::prepare_connection() {
  if (!options_.password.empty() &&
      !reply_ok(static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str())),
                "AUTH")) {
    return false;
  }
  if (options_.db != 0 &&
      !reply_ok(static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db)), "SELECT")) {
    return false;
  }
  return true;
}

bool RedisStatsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const auto& suffix : metric_suffixes()) {
    const std::string series = series_key(options_.key_prefix, suffix);
    auto* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", series.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const std::string error = reply->type == REDIS_REPLY_ERROR && reply->str != nullptr ? reply->str : "";
    freeReplyObject(reply);
    if (error.empty() || error.find("already exists") != std::string::npos) {
      continue;
    }

    if (error.find("unknown command") != std::string::npos) {
      std::cerr << "[redis] TS.CREATE is not supported by this server; session stats disabled\n";
      timeseries_available_ = false;
    } else {
      std::cerr << "[redis] could not create series " << series << ": " << error << '\n';
    }
    return false;
  }

  schema_ready_ = true;
  return true;
}

bool RedisStatsSink::publish(const session::SessionStats& stats) {
  bool ok = ensure_connected() && publish_impl(stats);
  if (!ok && timeseries_available_ && context_ != nullptr) {
    ok = reconnect() && publish_impl(stats);
  }

  if (ok != last_publish_ok_) {
    std::cerr << (ok ? "[redis] session stats publish recovered\n" : "[redis] session stats publish failing\n");
    last_publish_ok_ = ok;
  }
  return ok;
}

bool RedisStatsSink::publish_impl(const session::SessionStats& stats) {
  const std::string timestamp = std::to_string(core::unix_timestamp_now_ms());
  const double values[kMetricCount] = {
      static_cast<double>(stats.total_sessions),
      static_cast<double>(stats.evicted_total),
      sanitize_value(stats.max_idle_seconds),
      sanitize_value(stats.avg_idle_seconds),
      sanitize_value(stats.oldest_age_seconds),
  };

  // TS.MADD key ts value [key ts value ...]
  madd_args_.assign(1, "TS.MADD");
  const auto& suffixes = metric_suffixes();
  for (std::size_t i = 0; i < kMetricCount; ++i) {
    madd_args_.push_back(series_key(options_.key_prefix, suffixes[i]));
    madd_args_.push_back(timestamp);
    madd_args_.push_back(std::to_string(values[i]));
  }

  madd_argv_.clear();
  madd_argv_len_.clear();
  for (const auto& arg : madd_args_) {
    madd_argv_.push_back(arg.data());
    madd_argv_len_.push_back(arg.size());
  }

  return reply_ok(static_cast<redisReply*>(redisCommandArgv(context_.get(), static_cast<int>(madd_argv_.size()),
                                                            madd_argv_.data(), madd_argv_len_.data())),
                  "TS.MADD");
}

}  // namespace mode_server::sinks
