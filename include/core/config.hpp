#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mode_server::core {

// Upper bound for session timeout and sweep interval. Keeps steady_clock arithmetic in range.
inline constexpr std::chrono::milliseconds kMaxSessionDuration = std::chrono::hours(24 * 365 * 100);

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"mode-server"};
  bool enabled{false};
};

struct ServerConfig {
  std::string server_name{"mode-server"};
  std::string server_version{"1.0.0"};
  std::chrono::milliseconds session_timeout{std::chrono::seconds(3600)};
  std::chrono::milliseconds cleanup_interval{std::chrono::seconds(300)};
  std::string project_root{};
  std::string global_config_dir{};
  bool debug_logging{false};
  RedisConfig redis{};
};

ServerConfig load_server_config(const std::string& path);

// Reads MODE_SERVER_* variables on top of an already loaded config.
void apply_env_overrides(ServerConfig& config);

// Throws std::runtime_error on out-of-range values.
void validate_server_config(const ServerConfig& config);

std::string default_global_config_dir();

}  // namespace mode_server::core
