#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mode_server::core {
namespace {

std::string trim(const std::string& value) {
  constexpr const char* kBlank = " \t\r\n\f\v";
  const auto first = value.find_first_not_of(kBlank);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(kBlank);
  return value.substr(first, last - first + 1);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const char* truthy : {"true", "yes", "on", "1"}) {
    if (value == truthy) {
      return true;
    }
  }
  return false;
}

std::chrono::milliseconds parse_seconds(const std::string& key, const std::string& value) {
  double seconds = 0.0;
  try {
    seconds = std::stod(value);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number of seconds");
  }
  if (!std::isfinite(seconds) || seconds <= 0.0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  if (seconds * 1000.0 > static_cast<double>(kMaxSessionDuration.count())) {
    throw std::runtime_error(key + " must not exceed " + std::to_string(kMaxSessionDuration.count() / 1000) +
                             " seconds");
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

std::string expand_home(const std::string& path) {
  if (path.empty() || path.front() != '~') {
    return path;
  }
  const char* home = std::getenv("HOME");
  if (home == nullptr) {
    return path;
  }
  return std::string(home) + path.substr(1);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "server.name") {
    config.server_name = value;
    return;
  }

  if (key == "server.version") {
    config.server_version = value;
    return;
  }

  if (key == "sessions.timeout_s") {
    config.session_timeout = parse_seconds(key, value);
    return;
  }

  if (key == "sessions.cleanup_interval_s") {
    config.cleanup_interval = parse_seconds(key, value);
    return;
  }

  if (key == "paths.project_root") {
    config.project_root = expand_home(value);
    return;
  }

  if (key == "paths.global_config_dir") {
    config.global_config_dir = expand_home(value);
    return;
  }

  if (key == "logging.debug") {
    config.debug_logging = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
  }
}

// Two-space indented "key: value" lines. Emits dotted paths for scalar leaves.
void scan_yaml_scalars(std::istream& input,
                       const std::function<void(const std::string&, const std::string&)>& on_scalar) {
  std::vector<std::string> parents;
  for (std::string raw; std::getline(input, raw);) {
    const std::string line = raw.substr(0, raw.find('#'));
    const std::string content = trim(line);
    const auto colon = content.find(':');
    if (content.empty() || colon == std::string::npos) {
      continue;
    }

    const std::size_t level = line.find_first_not_of(' ') / 2;
    parents.resize(std::min(parents.size(), level));

    const std::string name = trim(content.substr(0, colon));
    const std::string value = trim(content.substr(colon + 1));
    if (value.empty()) {
      parents.resize(level);
      parents.push_back(name);
      continue;
    }

    std::string path;
    for (const auto& parent : parents) {
      if (!parent.empty()) {
        path += parent + '.';
      }
    }
    on_scalar(path + name, value);
  }
}

}  // namespace

std::string default_global_config_dir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr) {
    return ".mode-server";
  }
  return std::string(home) + "/.mode-server";
}

ServerConfig load_server_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  ServerConfig config{};
  config.global_config_dir = default_global_config_dir();
  scan_yaml_scalars(input, [&config](const std::string& key, const std::string& value) {
    apply_key_value(config, key, value);
  });
  return config;
}

void apply_env_overrides(ServerConfig& config) {
  if (const char* root = std::getenv("MODE_SERVER_PROJECT_ROOT"); root != nullptr && *root != '\0') {
    config.project_root = expand_home(root);
  }

  if (const char* dir = std::getenv("MODE_SERVER_CONFIG_DIR"); dir != nullptr && *dir != '\0') {
    config.global_config_dir = expand_home(dir);
  }

  if (const char* timeout = std::getenv("MODE_SERVER_SESSION_TIMEOUT"); timeout != nullptr && *timeout != '\0') {
    config.session_timeout = parse_seconds("MODE_SERVER_SESSION_TIMEOUT", timeout);
  }

  if (const char* debug = std::getenv("MODE_SERVER_DEBUG"); debug != nullptr && *debug != '\0') {
    config.debug_logging = parse_bool(debug);
  }
}

void validate_server_config(const ServerConfig& config) {
  if (config.session_timeout.count() <= 0) {
    throw std::runtime_error("sessions.timeout_s must be greater than 0");
  }

  if (config.cleanup_interval.count() <= 0) {
    throw std::runtime_error("sessions.cleanup_interval_s must be greater than 0");
  }

  if (config.session_timeout > kMaxSessionDuration || config.cleanup_interval > kMaxSessionDuration) {
    throw std::runtime_error("session durations must not exceed " +
                             std::to_string(kMaxSessionDuration.count() / 1000) + " seconds");
  }

  if (config.server_name.empty()) {
    throw std::runtime_error("server.name must not be empty");
  }

  if (config.redis.enabled && config.redis.unix_socket.empty() && config.redis.host.empty()) {
    throw std::runtime_error("redis.address must name a host or unix socket");
  }
}

}  // namespace mode_server::core
