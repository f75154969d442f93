#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/config.hpp"
#include "mcp/server.hpp"
#include "modes/loader.hpp"
#include "sinks/redis_stats.hpp"

namespace {

std::atomic<bool> g_reload_requested{false};

void handle_reload_signal(int /*signal*/) {
  g_reload_requested.store(true);
}

struct CommandLine {
  std::optional<std::string> config_path{};
  std::optional<std::string> project_root{};
  std::optional<std::string> global_config_dir{};
  bool debug{false};
  bool help{false};
};

void print_usage(std::ostream& out) {
  out << "usage: mode-server [--config PATH] [--project-root PATH] [--global-config-dir PATH] [--debug]\n"
         "\n"
         "Serves mode, session and task tools over newline-delimited JSON-RPC on stdin/stdout.\n"
         "Send SIGHUP to reload mode files.\n";
}

CommandLine parse_command_line(int argc, char** argv) {
  CommandLine cli{};
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto next_value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::runtime_error(arg + " requires a value");
      }
      return argv[++i];
    };

    if (arg == "--config") {
      cli.config_path = next_value();
    } else if (arg == "--project-root") {
      cli.project_root = next_value();
    } else if (arg == "--global-config-dir") {
      cli.global_config_dir = next_value();
    } else if (arg == "--debug") {
      cli.debug = true;
    } else if (arg == "--help" || arg == "-h") {
      cli.help = true;
    } else {
      throw std::runtime_error("unknown argument: " + arg);
    }
  }
  return cli;
}

std::string format_config_settings(const mode_server::core::ServerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[config] loaded config from " << (config_path.empty() ? "<defaults>" : config_path)
         << " | session_timeout_ms=" << config.session_timeout.count()
         << " | cleanup_interval_ms=" << config.cleanup_interval.count()
         << " | project_root=" << (config.project_root.empty() ? "<none>" : config.project_root)
         << " | global_config_dir=" << config.global_config_dir
         << " | debug=" << (config.debug_logging ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");

  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  mode_server::core::ServerConfig config{};
  std::string config_path;
  try {
    const CommandLine cli = parse_command_line(argc, argv);
    if (cli.help) {
      print_usage(std::cout);
      return 0;
    }

    if (cli.config_path.has_value()) {
      config_path = *cli.config_path;
      config = mode_server::core::load_server_config(config_path);
    }
    if (config.global_config_dir.empty()) {
      config.global_config_dir = mode_server::core::default_global_config_dir();
    }

    mode_server::core::apply_env_overrides(config);
    if (cli.project_root.has_value()) {
      config.project_root = *cli.project_root;
    }
    if (cli.global_config_dir.has_value()) {
      config.global_config_dir = *cli.global_config_dir;
    }
    if (cli.debug) {
      config.debug_logging = true;
    }

    mode_server::core::validate_server_config(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    print_usage(std::cerr);
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';
  std::signal(SIGHUP, handle_reload_signal);

  std::unique_ptr<mode_server::sinks::RedisStatsSink> stats_sink;
  if (config.redis.enabled) {
    stats_sink = std::make_unique<mode_server::sinks::RedisStatsSink>(mode_server::sinks::RedisStatsOptions{
        .host = config.redis.host,
        .port = config.redis.port,
        .unix_socket = config.redis.unix_socket,
        .key_prefix = config.redis.key_prefix,
    });
    if (!stats_sink->check_connectivity()) {
      std::cerr << "[redis] not reachable at startup; will retry after each sweep\n";
    }
  }

  const mode_server::modes::ModeLoader loader(config.global_config_dir, config.project_root);
  try {
    mode_server::mcp::Server server(config, [&loader]() { return loader.load_all(); });
    if (stats_sink != nullptr) {
      server.sessions().set_sweep_observer(
          [&stats_sink](const mode_server::session::SessionStats& stats) { stats_sink->publish(stats); });
    }
    return server.run(std::cin, std::cout, std::cerr, &g_reload_requested);
  } catch (const std::exception& ex) {
    std::cerr << "[server] fatal: " << ex.what() << '\n';
    return 1;
  }
}
