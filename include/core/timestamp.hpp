#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mode_server::core {

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

inline double seconds_between(const SteadyTime from, const SteadyTime to) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(to - from).count();
}

// Local time, microsecond precision: 2024-11-05T14:03:07.123456
std::string format_iso8601(WallTime time);

}  // namespace mode_server::core
