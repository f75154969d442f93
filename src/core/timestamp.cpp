#include "core/timestamp.hpp"

#include <cstdio>
#include <ctime>

namespace mode_server::core {

std::string format_iso8601(const WallTime time) {
  const auto since_epoch = time.time_since_epoch();
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds).count();

  const std::time_t raw = static_cast<std::time_t>(seconds.count());
  std::tm local{};
  localtime_r(&raw, &local);

  char buffer[40]{};
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld", local.tm_year + 1900,
                local.tm_mon + 1, local.tm_mday, local.tm_hour, local.tm_min, local.tm_sec,
                static_cast<long long>(micros));
  return buffer;
}

}  // namespace mode_server::core
