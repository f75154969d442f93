#include "core/ids.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace mode_server::core {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::uint64_t next_random() {
  static std::mutex mutex;
  static std::mt19937_64 engine{std::random_device{}()};
  const std::lock_guard<std::mutex> lock(mutex);
  return engine();
}

}  // namespace

std::string random_hex(const std::size_t length) {
  std::string out;
  out.reserve(length);
  std::uint64_t bits = 0;
  int remaining = 0;
  for (std::size_t i = 0; i < length; ++i) {
    if (remaining == 0) {
      bits = next_random();
      remaining = 16;
    }
    out.push_back(kHexDigits[bits & 0xFU]);
    bits >>= 4U;
    --remaining;
  }
  return out;
}

std::string random_uuid() {
  std::string hex = random_hex(32);
  hex[12] = '4';
  hex[16] = kHexDigits[8U + (static_cast<unsigned>(next_random()) & 0x3U)];
  return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-' + hex.substr(16, 4) + '-' +
         hex.substr(20, 12);
}

}  // namespace mode_server::core
