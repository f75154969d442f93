#pragma once

#include <cstddef>
#include <string>

namespace mode_server::core {

std::string random_hex(std::size_t length);

// 8-4-4-4-12 lowercase hex, version nibble set to 4.
std::string random_uuid();

}  // namespace mode_server::core
