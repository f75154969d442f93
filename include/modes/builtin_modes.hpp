#pragma once

#include <vector>

#include "modes/mode.hpp"

namespace mode_server::modes {

// architect, ask, code, debug, orchestrator. Source is always builtin.
std::vector<Mode> builtin_modes();

}  // namespace mode_server::modes
