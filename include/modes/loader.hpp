#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "modes/mode.hpp"

namespace mode_server::modes {

inline constexpr const char* kGlobalModesFilename = "modes.json";
inline constexpr const char* kProjectModesFilename = ".modes.json";

// Throws std::invalid_argument on a malformed entry.
Mode parse_mode(const nlohmann::json& entry, ModeSource source);

// Missing or unreadable files yield no modes; bad entries are logged and skipped.
std::vector<Mode> load_modes_file(const std::string& path, ModeSource source);

// Later lists override earlier ones by slug. Result is sorted by slug.
std::vector<Mode> merge_modes(std::vector<Mode> builtin, std::vector<Mode> global, std::vector<Mode> project);

class ModeLoader {
 public:
  ModeLoader(std::string global_config_dir, std::string project_root);

  // builtin < global_config_dir/modes.json < project_root/.modes.json
  [[nodiscard]] std::vector<Mode> load_all() const;

 private:
  std::string global_config_dir_;
  std::string project_root_;
};

}  // namespace mode_server::modes
