#include "modes/loader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <utility>

#include "modes/builtin_modes.hpp"

namespace mode_server::modes {
namespace {

std::string optional_string(const nlohmann::json& entry, const char* key) {
  const auto it = entry.find(key);
  if (it == entry.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string("'") + key + "' must be a string");
  }
  return it->get<std::string>();
}

std::string required_string(const nlohmann::json& entry, const char* key) {
  std::string value = optional_string(entry, key);
  if (value.empty()) {
    throw std::invalid_argument(std::string("missing required field '") + key + "'");
  }
  return value;
}

ToolGroup group_from_name(const nlohmann::json& name) {
  if (!name.is_string()) {
    throw std::invalid_argument("group name must be a string");
  }
  const auto group = parse_tool_group(name.get_ref<const std::string&>());
  if (!group.has_value()) {
    throw std::invalid_argument("Invalid tool group '" + name.get<std::string>() +
                                "'. Valid groups: browser, command, delegation, edit, integration, read");
  }
  return *group;
}

GroupEntry parse_group(const nlohmann::json& raw) {
  if (raw.is_string()) {
    return make_group(group_from_name(raw));
  }

  if (!raw.is_array() || raw.size() != 2) {
    throw std::invalid_argument("Invalid group entry format: " + raw.dump());
  }

  const ToolGroup group = group_from_name(raw[0]);
  const auto& options = raw[1];
  if (!options.is_object()) {
    throw std::invalid_argument("Group options must be an object");
  }

  const std::string file_regex = optional_string(options, "fileRegex");
  std::string description = optional_string(options, "description");
  if (file_regex.empty()) {
    GroupEntry entry = make_group(group);
    entry.description = std::move(description);
    return entry;
  }
  return make_group(group, file_regex, std::move(description));
}

}  // namespace

Mode parse_mode(const nlohmann::json& entry, const ModeSource source) {
  if (!entry.is_object()) {
    throw std::invalid_argument("mode entry must be an object");
  }

  ModeDefinition definition{};
  definition.slug = required_string(entry, "slug");
  definition.name = required_string(entry, "name");
  definition.role_definition = required_string(entry, "roleDefinition");
  definition.when_to_use = optional_string(entry, "whenToUse");
  definition.description = optional_string(entry, "description");
  definition.custom_instructions = optional_string(entry, "customInstructions");
  definition.source = source;

  if (const auto groups_it = entry.find("groups"); groups_it != entry.end()) {
    if (!groups_it->is_array()) {
      throw std::invalid_argument("'groups' must be an array");
    }
    for (const auto& raw : *groups_it) {
      definition.groups.push_back(parse_group(raw));
    }
  }

  return Mode(std::move(definition));
}

std::vector<Mode> load_modes_file(const std::string& path, const ModeSource source) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    return {};
  }

  std::ifstream input(path);
  if (!input.is_open()) {
    std::cerr << "[modes] unable to open " << path << '\n';
    return {};
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(input);
  } catch (const nlohmann::json::parse_error& ex) {
    std::cerr << "[modes] failed to parse " << path << ": " << ex.what() << '\n';
    return {};
  }

  const auto custom_it = document.find("customModes");
  if (!document.is_object() || custom_it == document.end() || !custom_it->is_array()) {
    std::cerr << "[modes] " << path << " has no customModes array; ignoring\n";
    return {};
  }

  std::vector<Mode> modes;
  for (const auto& entry : *custom_it) {
    try {
      modes.push_back(parse_mode(entry, source));
    } catch (const std::invalid_argument& ex) {
      std::cerr << "[modes] skipping mode in " << path << ": " << ex.what() << '\n';
    }
  }

  std::cerr << "[modes] loaded " << modes.size() << " " << to_string(source) << " mode(s) from " << path << '\n';
  return modes;
}

std::vector<Mode> merge_modes(std::vector<Mode> builtin, std::vector<Mode> global, std::vector<Mode> project) {
  std::map<std::string, Mode> by_slug;
  for (auto* layer : {&builtin, &global, &project}) {
    for (auto& mode : *layer) {
      const std::string slug = mode.slug();
      by_slug.insert_or_assign(slug, std::move(mode));
    }
  }

  std::vector<Mode> merged;
  merged.reserve(by_slug.size());
  for (auto& [_, mode] : by_slug) {
    merged.push_back(std::move(mode));
  }
  return merged;
}

ModeLoader::ModeLoader(std::string global_config_dir, std::string project_root)
    : global_config_dir_(std::move(global_config_dir)), project_root_(std::move(project_root)) {}

std::vector<Mode> ModeLoader::load_all() const {
  std::vector<Mode> global;
  if (!global_config_dir_.empty()) {
    global = load_modes_file((std::filesystem::path(global_config_dir_) / kGlobalModesFilename).string(),
                             ModeSource::global);
  }

  std::vector<Mode> project;
  if (!project_root_.empty()) {
    project = load_modes_file((std::filesystem::path(project_root_) / kProjectModesFilename).string(),
                              ModeSource::project);
  }

  return merge_modes(builtin_modes(), std::move(global), std::move(project));
}

}  // namespace mode_server::modes
