#include "modes/mode.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace mode_server::modes {

const char* to_string(const ToolGroup group) noexcept {
  switch (group) {
    case ToolGroup::read:
      return "read";
    case ToolGroup::edit:
      return "edit";
    case ToolGroup::browser:
      return "browser";
    case ToolGroup::command:
      return "command";
    case ToolGroup::integration:
      return "integration";
    case ToolGroup::delegation:
      return "delegation";
  }
  return "unknown";
}

const char* to_string(const ModeSource source) noexcept {
  switch (source) {
    case ModeSource::builtin:
      return "builtin";
    case ModeSource::global:
      return "global";
    case ModeSource::project:
      return "project";
  }
  return "unknown";
}

std::optional<ToolGroup> parse_tool_group(const std::string_view name) {
  for (const auto group : kAllToolGroups) {
    if (name == to_string(group)) {
      return group;
    }
  }
  if (name == "mcp") {
    return ToolGroup::integration;
  }
  if (name == "modes") {
    return ToolGroup::delegation;
  }
  return std::nullopt;
}

bool is_valid_slug(const std::string_view slug) {
  if (slug.empty() || slug.size() > 50) {
    return false;
  }
  for (const char c : slug) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '-' && c != '_') {
      return false;
    }
  }
  return true;
}

FilePattern::FilePattern(std::string expression) : expression_(std::move(expression)) {
  try {
    compiled_ = std::regex(expression_, std::regex::ECMAScript);
  } catch (const std::regex_error& ex) {
    throw std::invalid_argument("Invalid regex pattern: " + expression_ + " (" + ex.what() + ")");
  }
}

bool FilePattern::matches(const std::string& path) const {
  return std::regex_search(path, compiled_);
}

Mode::Mode(ModeDefinition definition) : def_(std::move(definition)) {
  if (!is_valid_slug(def_.slug)) {
    throw std::invalid_argument("Invalid slug '" + def_.slug +
                                "': must be 1-50 letters, numbers, dashes or underscores");
  }
  if (def_.name.empty()) {
    throw std::invalid_argument("Mode name is required");
  }
  if (def_.role_definition.empty()) {
    throw std::invalid_argument("Mode role_definition is required");
  }

  std::array<bool, kAllToolGroups.size()> seen{};
  for (const auto& entry : def_.groups) {
    const auto index = static_cast<std::size_t>(entry.group);
    if (seen[index]) {
      throw std::invalid_argument(std::string("Duplicate group '") + to_string(entry.group) + "' in mode '" +
                                  def_.slug + "'");
    }
    seen[index] = true;
  }
}

bool Mode::is_group_enabled(const ToolGroup group) const noexcept {
  return group_entry(group) != nullptr;
}

const GroupEntry* Mode::group_entry(const ToolGroup group) const noexcept {
  for (const auto& entry : def_.groups) {
    if (entry.group == group) {
      return &entry;
    }
  }
  return nullptr;
}

bool Mode::can_edit_file(const std::string& path) const {
  const GroupEntry* edit = group_entry(ToolGroup::edit);
  if (edit == nullptr) {
    return false;
  }
  if (!edit->file_pattern.has_value()) {
    return true;
  }
  return edit->file_pattern->matches(path);
}

GroupEntry make_group(const ToolGroup group) {
  return GroupEntry{.group = group, .file_pattern = std::nullopt, .description = {}};
}

GroupEntry make_group(const ToolGroup group, std::string file_regex, std::string description) {
  return GroupEntry{.group = group, .file_pattern = FilePattern(std::move(file_regex)), .description = std::move(description)};
}

}  // namespace mode_server::modes
