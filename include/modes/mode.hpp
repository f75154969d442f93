#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace mode_server::modes {

enum class ToolGroup : std::uint8_t {
  read,
  edit,
  browser,
  command,
  integration,
  delegation,
};

inline constexpr std::array<ToolGroup, 6> kAllToolGroups = {
    ToolGroup::read,    ToolGroup::edit,        ToolGroup::browser,
    ToolGroup::command, ToolGroup::integration, ToolGroup::delegation,
};

enum class ModeSource : std::uint8_t {
  builtin,
  global,
  project,
};

[[nodiscard]] const char* to_string(ToolGroup group) noexcept;
[[nodiscard]] const char* to_string(ModeSource source) noexcept;

// Accepts the canonical names plus "mcp" and "modes" as aliases.
std::optional<ToolGroup> parse_tool_group(std::string_view name);

// 1..50 characters of [A-Za-z0-9_-].
bool is_valid_slug(std::string_view slug);

class FilePattern {
 public:
  // Throws std::invalid_argument when the expression does not compile.
  explicit FilePattern(std::string expression);

  [[nodiscard]] const std::string& expression() const noexcept { return expression_; }
  [[nodiscard]] bool matches(const std::string& path) const;

 private:
  std::string expression_;
  std::regex compiled_;
};

struct GroupEntry {
  ToolGroup group{ToolGroup::read};
  std::optional<FilePattern> file_pattern{};
  std::string description{};
};

struct ModeDefinition {
  std::string slug;
  std::string name;
  std::string role_definition;
  std::vector<GroupEntry> groups{};
  std::string when_to_use{};
  std::string description{};
  std::string custom_instructions{};
  ModeSource source{ModeSource::builtin};
};

class Mode {
 public:
  // Throws std::invalid_argument when the definition breaks a Mode invariant.
  explicit Mode(ModeDefinition definition);

  [[nodiscard]] const std::string& slug() const noexcept { return def_.slug; }
  [[nodiscard]] const std::string& name() const noexcept { return def_.name; }
  [[nodiscard]] const std::string& role_definition() const noexcept { return def_.role_definition; }
  [[nodiscard]] const std::vector<GroupEntry>& groups() const noexcept { return def_.groups; }
  [[nodiscard]] const std::string& when_to_use() const noexcept { return def_.when_to_use; }
  [[nodiscard]] const std::string& description() const noexcept { return def_.description; }
  [[nodiscard]] const std::string& custom_instructions() const noexcept { return def_.custom_instructions; }
  [[nodiscard]] ModeSource source() const noexcept { return def_.source; }

  [[nodiscard]] bool is_group_enabled(ToolGroup group) const noexcept;
  [[nodiscard]] const GroupEntry* group_entry(ToolGroup group) const noexcept;
  [[nodiscard]] bool can_edit_file(const std::string& path) const;

 private:
  ModeDefinition def_;
};

GroupEntry make_group(ToolGroup group);
GroupEntry make_group(ToolGroup group, std::string file_regex, std::string description = {});

}  // namespace mode_server::modes
