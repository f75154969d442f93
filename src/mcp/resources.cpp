#include "mcp/resources.hpp"

#include <utility>

#include "mcp/validation.hpp"

namespace mode_server::mcp {
namespace {

constexpr const char* kJsonMime = "application/json";
constexpr const char* kTextMime = "text/plain";
constexpr int kJsonIndent = 2;

nlohmann::json content_block(const std::string& uri, const char* mime_type, std::string text) {
  return nlohmann::json{
      {"contents", nlohmann::json::array({{{"uri", uri}, {"mimeType", mime_type}, {"text", std::move(text)}}})}};
}

std::string dump_pretty(const nlohmann::json& value) {
  return value.dump(kJsonIndent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

nlohmann::json mode_full_json(const modes::Mode& mode) {
  nlohmann::json tool_groups = nlohmann::json::object();
  for (const auto group : modes::kAllToolGroups) {
    nlohmann::json entry{{"enabled", mode.is_group_enabled(group)}};
    if (const modes::GroupEntry* options = mode.group_entry(group); options != nullptr) {
      if (options->file_pattern.has_value()) {
        entry["file_regex"] = options->file_pattern->expression();
      }
      if (!options->description.empty()) {
        entry["description"] = options->description;
      }
    }
    tool_groups[modes::to_string(group)] = std::move(entry);
  }

  return nlohmann::json{
      {"slug", mode.slug()},
      {"name", mode.name()},
      {"source", modes::to_string(mode.source())},
      {"description", mode.description()},
      {"when_to_use", mode.when_to_use()},
      {"role_definition", mode.role_definition()},
      {"custom_instructions", mode.custom_instructions()},
      {"tool_groups", std::move(tool_groups)},
  };
}

nlohmann::json mode_config_json(const modes::Mode& mode) {
  nlohmann::json groups = nlohmann::json::array();
  for (const auto& entry : mode.groups()) {
    if (!entry.file_pattern.has_value() && entry.description.empty()) {
      groups.push_back(modes::to_string(entry.group));
      continue;
    }

    nlohmann::json options = nlohmann::json::object();
    if (entry.file_pattern.has_value()) {
      options["fileRegex"] = entry.file_pattern->expression();
    }
    if (!entry.description.empty()) {
      options["description"] = entry.description;
    }
    groups.push_back(nlohmann::json::array({modes::to_string(entry.group), std::move(options)}));
  }

  nlohmann::json config{
      {"slug", mode.slug()},
      {"name", mode.name()},
      {"source", modes::to_string(mode.source())},
      {"groups", std::move(groups)},
  };
  if (!mode.description().empty()) {
    config["description"] = mode.description();
  }
  if (!mode.when_to_use().empty()) {
    config["when_to_use"] = mode.when_to_use();
  }
  return config;
}

ResourceHandler::ResourceHandler(const modes::ModeRegistry& registry, const modes::PolicyEngine& policy)
    : registry_(registry), policy_(policy) {}

nlohmann::json ResourceHandler::list_resources() const {
  nlohmann::json resources = nlohmann::json::array();
  for (const auto& mode : registry_.all()) {
    const std::string base = std::string(kModeUriScheme) + "://" + mode->slug();
    resources.push_back({{"uri", base},
                         {"name", mode->name()},
                         {"mimeType", kJsonMime},
                         {"description", mode->description().empty() ? "Full configuration for " + mode->name()
                                                                     : mode->description()}});
    resources.push_back({{"uri", base + "/config"},
                         {"name", mode->name() + " - Configuration"},
                         {"mimeType", kJsonMime},
                         {"description", "Structured configuration for " + mode->name()}});
    resources.push_back({{"uri", base + "/system_prompt"},
                         {"name", mode->name() + " - System Prompt"},
                         {"mimeType", kTextMime},
                         {"description", "System prompt for " + mode->name()}});
  }
  return resources;
}

core::Expected<nlohmann::json> ResourceHandler::read_resource(const std::string& uri) const {
  if (auto error = validate_uri(uri, kModeUriScheme)) {
    return *error;
  }

  const std::string path = uri.substr(uri.find("://") + 3);
  const auto slash = path.find('/');
  const std::string slug = path.substr(0, slash);
  if (slug.empty()) {
    return core::validation_error("Mode slug is required in URI");
  }

  std::string subresource;
  if (slash != std::string::npos) {
    subresource = path.substr(slash + 1);
    if (subresource.empty() || subresource.find('/') != std::string::npos) {
      return core::validation_error("Invalid resource URI: " + uri + ". Expected mode://<slug>[/<subresource>]");
    }
  }

  const auto mode = registry_.find(slug);
  if (mode == nullptr) {
    return core::validation_error("Mode not found: " + slug + ". Available modes: " + registry_.slug_list());
  }

  if (subresource.empty()) {
    return content_block(uri, kJsonMime, dump_pretty(mode_full_json(*mode)));
  }
  if (subresource == "config") {
    return content_block(uri, kJsonMime, dump_pretty(mode_config_json(*mode)));
  }
  if (subresource == "system_prompt") {
    return content_block(uri, kTextMime, policy_.system_prompt_for(slug));
  }

  return core::validation_error("Unknown subresource: " + subresource + ". Valid subresources: config, system_prompt");
}

}  // namespace mode_server::mcp
