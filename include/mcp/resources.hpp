#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "modes/mode.hpp"
#include "modes/policy.hpp"
#include "modes/registry.hpp"

namespace mode_server::mcp {

inline constexpr const char* kModeUriScheme = "mode";

// Serialized views of a Mode, shared with the tool handler.
nlohmann::json mode_full_json(const modes::Mode& mode);
nlohmann::json mode_config_json(const modes::Mode& mode);

// mode://<slug>, mode://<slug>/config and mode://<slug>/system_prompt for every mode.
class ResourceHandler {
 public:
  ResourceHandler(const modes::ModeRegistry& registry, const modes::PolicyEngine& policy);

  [[nodiscard]] nlohmann::json list_resources() const;

  // {"contents":[{"uri","mimeType","text"}]}
  [[nodiscard]] core::Expected<nlohmann::json> read_resource(const std::string& uri) const;

 private:
  const modes::ModeRegistry& registry_;
  const modes::PolicyEngine& policy_;
};

}  // namespace mode_server::mcp
