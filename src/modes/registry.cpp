#include "modes/registry.hpp"

#include <stdexcept>
#include <utility>

namespace mode_server::modes {

ModeRegistry::ModeRegistry(std::vector<Mode> modes) : table_(build_table(std::move(modes))) {}

std::shared_ptr<const ModeRegistry::Table> ModeRegistry::build_table(std::vector<Mode> modes) {
  auto table = std::make_shared<Table>();
  for (auto& mode : modes) {
    const std::string slug = mode.slug();
    const auto [_, inserted] = table->emplace(slug, std::make_shared<const Mode>(std::move(mode)));
    if (!inserted) {
      throw std::invalid_argument("Duplicate mode slug '" + slug + "'");
    }
  }
  return table;
}

void ModeRegistry::reload(std::vector<Mode> modes) {
  auto fresh = build_table(std::move(modes));
  const std::lock_guard<std::mutex> lock(mutex_);
  table_ = std::move(fresh);
}

std::shared_ptr<const ModeRegistry::Table> ModeRegistry::snapshot() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return table_;
}

std::shared_ptr<const Mode> ModeRegistry::find(const std::string& slug) const {
  const auto table = snapshot();
  const auto it = table->find(slug);
  if (it == table->end()) {
    return nullptr;
  }
  return it->second;
}

bool ModeRegistry::contains(const std::string& slug) const {
  return find(slug) != nullptr;
}

std::vector<std::shared_ptr<const Mode>> ModeRegistry::all() const {
  const auto table = snapshot();
  std::vector<std::shared_ptr<const Mode>> modes;
  modes.reserve(table->size());
  for (const auto& [_, mode] : *table) {
    modes.push_back(mode);
  }
  return modes;
}

std::vector<std::string> ModeRegistry::slugs() const {
  const auto table = snapshot();
  std::vector<std::string> out;
  out.reserve(table->size());
  for (const auto& [slug, _] : *table) {
    out.push_back(slug);
  }
  return out;
}

std::size_t ModeRegistry::size() const {
  return snapshot()->size();
}

std::string ModeRegistry::slug_list() const {
  std::string out;
  for (const auto& slug : slugs()) {
    if (!out.empty()) {
      out += ", ";
    }
    out += slug;
  }
  return out;
}

}  // namespace mode_server::modes
