#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "modes/mode.hpp"

namespace mode_server::modes {

// Immutable slug -> Mode table, replaced wholesale by reload().
class ModeRegistry {
 public:
  using Table = std::map<std::string, std::shared_ptr<const Mode>>;

  // Throws std::invalid_argument on duplicate slugs.
  explicit ModeRegistry(std::vector<Mode> modes = {});

  void reload(std::vector<Mode> modes);

  [[nodiscard]] std::shared_ptr<const Table> snapshot() const;
  [[nodiscard]] std::shared_ptr<const Mode> find(const std::string& slug) const;
  [[nodiscard]] bool contains(const std::string& slug) const;
  [[nodiscard]] std::vector<std::shared_ptr<const Mode>> all() const;
  [[nodiscard]] std::vector<std::string> slugs() const;
  [[nodiscard]] std::size_t size() const;

  // "a, b, c" for error messages.
  [[nodiscard]] std::string slug_list() const;

 private:
  static std::shared_ptr<const Table> build_table(std::vector<Mode> modes);

  mutable std::mutex mutex_;
  std::shared_ptr<const Table> table_;
};

}  // namespace mode_server::modes
