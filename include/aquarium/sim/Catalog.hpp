#pragma once

#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace aquarium::sim {

// Static, read-only set of purchasable pieces.
class PieceCatalog final {
public:
  PieceCatalog() = default;
  explicit PieceCatalog(std::vector<CatalogEntry> entries);

  [[nodiscard]] std::span<const CatalogEntry> entries() const noexcept { return entries_; }
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  [[nodiscard]] const CatalogEntry* find(std::string_view name) const noexcept;

  // Throws CatalogError for unknown names.
  [[nodiscard]] const CatalogEntry& at(std::string_view name) const;

private:
  std::vector<CatalogEntry> entries_{};
};

void to_json(nlohmann::json& j, const CatalogEntry& e);

// Throws CatalogError when a required field is missing or has the wrong type.
[[nodiscard]] CatalogEntry catalog_entry_from_json(const nlohmann::json& j);

// Expects { "pieces": [ ... ] }. Throws CatalogError.
[[nodiscard]] PieceCatalog parse_catalog(const nlohmann::json& j);

// Throws CatalogError when the file cannot be opened or parsed.
[[nodiscard]] PieceCatalog load_catalog(const std::filesystem::path& path);

// Built-in catalog used when no catalog file is configured.
[[nodiscard]] const PieceCatalog& default_catalog();

} // namespace aquarium::sim
