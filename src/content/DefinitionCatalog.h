#pragma once

#include "sim/ResourceCatalog.h"
#include "sim/StructureDefinition.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace outpost::content {

// Resource definitions: a JSON array (or a single object) of
//   { "id", "name", "description", "category", "base_value", "stack_size" }
// Every entry is validated before anything is registered.
bool LoadResourceDefinitionsJson(std::string_view text,
                                 sim::ResourceCatalog& out,
                                 std::string* outError = nullptr) noexcept;

bool LoadResourceDefinitionsFile(const std::filesystem::path& path,
                                 sim::ResourceCatalog& out,
                                 std::string* outError = nullptr) noexcept;

// Owns every StructureDefinition for the lifetime of the process. Addresses are stable:
// placed structures keep raw pointers into the catalog.
//
// Definitions are validated when loaded; a document with any invalid entry is rejected
// whole and the catalog is left as it was.
class DefinitionCatalog {
public:
    DefinitionCatalog() = default;
    DefinitionCatalog(const DefinitionCatalog&) = delete;
    DefinitionCatalog& operator=(const DefinitionCatalog&) = delete;

    // `resources` must already hold every resource the definitions reference.
    bool LoadFromJson(std::string_view text,
                      const sim::ResourceCatalog& resources,
                      std::string* outError = nullptr) noexcept;

    bool LoadFile(const std::filesystem::path& path,
                  const sim::ResourceCatalog& resources,
                  std::string* outError = nullptr) noexcept;

    // Every *.json directly inside `dir`, in lexical order. Stops at the first bad file;
    // files loaded before it stay loaded.
    bool LoadDirectory(const std::filesystem::path& dir,
                       const sim::ResourceCatalog& resources,
                       std::string* outError = nullptr) noexcept;

    [[nodiscard]] const sim::StructureDefinition* Find(std::string_view id) const;
    [[nodiscard]] bool Contains(std::string_view id) const { return Find(id) != nullptr; }

    [[nodiscard]] std::vector<std::string> Ids() const;        // load order
    [[nodiscard]] std::vector<std::string> Categories() const; // sorted, distinct

    // Case-insensitive category match, load order.
    [[nodiscard]] std::vector<const sim::StructureDefinition*> ByCategory(std::string_view category) const;

    // Player-buildable definitions sorted by category, then cost.
    [[nodiscard]] std::vector<const sim::StructureDefinition*> Buildable() const;

    [[nodiscard]] std::size_t Count() const noexcept { return m_defs.size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_defs.empty(); }

    // Invalidates every pointer handed out. Only for tools and tests.
    void Clear() noexcept;

private:
    std::vector<std::unique_ptr<sim::StructureDefinition>> m_defs;
    std::unordered_map<std::string, const sim::StructureDefinition*> m_byId;
};

} // namespace outpost::content
