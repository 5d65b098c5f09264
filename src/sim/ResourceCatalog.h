#pragma once

#include "sim/Types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace outpost::sim {

// Static metadata for one resource kind (grain, iron_ore, food, steel ...).
struct ResourceInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string category; // "raw", "processed", "finished"
    int baseValue = 10;
    int stackSize = 100;
};

// Interns resource names into ResourceId values.
//
// Names are resolved once when definitions are loaded; the simulation only ever sees ids.
// Ids are dense indices in registration order and stay valid for the catalog's lifetime.
class ResourceCatalog {
public:
    // Registers (or returns the existing id for) `info.id`. Metadata of an existing entry is
    // replaced by the new values.
    ResourceId Register(ResourceInfo info);
    ResourceId Register(std::string_view id);

    [[nodiscard]] std::optional<ResourceId> Find(std::string_view id) const;
    [[nodiscard]] bool Contains(std::string_view id) const { return Find(id).has_value(); }

    [[nodiscard]] bool Valid(ResourceId id) const noexcept { return id.value < m_infos.size(); }

    // Returns "" for ids this catalog did not issue.
    [[nodiscard]] const std::string& Name(ResourceId id) const noexcept;
    [[nodiscard]] const ResourceInfo* Info(ResourceId id) const noexcept;

    [[nodiscard]] std::size_t Count() const noexcept { return m_infos.size(); }
    [[nodiscard]] const std::vector<ResourceInfo>& All() const noexcept { return m_infos; }

    void Clear() noexcept;

private:
    std::vector<ResourceInfo> m_infos;
    std::unordered_map<std::string, ResourceId> m_byName;
};

// Resource name for log messages; "#<index>" when there is no catalog or the id is unknown.
[[nodiscard]] std::string ResourceLabel(const ResourceCatalog* catalog, ResourceId id);

} // namespace outpost::sim
