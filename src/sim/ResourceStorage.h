#pragma once

#include "sim/Types.h"

#include <map>
#include <vector>

namespace outpost::sim {

// Bounded container of resource quantities (one structure's input or output buffer).
//
// Invariants:
//  - every stored amount is > 0 (removing down to zero erases the entry)
//  - usedCapacity() <= capacity()
class ResourceStorage {
public:
    ResourceStorage() = default;
    explicit ResourceStorage(int capacity) noexcept;

    // Adds up to `amount`, limited by free capacity. Returns what was actually stored;
    // the rest is discarded and it is up to the caller to report it.
    int add(ResourceId resource, int amount) noexcept;

    // Removes up to `amount`. Returns what was actually removed.
    int remove(ResourceId resource, int amount) noexcept;

    [[nodiscard]] bool has(ResourceId resource, int amount) const noexcept;
    [[nodiscard]] bool canAccept(ResourceId resource, int amount) const noexcept;

    [[nodiscard]] int amount(ResourceId resource) const noexcept;

    [[nodiscard]] int capacity() const noexcept { return m_capacity; }
    [[nodiscard]] int usedCapacity() const noexcept { return m_used; }
    [[nodiscard]] int freeCapacity() const noexcept { return m_capacity - m_used; }
    [[nodiscard]] float utilization() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return m_amounts.empty(); }

    // Ordered by ResourceId, so two storages holding the same things compare equal.
    [[nodiscard]] const std::map<ResourceId, int>& contents() const noexcept { return m_amounts; }
    [[nodiscard]] std::vector<ResourceAmount> snapshot() const;

    void clear() noexcept;

    [[nodiscard]] friend bool operator==(const ResourceStorage& a, const ResourceStorage& b) noexcept
    {
        return a.m_capacity == b.m_capacity && a.m_amounts == b.m_amounts;
    }
    [[nodiscard]] friend bool operator!=(const ResourceStorage& a, const ResourceStorage& b) noexcept
    {
        return !(a == b);
    }

private:
    int m_capacity = 0;
    int m_used = 0;
    std::map<ResourceId, int> m_amounts;
};

} // namespace outpost::sim
