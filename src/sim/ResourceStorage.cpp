#include "sim/ResourceStorage.h"

#include <algorithm>

namespace outpost::sim {

ResourceStorage::ResourceStorage(int capacity) noexcept
    : m_capacity(std::max(0, capacity))
{
}

int ResourceStorage::add(ResourceId resource, int amount) noexcept
{
    if (amount <= 0)
        return 0;

    const int added = std::max(0, std::min(amount, freeCapacity()));
    if (added == 0)
        return 0;

    m_amounts[resource] += added;
    m_used += added;
    return added;
}

int ResourceStorage::remove(ResourceId resource, int amount) noexcept
{
    if (amount <= 0)
        return 0;

    auto it = m_amounts.find(resource);
    if (it == m_amounts.end())
        return 0;

    const int removed = std::min(amount, it->second);
    it->second -= removed;
    m_used -= removed;

    if (it->second <= 0)
        m_amounts.erase(it);

    return removed;
}

bool ResourceStorage::has(ResourceId resource, int amount) const noexcept
{
    return amount >= 0 && this->amount(resource) >= amount;
}

bool ResourceStorage::canAccept(ResourceId /*resource*/, int amount) const noexcept
{
    // Capacity is shared by all resource kinds.
    return amount <= m_capacity - m_used;
}

int ResourceStorage::amount(ResourceId resource) const noexcept
{
    auto it = m_amounts.find(resource);
    return it != m_amounts.end() ? it->second : 0;
}

float ResourceStorage::utilization() const noexcept
{
    if (m_capacity <= 0)
        return 0.0f;
    return static_cast<float>(m_used) / static_cast<float>(m_capacity);
}

std::vector<ResourceAmount> ResourceStorage::snapshot() const
{
    std::vector<ResourceAmount> out;
    out.reserve(m_amounts.size());
    for (const auto& [id, n] : m_amounts)
        out.push_back(ResourceAmount{ id, n });
    return out;
}

void ResourceStorage::clear() noexcept
{
    m_amounts.clear();
    m_used = 0;
}

} // namespace outpost::sim
