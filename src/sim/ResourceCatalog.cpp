#include "sim/ResourceCatalog.h"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace outpost::sim {

ResourceId ResourceCatalog::Register(ResourceInfo info)
{
    auto it = m_byName.find(info.id);
    if (it != m_byName.end())
    {
        m_infos[it->second.value] = std::move(info);
        return it->second;
    }

    if (m_infos.size() >= std::numeric_limits<std::uint16_t>::max())
        throw std::length_error("ResourceCatalog: too many resource kinds");

    const ResourceId id{ static_cast<std::uint16_t>(m_infos.size()) };
    m_byName.emplace(info.id, id);
    m_infos.push_back(std::move(info));
    return id;
}

ResourceId ResourceCatalog::Register(std::string_view id)
{
    auto it = m_byName.find(std::string(id));
    if (it != m_byName.end())
        return it->second;

    ResourceInfo info;
    info.id = std::string(id);
    info.name = info.id;
    return Register(std::move(info));
}

std::optional<ResourceId> ResourceCatalog::Find(std::string_view id) const
{
    auto it = m_byName.find(std::string(id));
    if (it == m_byName.end())
        return std::nullopt;
    return it->second;
}

const std::string& ResourceCatalog::Name(ResourceId id) const noexcept
{
    static const std::string kEmpty;
    return Valid(id) ? m_infos[id.value].id : kEmpty;
}

const ResourceInfo* ResourceCatalog::Info(ResourceId id) const noexcept
{
    return Valid(id) ? &m_infos[id.value] : nullptr;
}

void ResourceCatalog::Clear() noexcept
{
    m_infos.clear();
    m_byName.clear();
}

std::string ResourceLabel(const ResourceCatalog* catalog, ResourceId id)
{
    if (catalog && catalog->Valid(id))
        return catalog->Name(id);
    return "#" + std::to_string(id.value);
}

} // namespace outpost::sim
