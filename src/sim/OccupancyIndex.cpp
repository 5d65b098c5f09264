#include "sim/OccupancyIndex.h"

namespace outpost::sim {

bool OccupancyIndex::isFree(Cell cell) const noexcept
{
    return m_cells.find(cell) == m_cells.end();
}

bool OccupancyIndex::isFree(std::span<const Cell> cells) const noexcept
{
    for (const Cell& c : cells)
    {
        if (!isFree(c))
            return false;
    }
    return true;
}

StructureId OccupancyIndex::occupant(Cell cell) const noexcept
{
    auto it = m_cells.find(cell);
    return it != m_cells.end() ? it->second : kInvalidStructureId;
}

bool OccupancyIndex::reserve(std::span<const Cell> cells, StructureId id)
{
    if (id == kInvalidStructureId || !isFree(cells))
        return false;

    // Grow first so the inserts below cannot fail halfway.
    m_cells.reserve(m_cells.size() + cells.size());
    for (const Cell& c : cells)
        m_cells.emplace(c, id);
    return true;
}

void OccupancyIndex::release(std::span<const Cell> cells) noexcept
{
    for (const Cell& c : cells)
        m_cells.erase(c);
}

} // namespace outpost::sim
