#include "sim/Terrain.h"

#include <algorithm>

namespace outpost::sim {

TerrainGrid::TerrainGrid(int w, int h, TerrainKind fillWith)
{
    reset(w, h, fillWith);
}

void TerrainGrid::reset(int w, int h, TerrainKind fillWith)
{
    m_w = std::max(0, w);
    m_h = std::max(0, h);
    m_tiles.assign(static_cast<std::size_t>(m_w) * static_cast<std::size_t>(m_h), fillWith);
}

bool TerrainGrid::inBounds(Cell cell) const noexcept
{
    return cell.x >= 0 && cell.y >= 0 && cell.x < m_w && cell.y < m_h;
}

TerrainKind TerrainGrid::terrainAt(Cell cell) const noexcept
{
    if (!inBounds(cell))
        return TerrainKind::Grass;
    return m_tiles[idx(cell)];
}

void TerrainGrid::set(Cell cell, TerrainKind kind) noexcept
{
    if (inBounds(cell))
        m_tiles[idx(cell)] = kind;
}

void TerrainGrid::fill(TerrainKind kind) noexcept
{
    std::fill(m_tiles.begin(), m_tiles.end(), kind);
}

void TerrainGrid::fillRect(Cell origin, int w, int h, TerrainKind kind) noexcept
{
    const int x0 = std::max(0, origin.x);
    const int y0 = std::max(0, origin.y);
    const int x1 = std::min(m_w, origin.x + w);
    const int y1 = std::min(m_h, origin.y + h);

    for (int y = y0; y < y1; ++y)
    {
        for (int x = x0; x < x1; ++x)
            m_tiles[idx(Cell{ x, y })] = kind;
    }
}

} // namespace outpost::sim
