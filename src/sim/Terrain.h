#pragma once

#include "sim/Types.h"

#include <cstddef>
#include <vector>

namespace outpost::sim {

// What placement needs to know about the world. Implemented by the host's terrain/world
// system; the simulation never generates or edits terrain itself.
class ITerrainOracle {
public:
    virtual ~ITerrainOracle() = default;

    [[nodiscard]] virtual bool inBounds(Cell cell) const = 0;

    // Only called for in-bounds cells.
    [[nodiscard]] virtual TerrainKind terrainAt(Cell cell) const = 0;
};

// Flat width x height terrain array. Useful for tools, tests and hosts that keep their map
// as a plain grid.
class TerrainGrid final : public ITerrainOracle {
public:
    TerrainGrid() = default;
    TerrainGrid(int w, int h, TerrainKind fillWith = TerrainKind::Grass);

    void reset(int w, int h, TerrainKind fillWith = TerrainKind::Grass);

    [[nodiscard]] int width() const noexcept { return m_w; }
    [[nodiscard]] int height() const noexcept { return m_h; }

    [[nodiscard]] bool inBounds(Cell cell) const noexcept override;
    [[nodiscard]] TerrainKind terrainAt(Cell cell) const noexcept override;

    // Out-of-bounds writes are ignored.
    void set(Cell cell, TerrainKind kind) noexcept;
    void fill(TerrainKind kind) noexcept;
    void fillRect(Cell origin, int w, int h, TerrainKind kind) noexcept;

private:
    [[nodiscard]] std::size_t idx(Cell c) const noexcept
    {
        return static_cast<std::size_t>(c.y) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(c.x);
    }

    int m_w = 0;
    int m_h = 0;
    std::vector<TerrainKind> m_tiles;
};

} // namespace outpost::sim
