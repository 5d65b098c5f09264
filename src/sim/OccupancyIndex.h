#pragma once

#include "sim/Types.h"

#include <cstddef>
#include <span>
#include <unordered_map>

namespace outpost::sim {

// Authoritative cell -> structure map. The only thing placement collision is decided on.
//
// Mutated only through reserve()/release(). Each call is a single step: either every cell
// changes or none does. Not internally synchronized; the simulation runs on one thread and a
// threaded host must serialize reserve/release itself.
class OccupancyIndex {
public:
    [[nodiscard]] bool isFree(Cell cell) const noexcept;
    [[nodiscard]] bool isFree(std::span<const Cell> cells) const noexcept;

    // Returns kInvalidStructureId for free cells.
    [[nodiscard]] StructureId occupant(Cell cell) const noexcept;

    // Claims all cells for `id`. Re-checks isFree(cells) first and returns false, changing
    // nothing, if any cell is already taken.
    bool reserve(std::span<const Cell> cells, StructureId id);

    // Frees all cells (cells that are not occupied are ignored).
    void release(std::span<const Cell> cells) noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return m_cells.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_cells.empty(); }

    void clear() noexcept { m_cells.clear(); }

private:
    std::unordered_map<Cell, StructureId, CellHash> m_cells;
};

} // namespace outpost::sim
