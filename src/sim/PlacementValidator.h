#pragma once

#include "sim/StructureDefinition.h"
#include "sim/Types.h"

#include <cstdint>
#include <vector>

namespace outpost::sim {

class OccupancyIndex;
class ITerrainOracle;

enum class PlacementResult : std::uint8_t {
    Ok = 0,
    RotationNotAllowed,
    OutOfBounds,
    Collision,
    ForbiddenTerrain,
    TerrainNotAllowed,
};

[[nodiscard]] const char* PlacementResultName(PlacementResult r) noexcept;

struct PlacementCheck {
    PlacementResult result = PlacementResult::Ok;

    // First cell that failed (only meaningful for per-cell rejections).
    Cell failedCell{};

    // Resolved footprint (filled whenever the rotation rule passed).
    std::vector<Cell> cells;

    [[nodiscard]] bool ok() const noexcept { return result == PlacementResult::Ok; }
};

// Decides whether a structure may be placed. Never mutates anything, so it can be called
// every frame for a live preview and returns the same answer until the world changes.
//
// Rules, in order:
//   1. a non-rotatable definition only accepts Rotation::R0
//   2. per footprint cell (row-major): in bounds, unoccupied, terrain not forbidden,
//      terrain in the allowed list (if the list is non-empty)
class PlacementValidator {
public:
    explicit PlacementValidator(const OccupancyIndex& occupancy) noexcept
        : m_occupancy(occupancy)
    {
    }

    [[nodiscard]] PlacementCheck validate(const StructureDefinition& def,
                                          Cell anchor,
                                          Rotation rotation,
                                          const ITerrainOracle& terrain) const;

    // Terrain rule alone, for one terrain kind.
    [[nodiscard]] static PlacementResult CheckTerrain(const PlacementRules& rules, TerrainKind kind) noexcept;

private:
    const OccupancyIndex& m_occupancy;
};

} // namespace outpost::sim
