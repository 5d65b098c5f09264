#include "sim/PlacementValidator.h"

#include "sim/Footprint.h"
#include "sim/OccupancyIndex.h"
#include "sim/Terrain.h"

#include <algorithm>

namespace outpost::sim {

const char* PlacementResultName(PlacementResult r) noexcept
{
    switch (r)
    {
    case PlacementResult::Ok:                 return "Ok";
    case PlacementResult::RotationNotAllowed: return "RotationNotAllowed";
    case PlacementResult::OutOfBounds:        return "OutOfBounds";
    case PlacementResult::Collision:          return "Collision";
    case PlacementResult::ForbiddenTerrain:   return "ForbiddenTerrain";
    case PlacementResult::TerrainNotAllowed:  return "TerrainNotAllowed";
    }
    return "Unknown";
}

PlacementResult PlacementValidator::CheckTerrain(const PlacementRules& rules, TerrainKind kind) noexcept
{
    const auto& forbidden = rules.forbiddenTerrain;
    if (std::find(forbidden.begin(), forbidden.end(), kind) != forbidden.end())
        return PlacementResult::ForbiddenTerrain;

    const auto& allowed = rules.allowedTerrain;
    if (!allowed.empty() && std::find(allowed.begin(), allowed.end(), kind) == allowed.end())
        return PlacementResult::TerrainNotAllowed;

    return PlacementResult::Ok;
}

PlacementCheck PlacementValidator::validate(const StructureDefinition& def,
                                            Cell anchor,
                                            Rotation rotation,
                                            const ITerrainOracle& terrain) const
{
    PlacementCheck check{};

    if (!def.placement.rotatable && rotation != Rotation::R0)
    {
        check.result = PlacementResult::RotationNotAllowed;
        check.failedCell = anchor;
        return check;
    }

    check.cells = ResolveFootprint(anchor, def.size, rotation);
    if (check.cells.empty())
    {
        // Degenerate size. Catalog loading rejects these.
        check.result = PlacementResult::OutOfBounds;
        check.failedCell = anchor;
        return check;
    }

    for (const Cell& c : check.cells)
    {
        PlacementResult r = PlacementResult::Ok;

        if (!terrain.inBounds(c))
            r = PlacementResult::OutOfBounds;
        else if (!m_occupancy.isFree(c))
            r = PlacementResult::Collision;
        else
            r = CheckTerrain(def.placement, terrain.terrainAt(c));

        if (r != PlacementResult::Ok)
        {
            check.result = r;
            check.failedCell = c;
            return check;
        }
    }

    return check;
}

} // namespace outpost::sim
