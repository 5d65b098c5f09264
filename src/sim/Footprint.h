#pragma once

#include "sim/Types.h"

#include <vector>

namespace outpost::sim {

// Footprints are axis-aligned rectangles anchored at their top-left cell.
// A quarter turn (90 / 270 degrees) swaps width and height; the anchor does not move.

[[nodiscard]] constexpr FootprintSize EffectiveSize(FootprintSize size, Rotation rotation) noexcept
{
    return RotationSwapsAxes(rotation) ? FootprintSize{ size.height, size.width } : size;
}

// Cells covered by a structure, row-major (x fastest, then y).
// Sizes <= 0 are a caller error and yield an empty footprint.
[[nodiscard]] std::vector<Cell> ResolveFootprint(Cell anchor, FootprintSize size, Rotation rotation);

[[nodiscard]] bool FootprintContains(Cell anchor, FootprintSize size, Rotation rotation, Cell cell) noexcept;

} // namespace outpost::sim
