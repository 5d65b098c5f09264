#include "sim/Footprint.h"

namespace outpost::sim {

std::vector<Cell> ResolveFootprint(Cell anchor, FootprintSize size, Rotation rotation)
{
    const FootprintSize eff = EffectiveSize(size, rotation);

    std::vector<Cell> cells;
    if (eff.width <= 0 || eff.height <= 0)
        return cells;

    cells.reserve(static_cast<std::size_t>(eff.width) * static_cast<std::size_t>(eff.height));
    for (int dy = 0; dy < eff.height; ++dy)
    {
        for (int dx = 0; dx < eff.width; ++dx)
            cells.push_back(Cell{ anchor.x + dx, anchor.y + dy });
    }
    return cells;
}

bool FootprintContains(Cell anchor, FootprintSize size, Rotation rotation, Cell cell) noexcept
{
    const FootprintSize eff = EffectiveSize(size, rotation);
    return cell.x >= anchor.x && cell.x < anchor.x + eff.width &&
           cell.y >= anchor.y && cell.y < anchor.y + eff.height;
}

} // namespace outpost::sim
