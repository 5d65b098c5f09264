#include "sim/Types.h"

#include <array>
#include <cctype>

namespace outpost::sim {

namespace {

constexpr std::array<const char*, kTerrainKindCount> kTerrainNames = {
    "Grass",
    "Water",
    "DeepWater",
    "Beach",
    "Mountain",
    "Hills",
    "Forest",
    "Farmland",
    "Dirt",
    "Desert",
    "Rail",
    "Road",
};

[[nodiscard]] bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

} // namespace

bool RotationFromDegrees(int degrees, Rotation& out) noexcept
{
    if (degrees % 90 != 0)
        return false;

    int steps = (degrees / 90) % 4;
    if (steps < 0)
        steps += 4;

    out = static_cast<Rotation>(steps);
    return true;
}

const char* TerrainKindName(TerrainKind t) noexcept
{
    const auto i = static_cast<std::size_t>(t);
    return i < kTerrainNames.size() ? kTerrainNames[i] : "Unknown";
}

bool TerrainKindFromName(std::string_view name, TerrainKind& out) noexcept
{
    for (std::size_t i = 0; i < kTerrainNames.size(); ++i)
    {
        if (EqualsI(name, kTerrainNames[i]))
        {
            out = static_cast<TerrainKind>(i);
            return true;
        }
    }
    return false;
}

} // namespace outpost::sim
