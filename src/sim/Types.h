#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

namespace outpost::sim {

// Integer grid cell (tile coordinates).
struct Cell {
    int x = 0;
    int y = 0;

    [[nodiscard]] friend constexpr bool operator==(const Cell& a, const Cell& b) noexcept
    {
        return a.x == b.x && a.y == b.y;
    }
    [[nodiscard]] friend constexpr bool operator!=(const Cell& a, const Cell& b) noexcept
    {
        return !(a == b);
    }
    // Row-major ordering (y, then x), matching footprint enumeration.
    [[nodiscard]] friend constexpr bool operator<(const Cell& a, const Cell& b) noexcept
    {
        return a.y < b.y || (a.y == b.y && a.x < b.x);
    }
};

struct CellHash {
    std::size_t operator()(const Cell& c) const noexcept
    {
        const std::uint64_t packed =
            (static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.x)) << 32) |
            static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.y));
        return std::hash<std::uint64_t>{}(packed);
    }
};

struct FootprintSize {
    int width  = 1;
    int height = 1;
};

enum class Rotation : std::uint8_t {
    R0 = 0,
    R90,
    R180,
    R270,
};

[[nodiscard]] constexpr int RotationDegrees(Rotation r) noexcept
{
    return static_cast<int>(r) * 90;
}

// Accepts any multiple of 90 (negative values and values >= 360 wrap).
[[nodiscard]] bool RotationFromDegrees(int degrees, Rotation& out) noexcept;

[[nodiscard]] constexpr Rotation RotateClockwise(Rotation r) noexcept
{
    return static_cast<Rotation>((static_cast<int>(r) + 1) % 4);
}

[[nodiscard]] constexpr bool RotationSwapsAxes(Rotation r) noexcept
{
    return r == Rotation::R90 || r == Rotation::R270;
}

// Terrain tile kinds reported by the world (see ITerrainOracle).
enum class TerrainKind : std::uint8_t {
    Grass = 0,
    Water,
    DeepWater,
    Beach,
    Mountain,
    Hills,
    Forest,
    Farmland,
    Dirt,
    Desert,
    Rail,
    Road,
};

inline constexpr std::size_t kTerrainKindCount = static_cast<std::size_t>(TerrainKind::Road) + 1u;

[[nodiscard]] const char* TerrainKindName(TerrainKind t) noexcept;

// Case-insensitive ("grass", "Grass", "DEEPWATER" ...).
[[nodiscard]] bool TerrainKindFromName(std::string_view name, TerrainKind& out) noexcept;

// Unique per placed structure; issued from 1 and never reused.
using StructureId = std::uint32_t;
inline constexpr StructureId kInvalidStructureId = 0;

// Interned resource identifier (see ResourceCatalog). Plain index, cheap to copy and compare.
struct ResourceId {
    std::uint16_t value = 0;

    [[nodiscard]] friend constexpr bool operator==(ResourceId a, ResourceId b) noexcept { return a.value == b.value; }
    [[nodiscard]] friend constexpr bool operator!=(ResourceId a, ResourceId b) noexcept { return a.value != b.value; }
    [[nodiscard]] friend constexpr bool operator<(ResourceId a, ResourceId b) noexcept { return a.value < b.value; }
};

struct ResourceAmount {
    ResourceId resource{};
    int amount = 0;

    [[nodiscard]] friend constexpr bool operator==(const ResourceAmount& a, const ResourceAmount& b) noexcept
    {
        return a.resource == b.resource && a.amount == b.amount;
    }
};

} // namespace outpost::sim
