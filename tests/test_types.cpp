#include <doctest/doctest.h>

#include "sim/Types.h"

using namespace outpost::sim;

TEST_CASE("RotationFromDegrees accepts multiples of 90 and wraps")
{
    Rotation r = Rotation::R0;
    CHECK(RotationFromDegrees(90, r));
    CHECK(r == Rotation::R90);
    CHECK(RotationFromDegrees(450, r));
    CHECK(r == Rotation::R90);
    CHECK(RotationFromDegrees(-90, r));
    CHECK(r == Rotation::R270);
    CHECK(RotationFromDegrees(0, r));
    CHECK(r == Rotation::R0);

    r = Rotation::R180;
    CHECK_FALSE(RotationFromDegrees(45, r));
    CHECK(r == Rotation::R180);
}

TEST_CASE("RotateClockwise cycles through all four rotations")
{
    CHECK(RotateClockwise(Rotation::R0) == Rotation::R90);
    CHECK(RotateClockwise(Rotation::R270) == Rotation::R0);
    CHECK(RotationDegrees(Rotation::R180) == 180);
    CHECK(RotationSwapsAxes(Rotation::R270));
    CHECK_FALSE(RotationSwapsAxes(Rotation::R180));
}

TEST_CASE("TerrainKind names round-trip case-insensitively")
{
    for (std::size_t i = 0; i < kTerrainKindCount; ++i)
    {
        const auto kind = static_cast<TerrainKind>(i);
        TerrainKind parsed = TerrainKind::Grass;
        REQUIRE(TerrainKindFromName(TerrainKindName(kind), parsed));
        CHECK(parsed == kind);
    }

    TerrainKind t = TerrainKind::Grass;
    CHECK(TerrainKindFromName("deepwater", t));
    CHECK(t == TerrainKind::DeepWater);
    CHECK_FALSE(TerrainKindFromName("Lava", t));
}

TEST_CASE("Cell ordering is row-major")
{
    CHECK(Cell{ 5, 0 } < Cell{ 0, 1 });
    CHECK(Cell{ 0, 1 } < Cell{ 1, 1 });
    CHECK_FALSE(Cell{ 1, 1 } < Cell{ 1, 1 });
    CHECK(CellHash{}(Cell{ 1, 2 }) != CellHash{}(Cell{ 2, 1 }));
}
