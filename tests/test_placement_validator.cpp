#include <doctest/doctest.h>

#include "sim/OccupancyIndex.h"
#include "sim/PlacementValidator.h"
#include "sim/Terrain.h"

#include "test_support/SimFixture.h"

#include <vector>

using namespace outpost;
using namespace outpost::sim;

TEST_CASE("PlacementValidator accepts a clear site and returns its footprint")
{
    TerrainGrid terrain(16, 16);
    OccupancyIndex occ;
    const StructureDefinition def = test::MakeDef("hut", 2, 2);

    const PlacementCheck check = PlacementValidator(occ).validate(def, { 5, 5 }, Rotation::R0, terrain);
    CHECK(check.ok());
    CHECK(check.cells == std::vector<Cell>{ { 5, 5 }, { 6, 5 }, { 5, 6 }, { 6, 6 } });
    CHECK(occ.empty());
}

TEST_CASE("PlacementValidator rejects rotation for non-rotatable definitions before anything else")
{
    TerrainGrid terrain(4, 4);
    OccupancyIndex occ;
    StructureDefinition def = test::MakeDef("mine", 2, 2);
    def.placement.rotatable = false;

    // Out of bounds too, but the rotation rule is checked first.
    CHECK(PlacementValidator(occ).validate(def, { 10, 10 }, Rotation::R90, terrain).result ==
          PlacementResult::RotationNotAllowed);
    CHECK(PlacementValidator(occ).validate(def, { 0, 0 }, Rotation::R0, terrain).ok());
}

TEST_CASE("PlacementValidator reports OutOfBounds with the first failing cell")
{
    TerrainGrid terrain(8, 8);
    OccupancyIndex occ;
    const StructureDefinition def = test::MakeDef("long", 3, 1);

    const PlacementCheck check = PlacementValidator(occ).validate(def, { 6, 2 }, Rotation::R0, terrain);
    CHECK(check.result == PlacementResult::OutOfBounds);
    CHECK(check.failedCell == Cell{ 8, 2 });

    // Rotated it fits vertically.
    CHECK(PlacementValidator(occ).validate(def, { 6, 2 }, Rotation::R90, terrain).ok());
    CHECK(PlacementValidator(occ).validate(def, { -1, 0 }, Rotation::R0, terrain).result ==
          PlacementResult::OutOfBounds);
}

TEST_CASE("PlacementValidator terrain rules: forbidden wins over allowed, empty allowed means any")
{
    TerrainGrid terrain(8, 8);
    terrain.set({ 1, 1 }, TerrainKind::Water);
    terrain.set({ 4, 4 }, TerrainKind::Desert);
    OccupancyIndex occ;

    StructureDefinition def = test::MakeDef("pad", 1, 1);
    def.placement.allowedTerrain = { TerrainKind::Grass, TerrainKind::Water };
    def.placement.forbiddenTerrain = { TerrainKind::Water };

    const PlacementValidator v(occ);
    CHECK(v.validate(def, { 1, 1 }, Rotation::R0, terrain).result == PlacementResult::ForbiddenTerrain);
    CHECK(v.validate(def, { 4, 4 }, Rotation::R0, terrain).result == PlacementResult::TerrainNotAllowed);
    CHECK(v.validate(def, { 2, 2 }, Rotation::R0, terrain).ok());

    def.placement.allowedTerrain.clear();
    CHECK(v.validate(def, { 4, 4 }, Rotation::R0, terrain).ok());
    CHECK(PlacementValidator::CheckTerrain(def.placement, TerrainKind::Water) == PlacementResult::ForbiddenTerrain);
}

TEST_CASE("PlacementValidator reports Collision against reserved cells")
{
    TerrainGrid terrain(16, 16);
    OccupancyIndex occ;
    REQUIRE(occ.reserve(std::vector<Cell>{ { 6, 6 } }, 1));

    const StructureDefinition def = test::MakeDef("hut", 2, 2);
    const PlacementCheck check = PlacementValidator(occ).validate(def, { 5, 5 }, Rotation::R0, terrain);
    CHECK(check.result == PlacementResult::Collision);
    CHECK(check.failedCell == Cell{ 6, 6 });
}

TEST_CASE("PlacementValidator is idempotent")
{
    TerrainGrid terrain(16, 16);
    terrain.fillRect({ 0, 0 }, 16, 2, TerrainKind::Mountain);
    OccupancyIndex occ;
    StructureDefinition def = test::MakeDef("hut", 2, 3);
    def.placement.forbiddenTerrain = { TerrainKind::Mountain };

    const PlacementValidator v(occ);
    for (int y = 0; y < 4; ++y)
    {
        const PlacementCheck first = v.validate(def, { 3, y }, Rotation::R90, terrain);
        for (int i = 0; i < 3; ++i)
        {
            const PlacementCheck again = v.validate(def, { 3, y }, Rotation::R90, terrain);
            CHECK(again.result == first.result);
            CHECK(again.failedCell == first.failedCell);
            CHECK(again.cells == first.cells);
        }
    }
    CHECK(occ.empty());
}

TEST_CASE("PlacementResultName covers every result")
{
    CHECK(std::string(PlacementResultName(PlacementResult::Ok)) == "Ok");
    CHECK(std::string(PlacementResultName(PlacementResult::Collision)) == "Collision");
    CHECK(std::string(PlacementResultName(PlacementResult::TerrainNotAllowed)) == "TerrainNotAllowed");
}
