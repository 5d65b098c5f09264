#include <doctest/doctest.h>

#include "sim/BuildingRegistry.h"
#include "sim/Events.h"
#include "sim/OccupancyIndex.h"
#include "sim/ProductionScheduler.h"
#include "sim/Terrain.h"

#include "test_support/SimFixture.h"

#include <cmath>
#include <limits>
#include <vector>

using namespace outpost;
using namespace outpost::sim;

namespace {

struct CycleLog final : IEventSink {
    std::vector<StructureId> operational;
    std::vector<evt::ProductionCycleCompleted> cycles;

    void onStructureBecameOperational(const evt::StructureBecameOperational& e) override { operational.push_back(e.id); }
    void onProductionCycleCompleted(const evt::ProductionCycleCompleted& e) override { cycles.push_back(e); }
};

} // namespace

TEST_CASE("ProductionScheduler::ProducedAmount floors amount * rate * efficiency")
{
    CHECK(ProductionScheduler::ProducedAmount(1, 1.2f, 0.95f) == 1);
    CHECK(ProductionScheduler::ProducedAmount(2, 1.2f, 0.95f) == 2);
    CHECK(ProductionScheduler::ProducedAmount(10, 1.2f, 0.95f) == 11);
    CHECK(ProductionScheduler::ProducedAmount(3, 1.0f, 1.0f) == 3);
    CHECK(ProductionScheduler::ProducedAmount(1, 0.5f, 1.0f) == 0);
    CHECK(ProductionScheduler::ProducedAmount(4, 1.0f, 0.0f) == 0);
    CHECK(ProductionScheduler::ProducedAmount(5, 0.0f, 1.0f) == 0);
}

TEST_CASE("ProductionScheduler::ProducedAmount saturates instead of overflowing")
{
    constexpr int kMax = std::numeric_limits<int>::max();
    CHECK(ProductionScheduler::ProducedAmount(1000, 1e7f, 1.0f) == kMax);
    CHECK(ProductionScheduler::ProducedAmount(kMax, 2.0f, 1.0f) == kMax);
    CHECK(ProductionScheduler::ProducedAmount(1, std::numeric_limits<float>::infinity(), 1.0f) == kMax);
    CHECK(ProductionScheduler::ProducedAmount(1, std::numeric_limits<float>::quiet_NaN(), 1.0f) == 0);
    CHECK(ProductionScheduler::ProducedAmount(1 << 30, 1.0f, 1.0f) == (1 << 30));
}

TEST_CASE_FIXTURE(test::SimFixture, "ProductionScheduler runs one all-or-nothing cycle per tick")
{
    const StructureId id = PlaceOperational(foodFactory, { 2, 2 });
    REQUIRE(id != kInvalidStructureId);
    PlacedStructure& s = *registry.get(id);

    SUBCASE("enough input: two grain become one food")
    {
        s.inputStorage.add(grain, 5);

        const TickReport r = scheduler.tick(1.0);
        CHECK(r.cyclesCompleted == 1);
        CHECK(s.inputStorage.amount(grain) == 3);
        CHECK(s.outputStorage.amount(food) == 1);
        CHECK(s.productionCycleCount == 1);
        CHECK(s.lastProductionTimestamp == doctest::Approx(1.0));

        scheduler.tick(1.0);
        scheduler.tick(1.0);
        CHECK(s.inputStorage.amount(grain) == 1);
        CHECK(s.outputStorage.amount(food) == 2);
        CHECK(s.productionCycleCount == 2);
        CHECK(s.lastProductionTimestamp == doctest::Approx(2.0));
    }

    SUBCASE("missing input: nothing changes")
    {
        s.inputStorage.add(grain, 1);

        const TickReport r = scheduler.tick(1.0);
        CHECK(r.cyclesCompleted == 0);
        CHECK(r.skippedMissingInput == 1);
        CHECK(s.inputStorage.amount(grain) == 1);
        CHECK(s.outputStorage.empty());
        CHECK(s.productionCycleCount == 0);
    }

    SUBCASE("full output: inputs are not consumed")
    {
        s.inputStorage.add(grain, 10);
        s.outputStorage.add(iron, s.outputStorage.capacity());

        const TickReport r = scheduler.tick(1.0);
        CHECK(r.cyclesCompleted == 0);
        CHECK(r.skippedOutputFull == 1);
        CHECK(s.inputStorage.amount(grain) == 10);
        CHECK(s.outputStorage.amount(food) == 0);
        CHECK(s.productionCycleCount == 0);
    }
}

TEST_CASE_FIXTURE(test::SimFixture, "ProductionScheduler requires every input of a multi-input recipe")
{
    StructureDefinition smelter = test::MakeDef("smelter", 2, 2);
    smelter.production = ProductionSpec{ { { iron, 2 }, { grain, 1 } }, { { food, 1 } }, 1.0f, 1.0f };

    const StructureId id = PlaceOperational(smelter, { 0, 0 });
    REQUIRE(id != kInvalidStructureId);
    PlacedStructure& s = *registry.get(id);
    s.inputStorage.add(iron, 5);

    scheduler.tick(1.0);
    CHECK(s.inputStorage.amount(iron) == 5);
    CHECK(s.productionCycleCount == 0);

    s.inputStorage.add(grain, 1);
    scheduler.tick(1.0);
    CHECK(s.inputStorage.amount(iron) == 3);
    CHECK(s.inputStorage.amount(grain) == 0);
    CHECK(s.outputStorage.amount(food) == 1);
}

TEST_CASE_FIXTURE(test::SimFixture, "ProductionScheduler discards scaled output that does not fit")
{
    StructureDefinition mill = test::MakeDef("mill", 1, 1);
    mill.production = ProductionSpec{ { { grain, 1 } }, { { food, 2 } }, 3.0f, 1.0f };
    mill.storage = StorageSpec{ 10, 10 };

    const StructureId id = PlaceOperational(mill, { 0, 0 });
    REQUIRE(id != kInvalidStructureId);
    PlacedStructure& s = *registry.get(id);
    s.inputStorage.add(grain, 1);
    s.outputStorage.add(food, 6);

    const TickReport r = scheduler.tick(1.0);
    CHECK(r.cyclesCompleted == 1);
    CHECK(r.overflowDiscarded == 2);
    CHECK(s.outputStorage.amount(food) == 10);
    CHECK(s.outputStorage.usedCapacity() <= s.outputStorage.capacity());
}

TEST_CASE_FIXTURE(test::SimFixture, "ProductionScheduler advances construction until the structure is operational")
{
    CycleLog log;
    registry.setEventSink(&log);

    StructureId id = kInvalidStructureId;
    REQUIRE(registry.place(foodFactory, { 4, 4 }, Rotation::R0, &id) == PlacementResult::Ok);
    PlacedStructure& s = *registry.get(id);
    s.inputStorage.add(grain, 10);

    float last = 0.0f;
    for (int i = 0; i < 4; ++i)
    {
        const TickReport r = scheduler.tick(1.0);
        CHECK(r.constructionAdvanced == 1);
        CHECK(s.constructionProgress > last);
        last = s.constructionProgress;
        CHECK_FALSE(s.operational());
    }
    CHECK(s.constructionProgress == doctest::Approx(0.8f));

    // The tick that completes construction does not also produce.
    const TickReport done = scheduler.tick(1.0);
    CHECK(done.becameOperational == 1);
    CHECK(done.cyclesCompleted == 0);
    CHECK(s.operational());
    CHECK(s.constructionProgress == 1.0f);
    CHECK(s.productionCycleCount == 0);
    CHECK(s.inputStorage.amount(grain) == 10);

    const TickReport next = scheduler.tick(1.0);
    CHECK(next.becameOperational == 0);
    CHECK(next.cyclesCompleted == 1);
    CHECK(s.constructionProgress == 1.0f);

    REQUIRE(log.operational.size() == 1);
    CHECK(log.operational[0] == id);
    REQUIRE(log.cycles.size() == 1);
    REQUIRE(log.cycles[0].consumed.size() == 1);
    CHECK(log.cycles[0].consumed[0] == ResourceAmount{ grain, 2 });
    REQUIRE(log.cycles[0].produced.size() == 1);
    CHECK(log.cycles[0].produced[0] == ResourceAmount{ food, 1 });
}

TEST_CASE("ProductionScheduler completes construction on the tick its time is reached")
{
    const auto ticksToOperational = [](float constructionTime, double dt) {
        TerrainGrid terrain(8, 8);
        OccupancyIndex occ;
        BuildingRegistry registry(occ, terrain);
        ProductionScheduler scheduler(registry);
        StructureDefinition def = test::MakeDef("hut", 1, 1);
        def.constructionTimeSeconds = constructionTime;

        StructureId id = kInvalidStructureId;
        REQUIRE(registry.place(def, { 0, 0 }, Rotation::R0, &id) == PlacementResult::Ok);
        int ticks = 0;
        while (!registry.get(id)->operational() && ticks < 10000)
        {
            scheduler.tick(dt);
            ++ticks;
        }
        return ticks;
    };

    CHECK(ticksToOperational(6.0f, 0.5) == 12);
    CHECK(ticksToOperational(4.0f, 0.1) == 40);
    CHECK(ticksToOperational(5.0f, 1.0) == 5);

    int mismatches = 0;
    for (int ct = 1; ct <= 200; ++ct)
    {
        for (const double dt : { 1.0, 0.5, 0.25, 0.1 })
        {
            const int expected = static_cast<int>(std::lround(ct / dt));
            if (ticksToOperational(static_cast<float>(ct), dt) != expected)
                ++mismatches;
        }
    }
    CHECK(mismatches == 0);
}

TEST_CASE_FIXTURE(test::SimFixture, "ProductionScheduler construction progress stays below one until completion")
{
    StructureDefinition slow = test::MakeDef("slow", 1, 1);
    slow.constructionTimeSeconds = 3.0f;

    StructureId id = kInvalidStructureId;
    REQUIRE(registry.place(slow, { 0, 0 }, Rotation::R0, &id) == PlacementResult::Ok);
    const PlacedStructure& s = *registry.get(id);

    scheduler.tick(1.0);
    CHECK(s.constructionSeconds == doctest::Approx(1.0));
    CHECK(s.constructionProgress == doctest::Approx(1.0f / 3.0f));
    scheduler.tick(1.0);
    CHECK(s.constructionProgress < 1.0f);
    CHECK_FALSE(s.operational());
    scheduler.tick(1.0);
    CHECK(s.operational());
    CHECK(s.constructionProgress == 1.0f);
    CHECK(s.constructionSeconds == doctest::Approx(3.0));
}

TEST_CASE_FIXTURE(test::SimFixture, "ProductionScheduler clamps construction progress on a long tick")
{
    StructureId id = kInvalidStructureId;
    REQUIRE(registry.place(depot, { 0, 0 }, Rotation::R0, &id) == PlacementResult::Ok);

    const TickReport r = scheduler.tick(60.0);
    CHECK(r.becameOperational == 1);
    CHECK(registry.get(id)->constructionProgress == 1.0f);
}

TEST_CASE_FIXTURE(test::SimFixture, "ProductionScheduler ignores non-positive and non-finite dt")
{
    const StructureId id = PlaceOperational(foodFactory, { 0, 0 });
    REQUIRE(id != kInvalidStructureId);
    registry.get(id)->inputStorage.add(grain, 4);

    for (const double dt : { 0.0, -1.0, std::numeric_limits<double>::quiet_NaN(),
                             std::numeric_limits<double>::infinity() })
    {
        const TickReport r = scheduler.tick(dt);
        CHECK(r.cyclesCompleted == 0);
        CHECK(r.constructionAdvanced == 0);
    }

    CHECK(scheduler.tickCount() == 0);
    CHECK(scheduler.simSeconds() == 0.0);
    CHECK(registry.get(id)->inputStorage.amount(grain) == 4);
}

TEST_CASE_FIXTURE(test::SimFixture, "ProductionScheduler visits structures in creation order")
{
    CycleLog log;
    registry.setEventSink(&log);

    std::vector<StructureId> ids;
    for (int i = 0; i < 4; ++i)
    {
        const StructureId id = PlaceOperational(foodFactory, { i * 3, 0 });
        REQUIRE(id != kInvalidStructureId);
        registry.get(id)->inputStorage.add(grain, 2);
        ids.push_back(id);
    }

    scheduler.tick(1.0);
    REQUIRE(log.cycles.size() == ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i)
        CHECK(log.cycles[i].id == ids[i]);
}

TEST_CASE_FIXTURE(test::SimFixture, "ProductionScheduler leaves structures without production alone")
{
    const StructureId id = PlaceOperational(depot, { 0, 0 });
    REQUIRE(id != kInvalidStructureId);
    registry.get(id)->inputStorage.add(grain, 3);

    const TickReport r = scheduler.tick(2.0);
    CHECK(r.cyclesCompleted == 0);
    CHECK(r.skippedMissingInput == 0);
    CHECK(registry.get(id)->inputStorage.amount(grain) == 3);
    CHECK(registry.get(id)->operationSeconds == doctest::Approx(2.0));
    CHECK(scheduler.simSeconds() == doctest::Approx(2.0));
    CHECK(scheduler.tickCount() == 1);
}
