#include <doctest/doctest.h>

#include "sim/DispatcherEventSink.h"

#include "test_support/SimFixture.h"

#include <entt/entt.hpp>

#include <vector>

using namespace outpost;
using namespace outpost::sim;

namespace {

struct Listener {
    std::vector<StructureId> placed;
    std::vector<StructureId> operational;
    std::vector<StructureId> demolished;
    int cycles = 0;
    int foodProduced = 0;
    ResourceId food{};

    void onPlaced(const evt::StructurePlaced& e) { placed.push_back(e.id); }
    void onOperational(const evt::StructureBecameOperational& e) { operational.push_back(e.id); }
    void onDemolished(const evt::StructureDemolished& e) { demolished.push_back(e.id); }
    void onCycle(const evt::ProductionCycleCompleted& e)
    {
        ++cycles;
        for (const ResourceAmount& out : e.produced)
        {
            if (out.resource == food)
                foodProduced += out.amount;
        }
    }
};

} // namespace

TEST_CASE_FIXTURE(test::SimFixture, "DispatcherEventSink forwards simulation events to entt::dispatcher listeners")
{
    entt::dispatcher dispatcher;
    DispatcherEventSink sink{ dispatcher };
    registry.setEventSink(&sink);

    Listener listener;
    listener.food = food;
    dispatcher.sink<evt::StructurePlaced>().connect<&Listener::onPlaced>(listener);
    dispatcher.sink<evt::StructureBecameOperational>().connect<&Listener::onOperational>(listener);
    dispatcher.sink<evt::ProductionCycleCompleted>().connect<&Listener::onCycle>(listener);
    dispatcher.sink<evt::StructureDemolished>().connect<&Listener::onDemolished>(listener);

    StructureId id = kInvalidStructureId;
    REQUIRE(registry.place(foodFactory, { 1, 1 }, Rotation::R0, &id) == PlacementResult::Ok);
    registry.get(id)->inputStorage.add(grain, 4);

    for (int i = 0; i < 7; ++i)
        scheduler.tick(1.0);

    CHECK(listener.placed == std::vector<StructureId>{ id });
    CHECK(listener.operational == std::vector<StructureId>{ id });
    CHECK(listener.cycles == 2);
    CHECK(listener.foodProduced == 2);

    // A rejected placement emits nothing.
    CHECK(registry.place(foodFactory, { 2, 2 }, Rotation::R0) == PlacementResult::Collision);
    CHECK(listener.placed.size() == 1);

    CHECK(registry.demolish(id));
    CHECK(listener.demolished == std::vector<StructureId>{ id });

    dispatcher.sink<evt::StructurePlaced>().disconnect(listener);
    CHECK(registry.place(foodFactory, { 1, 1 }, Rotation::R0) == PlacementResult::Ok);
    CHECK(listener.placed.size() == 1);
}
