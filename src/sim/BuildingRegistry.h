#pragma once

#include "sim/Events.h"
#include "sim/PlacementValidator.h"
#include "sim/ResourceStorage.h"
#include "sim/StructureDefinition.h"
#include "sim/Types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace outpost::sim {

class OccupancyIndex;
class ITerrainOracle;
class ResourceCatalog;

enum class LifecycleState : std::uint8_t {
    UnderConstruction = 0,
    Operational,
};

[[nodiscard]] const char* LifecycleStateName(LifecycleState s) noexcept;
[[nodiscard]] bool LifecycleStateFromName(std::string_view name, LifecycleState& out) noexcept;

// Storage sizes for definitions without a storage block.
struct StorageDefaults {
    int inputCapacity  = 50;
    int outputCapacity = 50;
};

// One placed instance of a StructureDefinition.
struct PlacedStructure {
    StructureId id = kInvalidStructureId;
    const StructureDefinition* definition = nullptr;
    std::string definitionId;

    Cell anchor{};
    Rotation rotation = Rotation::R0;
    std::vector<Cell> cells; // resolved footprint, row-major

    LifecycleState state = LifecycleState::UnderConstruction;
    float constructionProgress = 0.0f; // [0, 1], never decreases; derived from constructionSeconds
    double constructionSeconds = 0.0;  // time spent under construction, capped at the definition's time

    ResourceStorage inputStorage;
    ResourceStorage outputStorage;

    std::uint64_t productionCycleCount = 0;
    double lastProductionTimestamp = 0.0; // sim seconds; meaningless while productionCycleCount == 0
    double operationSeconds = 0.0;
    double placedAtSeconds = 0.0;

    [[nodiscard]] bool operational() const noexcept { return state == LifecycleState::Operational; }
};

// Owns every placed structure and keeps the occupancy index in step with them.
//
// place() and demolish() are the only ways cells enter or leave the occupancy index, and
// each updates both sides in the same call. Records are visited in creation order; ids are
// never reused. Pointers returned by get() stay valid until that structure is demolished
// or the registry is cleared.
class BuildingRegistry {
public:
    BuildingRegistry(OccupancyIndex& occupancy,
                     const ITerrainOracle& terrain,
                     StorageDefaults defaults = {},
                     IEventSink* events = nullptr);

    BuildingRegistry(const BuildingRegistry&) = delete;
    BuildingRegistry& operator=(const BuildingRegistry&) = delete;

    // Validates and, on Ok, commits the placement. Nothing changes on rejection.
    PlacementResult place(const StructureDefinition& def,
                          Cell anchor,
                          Rotation rotation,
                          StructureId* outId = nullptr);

    // Live preview; same answer place() would give right now.
    [[nodiscard]] PlacementCheck preview(const StructureDefinition& def, Cell anchor, Rotation rotation) const;

    // Releases the footprint, then drops the record. Returns false for unknown ids.
    bool demolish(StructureId id);

    // Re-inserts a saved record. The footprint is recomputed from definition/anchor/rotation
    // and reserved all-or-nothing; every cell must be in bounds, terrain kinds are not re-checked.
    bool restore(PlacedStructure record, std::string* outError = nullptr);

    [[nodiscard]] PlacedStructure* get(StructureId id) noexcept;
    [[nodiscard]] const PlacedStructure* get(StructureId id) const noexcept;

    [[nodiscard]] const PlacedStructure* structureAt(Cell cell) const noexcept;

    [[nodiscard]] std::vector<const PlacedStructure*> all() const;
    [[nodiscard]] std::vector<const PlacedStructure*> allOperational() const;

    // Creation order. `fn` must not place or demolish.
    template <class Fn>
    void forEach(Fn&& fn)
    {
        for (auto& s : m_structures)
            fn(*s);
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_structures.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_structures.empty(); }
    [[nodiscard]] std::size_t operationalCount() const noexcept;

    // Host-side transfers (logistics, debug, tests). Non-positive amounts do nothing.
    // Whatever does not fit in input storage is discarded and logged.
    int deliverInput(StructureId id, ResourceId resource, int amount);
    int collectOutput(StructureId id, ResourceId resource, int amount);

    // Drops every record and releases every cell it held. No events.
    void clear() noexcept;

    // Simulation clock (advanced by ProductionScheduler).
    [[nodiscard]] double simSeconds() const noexcept { return m_simSeconds; }
    void advanceClock(double dt) noexcept { m_simSeconds += dt; }
    void setSimSeconds(double t) noexcept { m_simSeconds = t; }

    [[nodiscard]] StructureId nextId() const noexcept { return m_nextId; }
    // Never moves the counter backwards.
    void setNextId(StructureId next) noexcept { m_nextId = next > m_nextId ? next : m_nextId; }

    void setEventSink(IEventSink* events) noexcept { m_events = events; }
    [[nodiscard]] IEventSink* eventSink() const noexcept { return m_events; }

    // Only used to put resource names into log lines.
    void setResourceCatalog(const ResourceCatalog* resources) noexcept { m_resources = resources; }
    [[nodiscard]] const ResourceCatalog* resourceCatalog() const noexcept { return m_resources; }

    void setOverflowWarnings(bool enabled) noexcept { m_overflowWarnings = enabled; }
    [[nodiscard]] bool overflowWarnings() const noexcept { return m_overflowWarnings; }

    [[nodiscard]] const StorageDefaults& storageDefaults() const noexcept { return m_defaults; }
    [[nodiscard]] const OccupancyIndex& occupancy() const noexcept { return m_occupancy; }
    [[nodiscard]] const ITerrainOracle& terrain() const noexcept { return m_terrain; }

private:
    [[nodiscard]] StorageSpec storageFor(const StructureDefinition& def) const noexcept;

    OccupancyIndex& m_occupancy;
    const ITerrainOracle& m_terrain;
    StorageDefaults m_defaults;
    IEventSink* m_events = nullptr;
    const ResourceCatalog* m_resources = nullptr;
    bool m_overflowWarnings = true;

    std::vector<std::unique_ptr<PlacedStructure>> m_structures;
    std::unordered_map<StructureId, PlacedStructure*> m_byId;
    StructureId m_nextId = 1;
    double m_simSeconds = 0.0;
};

} // namespace outpost::sim
