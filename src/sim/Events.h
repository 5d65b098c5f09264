#pragma once

#include "sim/Types.h"

#include <string>
#include <vector>

namespace outpost::sim {

namespace evt {
    struct StructurePlaced            { StructureId id; Cell anchor; std::string definitionId; };
    struct StructureBecameOperational { StructureId id; };
    struct ProductionCycleCompleted   { StructureId id; std::vector<ResourceAmount> consumed; std::vector<ResourceAmount> produced; };
    struct StructureDemolished        { StructureId id; std::string definitionId; };
} // namespace evt

// Plain notifications out of the simulation. Delivered synchronously, in the order they
// happen; handlers must not call back into the registry or scheduler.
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void onStructurePlaced(const evt::StructurePlaced&) {}
    virtual void onStructureBecameOperational(const evt::StructureBecameOperational&) {}
    virtual void onProductionCycleCompleted(const evt::ProductionCycleCompleted&) {}
    virtual void onStructureDemolished(const evt::StructureDemolished&) {}
};

} // namespace outpost::sim
