#pragma once

#include "sim/Types.h"

#include <optional>
#include <string>
#include <vector>

namespace outpost::sim {

struct PlacementRules {
    // Empty = any terrain not in forbiddenTerrain.
    std::vector<TerrainKind> allowedTerrain;
    std::vector<TerrainKind> forbiddenTerrain;
    bool rotatable = true;

    // False for map-generated industries (farms, mines); listed but not offered to players.
    bool buildable = true;
};

struct ProductionSpec {
    std::vector<ResourceAmount> inputs;
    std::vector<ResourceAmount> outputs;
    float rate = 1.0f;
    float efficiency = 1.0f; // [0, 1]
};

struct StorageSpec {
    int inputCapacity = 50;
    int outputCapacity = 50;
};

// Immutable description of a structure type. Owned by the definition catalog for the
// lifetime of the process; placed structures point at it.
//
// What a structure does is decided by which optional blocks are present, not by type.
struct StructureDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string category; // "production", "transport", "city", "resource"

    FootprintSize size{};
    int cost = 0;
    float constructionTimeSeconds = 5.0f;

    PlacementRules placement{};
    std::optional<ProductionSpec> production;
    std::optional<StorageSpec> storage;

    [[nodiscard]] bool producesAnything() const noexcept
    {
        return production.has_value() && (!production->inputs.empty() || !production->outputs.empty());
    }
};

} // namespace outpost::sim
