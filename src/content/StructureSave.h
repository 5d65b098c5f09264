#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace outpost::sim {
class BuildingRegistry;
class ResourceCatalog;
} // namespace outpost::sim

namespace outpost::content {

class DefinitionCatalog;

// Snapshot of every placed structure plus the simulation clock.
[[nodiscard]] nlohmann::json RegistryToJson(const sim::BuildingRegistry& registry,
                                            const sim::ResourceCatalog& resources);

// Replaces the registry's contents with the document's. On any error the registry is left
// empty and *outError says why.
bool RegistryFromJson(const nlohmann::json& doc,
                      sim::BuildingRegistry& registry,
                      const DefinitionCatalog& definitions,
                      const sim::ResourceCatalog& resources,
                      std::string* outError = nullptr) noexcept;

bool SaveRegistryJson(const std::filesystem::path& path,
                      const sim::BuildingRegistry& registry,
                      const sim::ResourceCatalog& resources,
                      std::string* outError = nullptr) noexcept;

bool LoadRegistryJson(const std::filesystem::path& path,
                      sim::BuildingRegistry& registry,
                      const DefinitionCatalog& definitions,
                      const sim::ResourceCatalog& resources,
                      std::string* outError = nullptr) noexcept;

} // namespace outpost::content
