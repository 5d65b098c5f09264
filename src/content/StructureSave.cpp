#include "content/StructureSave.h"

#include "content/DefinitionCatalog.h"
#include "content/SaveFormat.h"
#include "core/FileIO.h"
#include "core/Log.h"
#include "sim/BuildingRegistry.h"
#include "sim/ResourceCatalog.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace outpost::content {

namespace {

using json = nlohmann::json;

[[nodiscard]] bool IsNumber(const json& v) noexcept
{
    return v.is_number_integer() || v.is_number_unsigned() || v.is_number_float();
}

[[nodiscard]] double ObjDouble(const json& obj, const char* key, double def) noexcept
{
    if (!obj.is_object())
        return def;
    auto it = obj.find(key);
    if (it == obj.end() || !IsNumber(*it))
        return def;
    const double d = it->get<double>();
    return std::isfinite(d) ? d : def;
}

// Integral fields only; floats and out-of-range values are rejected rather than truncated.
[[nodiscard]] bool ObjInt64(const json& obj, const char* key, std::int64_t& out) noexcept
{
    if (!obj.is_object())
        return false;
    auto it = obj.find(key);
    if (it == obj.end())
        return false;
    if (it->is_number_integer())
    {
        out = it->get<std::int64_t>();
        return true;
    }
    if (it->is_number_unsigned())
    {
        const auto u = it->get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return false;
        out = static_cast<std::int64_t>(u);
        return true;
    }
    return false;
}

[[nodiscard]] bool ObjInt(const json& obj, const char* key, int& out) noexcept
{
    std::int64_t v = 0;
    if (!ObjInt64(obj, key, v) || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return false;
    out = static_cast<int>(v);
    return true;
}

[[nodiscard]] json StorageToJson(const sim::ResourceStorage& storage, const sim::ResourceCatalog& resources)
{
    json out = json::object();
    for (const auto& [res, amount] : storage.contents())
        out[sim::ResourceLabel(&resources, res)] = amount;
    return out;
}

// Fills a staging storage; capacity is checked later by BuildingRegistry::restore.
[[nodiscard]] bool StorageFromJson(const json& obj,
                                   const sim::ResourceCatalog& resources,
                                   sim::ResourceStorage& out,
                                   std::string& err)
{
    if (obj.is_null())
        return true;
    if (!obj.is_object())
    {
        err = "storage must be an object";
        return false;
    }

    for (auto it = obj.begin(); it != obj.end(); ++it)
    {
        const auto id = resources.Find(it.key());
        if (!id)
        {
            err = "unknown resource '" + it.key() + "'";
            return false;
        }
        if (!it->is_number_integer() && !it->is_number_unsigned())
        {
            err = "amount of '" + it.key() + "' must be an integer";
            return false;
        }
        const std::int64_t amount = it->get<std::int64_t>();
        if (amount <= 0 || amount > std::numeric_limits<int>::max() ||
            out.add(*id, static_cast<int>(amount)) != static_cast<int>(amount))
        {
            err = "amount of '" + it.key() + "' out of range";
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool StructureFromJson(const json& j,
                                     const DefinitionCatalog& definitions,
                                     const sim::ResourceCatalog& resources,
                                     sim::PlacedStructure& out,
                                     std::string& err)
{
    if (!j.is_object())
    {
        err = "structure entry must be an object";
        return false;
    }

    std::int64_t id = 0;
    if (!ObjInt64(j, "id", id) || id <= 0 || id > std::numeric_limits<sim::StructureId>::max())
    {
        err = "structure has no valid id";
        return false;
    }
    out.id = static_cast<sim::StructureId>(id);
    const std::string at = "structure #" + std::to_string(out.id) + ": ";

    auto defIt = j.find("definitionId");
    if (defIt == j.end() || !defIt->is_string())
    {
        err = at + "missing definitionId";
        return false;
    }
    out.definition = definitions.Find(defIt->get<std::string>());
    if (!out.definition)
    {
        err = at + "unknown definition '" + defIt->get<std::string>() + "'";
        return false;
    }
    out.definitionId = out.definition->id;

    auto anchorIt = j.find("anchor");
    if (anchorIt == j.end() || !ObjInt(*anchorIt, "x", out.anchor.x) || !ObjInt(*anchorIt, "y", out.anchor.y))
    {
        err = at + "invalid anchor";
        return false;
    }

    int degrees = 0;
    if (!ObjInt(j, "rotation", degrees) || !sim::RotationFromDegrees(degrees, out.rotation))
    {
        err = at + "invalid rotation";
        return false;
    }

    auto stateIt = j.find("state");
    if (stateIt == j.end() || !stateIt->is_string() ||
        !sim::LifecycleStateFromName(stateIt->get<std::string>(), out.state))
    {
        err = at + "invalid state";
        return false;
    }

    out.constructionProgress = static_cast<float>(ObjDouble(j, "constructionProgress", 0.0));
    // Older files carry only the progress fraction.
    out.constructionSeconds = ObjDouble(j, "constructionSeconds",
                                        static_cast<double>(out.constructionProgress) *
                                            static_cast<double>(out.definition->constructionTimeSeconds));

    std::int64_t cycles = 0;
    if (j.contains("productionCycleCount") && (!ObjInt64(j, "productionCycleCount", cycles) || cycles < 0))
    {
        err = at + "invalid productionCycleCount";
        return false;
    }
    out.productionCycleCount = static_cast<std::uint64_t>(cycles);
    out.lastProductionTimestamp = ObjDouble(j, "lastProductionTimestamp", 0.0);
    out.operationSeconds = ObjDouble(j, "operationSeconds", 0.0);
    out.placedAtSeconds = ObjDouble(j, "placedAtSeconds", 0.0);

    out.inputStorage = sim::ResourceStorage(std::numeric_limits<int>::max());
    out.outputStorage = sim::ResourceStorage(std::numeric_limits<int>::max());

    std::string storageErr;
    if (!StorageFromJson(j.value("input", json{}), resources, out.inputStorage, storageErr))
    {
        err = at + "input " + storageErr;
        return false;
    }
    if (!StorageFromJson(j.value("output", json{}), resources, out.outputStorage, storageErr))
    {
        err = at + "output " + storageErr;
        return false;
    }
    return true;
}

} // namespace

json RegistryToJson(const sim::BuildingRegistry& registry, const sim::ResourceCatalog& resources)
{
    json j;
    j["format"] = savefmt::kStructuresFormat;
    j["version"] = savefmt::kStructuresVersion;
    j["simSeconds"] = registry.simSeconds();
    j["nextId"] = registry.nextId();

    json structures = json::array();
    structures.get_ref<json::array_t&>().reserve(registry.size());
    for (const sim::PlacedStructure* s : registry.all())
    {
        structures.push_back({
            {"id", s->id},
            {"definitionId", s->definitionId},
            {"anchor", { {"x", s->anchor.x}, {"y", s->anchor.y} }},
            {"rotation", sim::RotationDegrees(s->rotation)},
            {"state", sim::LifecycleStateName(s->state)},
            {"constructionProgress", s->constructionProgress},
            {"constructionSeconds", s->constructionSeconds},
            {"productionCycleCount", s->productionCycleCount},
            {"lastProductionTimestamp", s->lastProductionTimestamp},
            {"operationSeconds", s->operationSeconds},
            {"placedAtSeconds", s->placedAtSeconds},
            {"input", StorageToJson(s->inputStorage, resources)},
            {"output", StorageToJson(s->outputStorage, resources)},
        });
    }
    j["structures"] = std::move(structures);
    return j;
}

bool RegistryFromJson(const json& doc,
                      sim::BuildingRegistry& registry,
                      const DefinitionCatalog& definitions,
                      const sim::ResourceCatalog& resources,
                      std::string* outError) noexcept
{
    registry.clear();

    auto fail = [&](std::string msg) {
        registry.clear();
        if (outError) *outError = std::move(msg);
        return false;
    };

    try
    {
        if (!doc.is_object())
            return fail("Structure save is not a JSON object.");

        auto fmtIt = doc.find("format");
        if (fmtIt == doc.end() || !fmtIt->is_string() || fmtIt->get<std::string>() != savefmt::kStructuresFormat)
            return fail("Unsupported save format.");

        int version = 0;
        if (!ObjInt(doc, "version", version) || version < 1 || version > savefmt::kStructuresVersion)
            return fail("Unsupported save version.");

        auto listIt = doc.find("structures");
        if (listIt == doc.end() || !listIt->is_array())
            return fail("Structure save has no 'structures' array.");

        for (const json& entry : *listIt)
        {
            sim::PlacedStructure record;
            std::string err;
            if (!StructureFromJson(entry, definitions, resources, record, err))
                return fail(err);
            if (!registry.restore(std::move(record), &err))
                return fail(err);
        }

        std::int64_t nextId = 0;
        if (ObjInt64(doc, "nextId", nextId) && nextId > 0 && nextId <= std::numeric_limits<sim::StructureId>::max())
            registry.setNextId(static_cast<sim::StructureId>(nextId));

        const double simSeconds = ObjDouble(doc, "simSeconds", 0.0);
        registry.setSimSeconds(simSeconds >= 0.0 ? simSeconds : 0.0);

        LOG_INFO("restored %zu structures (sim time %.1fs)", registry.size(), registry.simSeconds());
        return true;
    }
    catch (const std::exception& e)
    {
        return fail(std::string("Structure save: ") + e.what());
    }
}

bool SaveRegistryJson(const std::filesystem::path& path,
                      const sim::BuildingRegistry& registry,
                      const sim::ResourceCatalog& resources,
                      std::string* outError) noexcept
{
    try
    {
        const std::string text = RegistryToJson(registry, resources).dump(2);
        if (!core::WriteFileAtomic(path, text, outError))
        {
            LOG_ERROR("saving structures to %s failed", path.string().c_str());
            return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
}

bool LoadRegistryJson(const std::filesystem::path& path,
                      sim::BuildingRegistry& registry,
                      const DefinitionCatalog& definitions,
                      const sim::ResourceCatalog& resources,
                      std::string* outError) noexcept
{
    try
    {
        std::string bytes;
        if (!core::ReadFileToString(path, bytes, outError))
        {
            registry.clear();
            return false;
        }

        const json doc = json::parse(bytes, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
        if (doc.is_discarded())
        {
            registry.clear();
            if (outError) *outError = "Structure save is not valid JSON.";
            return false;
        }

        return RegistryFromJson(doc, registry, definitions, resources, outError);
    }
    catch (const std::exception& e)
    {
        registry.clear();
        if (outError) *outError = e.what();
        return false;
    }
}

} // namespace outpost::content
