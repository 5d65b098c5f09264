#include "sim/BuildingRegistry.h"

#include "core/Log.h"
#include "sim/Footprint.h"
#include "sim/OccupancyIndex.h"
#include "sim/ResourceCatalog.h"
#include "sim/Terrain.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace outpost::sim {

namespace {

void SetError(std::string* outError, std::string msg)
{
    if (outError)
        *outError = std::move(msg);
}

} // namespace

const char* LifecycleStateName(LifecycleState s) noexcept
{
    switch (s)
    {
    case LifecycleState::UnderConstruction: return "UnderConstruction";
    case LifecycleState::Operational:       return "Operational";
    }
    return "Unknown";
}

bool LifecycleStateFromName(std::string_view name, LifecycleState& out) noexcept
{
    if (name == "UnderConstruction")
    {
        out = LifecycleState::UnderConstruction;
        return true;
    }
    if (name == "Operational")
    {
        out = LifecycleState::Operational;
        return true;
    }
    return false;
}

BuildingRegistry::BuildingRegistry(OccupancyIndex& occupancy,
                                   const ITerrainOracle& terrain,
                                   StorageDefaults defaults,
                                   IEventSink* events)
    : m_occupancy(occupancy)
    , m_terrain(terrain)
    , m_defaults(defaults)
    , m_events(events)
{
}

StorageSpec BuildingRegistry::storageFor(const StructureDefinition& def) const noexcept
{
    if (def.storage)
        return *def.storage;
    return StorageSpec{ m_defaults.inputCapacity, m_defaults.outputCapacity };
}

PlacementCheck BuildingRegistry::preview(const StructureDefinition& def, Cell anchor, Rotation rotation) const
{
    return PlacementValidator(m_occupancy).validate(def, anchor, rotation, m_terrain);
}

PlacementResult BuildingRegistry::place(const StructureDefinition& def,
                                        Cell anchor,
                                        Rotation rotation,
                                        StructureId* outId)
{
    PlacementCheck check = preview(def, anchor, rotation);
    if (!check.ok())
    {
        LOG_DEBUG("place %s at (%d,%d) rot %d rejected: %s at (%d,%d)",
                  def.id.c_str(), anchor.x, anchor.y, RotationDegrees(rotation),
                  PlacementResultName(check.result), check.failedCell.x, check.failedCell.y);
        return check.result;
    }

    const StructureId id = m_nextId;
    if (!m_occupancy.reserve(check.cells, id))
        return PlacementResult::Collision;
    ++m_nextId;

    const StorageSpec storage = storageFor(def);

    auto rec = std::make_unique<PlacedStructure>();
    rec->id = id;
    rec->definition = &def;
    rec->definitionId = def.id;
    rec->anchor = anchor;
    rec->rotation = rotation;
    rec->cells = std::move(check.cells);
    rec->inputStorage = ResourceStorage(storage.inputCapacity);
    rec->outputStorage = ResourceStorage(storage.outputCapacity);
    rec->placedAtSeconds = m_simSeconds;

    m_byId.emplace(id, rec.get());
    m_structures.push_back(std::move(rec));

    LOG_INFO("placed %s #%u at (%d,%d) rot %d", def.id.c_str(), id, anchor.x, anchor.y, RotationDegrees(rotation));

    if (outId)
        *outId = id;
    if (m_events)
        m_events->onStructurePlaced(evt::StructurePlaced{ id, anchor, def.id });
    return PlacementResult::Ok;
}

bool BuildingRegistry::demolish(StructureId id)
{
    auto it = std::find_if(m_structures.begin(), m_structures.end(),
                           [id](const std::unique_ptr<PlacedStructure>& s) { return s->id == id; });
    if (it == m_structures.end())
        return false;

    // Cells first: the index must never point at a record that is gone.
    m_occupancy.release((*it)->cells);

    std::string defId = std::move((*it)->definitionId);
    m_byId.erase(id);
    m_structures.erase(it);

    LOG_INFO("demolished %s #%u", defId.c_str(), id);

    if (m_events)
        m_events->onStructureDemolished(evt::StructureDemolished{ id, std::move(defId) });
    return true;
}

bool BuildingRegistry::restore(PlacedStructure record, std::string* outError)
{
    if (!record.definition)
    {
        SetError(outError, "structure #" + std::to_string(record.id) + ": missing definition");
        return false;
    }
    const StructureDefinition& def = *record.definition;

    if (record.id == kInvalidStructureId || m_byId.count(record.id) != 0)
    {
        SetError(outError, "structure #" + std::to_string(record.id) + ": invalid or duplicate id");
        return false;
    }

    if (!std::isfinite(record.constructionProgress) || record.constructionProgress < 0.0f ||
        record.constructionProgress > 1.0f)
    {
        SetError(outError, "structure #" + std::to_string(record.id) + ": constructionProgress out of range");
        return false;
    }
    const double duration = static_cast<double>(def.constructionTimeSeconds);
    if (!std::isfinite(record.constructionSeconds) || record.constructionSeconds < 0.0)
    {
        SetError(outError, "structure #" + std::to_string(record.id) + ": constructionSeconds out of range");
        return false;
    }
    if (record.state == LifecycleState::Operational)
    {
        record.constructionProgress = 1.0f;
        record.constructionSeconds = duration;
    }
    else
    {
        record.constructionSeconds = std::min(record.constructionSeconds, duration);
    }

    if (!def.placement.rotatable && record.rotation != Rotation::R0)
    {
        SetError(outError, "structure #" + std::to_string(record.id) + ": " + def.id + " cannot be rotated");
        return false;
    }

    // Storage is rebuilt at the definition's capacity; saved contents must fit.
    const StorageSpec storage = storageFor(def);
    ResourceStorage input(storage.inputCapacity);
    ResourceStorage output(storage.outputCapacity);
    for (const auto& [res, amount] : record.inputStorage.contents())
    {
        if (input.add(res, amount) != amount)
        {
            SetError(outError, "structure #" + std::to_string(record.id) + ": input storage over capacity");
            return false;
        }
    }
    for (const auto& [res, amount] : record.outputStorage.contents())
    {
        if (output.add(res, amount) != amount)
        {
            SetError(outError, "structure #" + std::to_string(record.id) + ": output storage over capacity");
            return false;
        }
    }

    std::vector<Cell> cells = ResolveFootprint(record.anchor, def.size, record.rotation);
    for (const Cell& c : cells)
    {
        if (!m_terrain.inBounds(c))
        {
            SetError(outError, "structure #" + std::to_string(record.id) + ": footprint cell (" +
                                   std::to_string(c.x) + "," + std::to_string(c.y) + ") is outside the world");
            return false;
        }
    }
    if (cells.empty() || !m_occupancy.reserve(cells, record.id))
    {
        SetError(outError, "structure #" + std::to_string(record.id) + ": footprint overlaps another structure");
        return false;
    }

    auto rec = std::make_unique<PlacedStructure>(std::move(record));
    rec->definitionId = def.id;
    rec->cells = std::move(cells);
    rec->inputStorage = std::move(input);
    rec->outputStorage = std::move(output);

    m_nextId = std::max(m_nextId, rec->id + 1);
    m_byId.emplace(rec->id, rec.get());
    m_structures.push_back(std::move(rec));
    return true;
}

PlacedStructure* BuildingRegistry::get(StructureId id) noexcept
{
    auto it = m_byId.find(id);
    return it != m_byId.end() ? it->second : nullptr;
}

const PlacedStructure* BuildingRegistry::get(StructureId id) const noexcept
{
    auto it = m_byId.find(id);
    return it != m_byId.end() ? it->second : nullptr;
}

const PlacedStructure* BuildingRegistry::structureAt(Cell cell) const noexcept
{
    return get(m_occupancy.occupant(cell));
}

std::vector<const PlacedStructure*> BuildingRegistry::all() const
{
    std::vector<const PlacedStructure*> out;
    out.reserve(m_structures.size());
    for (const auto& s : m_structures)
        out.push_back(s.get());
    return out;
}

std::vector<const PlacedStructure*> BuildingRegistry::allOperational() const
{
    std::vector<const PlacedStructure*> out;
    for (const auto& s : m_structures)
    {
        if (s->operational())
            out.push_back(s.get());
    }
    return out;
}

std::size_t BuildingRegistry::operationalCount() const noexcept
{
    return static_cast<std::size_t>(std::count_if(m_structures.begin(), m_structures.end(),
                                                   [](const std::unique_ptr<PlacedStructure>& s) { return s->operational(); }));
}

int BuildingRegistry::deliverInput(StructureId id, ResourceId resource, int amount)
{
    PlacedStructure* s = get(id);
    if (!s || amount <= 0)
        return 0;

    const int added = s->inputStorage.add(resource, amount);
    if (added < amount && m_overflowWarnings)
    {
        LOG_WARN("%s #%u: input storage full, discarded %d %s",
                 s->definitionId.c_str(), id, amount - added, ResourceLabel(m_resources, resource).c_str());
    }
    return added;
}

int BuildingRegistry::collectOutput(StructureId id, ResourceId resource, int amount)
{
    PlacedStructure* s = get(id);
    if (!s || amount <= 0)
        return 0;
    return s->outputStorage.remove(resource, amount);
}

void BuildingRegistry::clear() noexcept
{
    for (const auto& s : m_structures)
        m_occupancy.release(s->cells);
    m_byId.clear();
    m_structures.clear();
    m_nextId = 1;
    m_simSeconds = 0.0;
}

} // namespace outpost::sim
