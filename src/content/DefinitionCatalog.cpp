#include "content/DefinitionCatalog.h"

#include "core/FileIO.h"
#include "core/Log.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <utility>

#include <nlohmann/json.hpp>

namespace outpost::content {

namespace {

using json = nlohmann::json;
using sim::StructureDefinition;

// Largest footprint edge a definition may declare.
constexpr int kMaxFootprintEdge = 10;

[[nodiscard]] bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

[[nodiscard]] bool IsBlank(const std::string& s) noexcept
{
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// Parse helpers throw ParseError with a message naming the offending field; the public
// entry points turn it into *outError.
struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

[[noreturn]] void Fail(const std::string& where, const std::string& what)
{
    throw ParseError(where + ": " + what);
}

[[nodiscard]] const json* Member(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    return &*it;
}

[[nodiscard]] std::string ReqString(const json& obj, const char* key, const std::string& where)
{
    const json* v = Member(obj, key);
    if (!v || !v->is_string())
        Fail(where, std::string("'") + key + "' must be a string");
    std::string s = v->get<std::string>();
    if (IsBlank(s))
        Fail(where, std::string("'") + key + "' must not be empty");
    return s;
}

[[nodiscard]] std::string OptString(const json& obj, const char* key, const std::string& where,
                                    const std::string& def = {})
{
    const json* v = Member(obj, key);
    if (!v)
        return def;
    if (!v->is_string())
        Fail(where, std::string("'") + key + "' must be a string");
    return v->get<std::string>();
}

[[nodiscard]] int ReqInt(const json& obj, const char* key, const std::string& where)
{
    const json* v = Member(obj, key);
    if (!v || !(v->is_number_integer() || v->is_number_unsigned()))
        Fail(where, std::string("'") + key + "' must be an integer");
    if (v->is_number_unsigned() && v->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
        Fail(where, std::string("'") + key + "' is too large");
    if (v->is_number_integer())
    {
        const auto i = v->get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max())
            Fail(where, std::string("'") + key + "' is out of range");
    }
    return v->get<int>();
}

[[nodiscard]] int OptInt(const json& obj, const char* key, const std::string& where, int def)
{
    return Member(obj, key) ? ReqInt(obj, key, where) : def;
}

[[nodiscard]] float OptFloat(const json& obj, const char* key, const std::string& where, float def)
{
    const json* v = Member(obj, key);
    if (!v)
        return def;
    if (!v->is_number())
        Fail(where, std::string("'") + key + "' must be a number");
    const double d = v->get<double>();
    if (!std::isfinite(d))
        Fail(where, std::string("'") + key + "' must be finite");
    return static_cast<float>(d);
}

[[nodiscard]] bool OptBool(const json& obj, const char* key, const std::string& where, bool def)
{
    const json* v = Member(obj, key);
    if (!v)
        return def;
    if (!v->is_boolean())
        Fail(where, std::string("'") + key + "' must be true or false");
    return v->get<bool>();
}

[[nodiscard]] const json& ReqObject(const json& obj, const char* key, const std::string& where)
{
    const json* v = Member(obj, key);
    if (!v || !v->is_object())
        Fail(where, std::string("'") + key + "' must be an object");
    return *v;
}

[[nodiscard]] std::vector<sim::TerrainKind> TerrainList(const json& obj, const char* key, const std::string& where,
                                                        std::vector<sim::TerrainKind> def)
{
    const json* v = Member(obj, key);
    if (!v)
        return def;
    if (!v->is_array())
        Fail(where, std::string("'") + key + "' must be an array of terrain names");

    std::vector<sim::TerrainKind> out;
    for (const json& e : *v)
    {
        if (!e.is_string())
            Fail(where, std::string("'") + key + "' must be an array of terrain names");
        sim::TerrainKind kind{};
        const std::string name = e.get<std::string>();
        if (!sim::TerrainKindFromName(name, kind))
            Fail(where, std::string("'") + key + "' names unknown terrain '" + name + "'");
        if (std::find(out.begin(), out.end(), kind) == out.end())
            out.push_back(kind);
    }
    return out;
}

[[nodiscard]] std::vector<sim::ResourceAmount> ResourceList(const json& obj, const char* key, const std::string& where,
                                                            const sim::ResourceCatalog& resources)
{
    const json* v = Member(obj, key);
    if (!v)
        return {};
    if (!v->is_array())
        Fail(where, std::string("'") + key + "' must be an array");

    std::vector<sim::ResourceAmount> out;
    for (std::size_t i = 0; i < v->size(); ++i)
    {
        const json& e = (*v)[i];
        const std::string at = where + "." + key + "[" + std::to_string(i) + "]";
        if (!e.is_object())
            Fail(at, "must be an object");

        const std::string name = ReqString(e, "resource_type", at);
        const auto id = resources.Find(name);
        if (!id)
            Fail(at, "unknown resource '" + name + "'");

        const int amount = ReqInt(e, "amount", at);
        if (amount <= 0)
            Fail(at, "'amount' must be positive");

        for (const sim::ResourceAmount& prev : out)
        {
            if (prev.resource == *id)
                Fail(at, "resource '" + name + "' listed twice");
        }
        out.push_back(sim::ResourceAmount{ *id, amount });
    }
    return out;
}

[[nodiscard]] StructureDefinition ParseDefinition(const json& j, std::size_t index,
                                                  const sim::ResourceCatalog& resources)
{
    std::string where = "definition[" + std::to_string(index) + "]";
    if (!j.is_object())
        Fail(where, "must be an object");

    StructureDefinition def;
    def.id = ReqString(j, "id", where);
    where = "'" + def.id + "'";

    def.name = ReqString(j, "name", where);
    def.description = OptString(j, "description", where);
    def.category = ReqString(j, "category", where);

    const json& size = ReqObject(j, "size", where);
    def.size.width = ReqInt(size, "width", where + ".size");
    def.size.height = ReqInt(size, "height", where + ".size");
    if (def.size.width < 1 || def.size.width > kMaxFootprintEdge ||
        def.size.height < 1 || def.size.height > kMaxFootprintEdge)
    {
        Fail(where + ".size", "width and height must be within 1.." + std::to_string(kMaxFootprintEdge));
    }
    const std::string shape = OptString(size, "shape", where + ".size", "rectangle");
    if (!EqualsI(shape, "rectangle"))
        Fail(where + ".size", "unsupported shape '" + shape + "' (only \"rectangle\")");

    def.cost = ReqInt(j, "cost", where);
    if (def.cost <= 0)
        Fail(where, "'cost' must be positive");

    def.constructionTimeSeconds = OptFloat(j, "construction_time", where, 5.0f);
    if (!(def.constructionTimeSeconds > 0.0f))
        Fail(where, "'construction_time' must be positive");

    def.placement.rotatable = OptBool(j, "rotation_allowed", where, true);

    if (const json* rules = Member(j, "placement_rules"))
    {
        if (!rules->is_object())
            Fail(where, "'placement_rules' must be an object");
        const std::string at = where + ".placement_rules";
        def.placement.allowedTerrain = TerrainList(*rules, "allowed_terrain", at, { sim::TerrainKind::Grass });
        def.placement.forbiddenTerrain = TerrainList(*rules, "forbidden_terrain", at,
                                                     { sim::TerrainKind::Water, sim::TerrainKind::Mountain });
        def.placement.buildable = OptBool(*rules, "buildable", at, true);
    }
    else
    {
        def.placement.allowedTerrain = { sim::TerrainKind::Grass };
        def.placement.forbiddenTerrain = { sim::TerrainKind::Water, sim::TerrainKind::Mountain };
    }

    if (const json* prod = Member(j, "production"))
    {
        if (!prod->is_object())
            Fail(where, "'production' must be an object");
        const std::string at = where + ".production";

        sim::ProductionSpec spec;
        spec.inputs = ResourceList(*prod, "input_resources", at, resources);
        spec.outputs = ResourceList(*prod, "output_resources", at, resources);
        spec.rate = OptFloat(*prod, "production_rate", at, 1.0f);
        spec.efficiency = OptFloat(*prod, "efficiency", at, 1.0f);
        if (spec.rate < 0.0f)
            Fail(at, "'production_rate' must not be negative");
        if (spec.efficiency < 0.0f || spec.efficiency > 1.0f)
            Fail(at, "'efficiency' must be within 0..1");
        for (const sim::ResourceAmount& out : spec.outputs)
        {
            const double perCycle = static_cast<double>(out.amount) * static_cast<double>(spec.rate) *
                                    static_cast<double>(spec.efficiency);
            if (perCycle > static_cast<double>(std::numeric_limits<int>::max()))
                Fail(at, "output per cycle (amount x production_rate x efficiency) is too large");
        }
        def.production = std::move(spec);
    }

    if (const json* storage = Member(j, "storage"))
    {
        if (!storage->is_object())
            Fail(where, "'storage' must be an object");
        const std::string at = where + ".storage";

        sim::StorageSpec spec;
        spec.inputCapacity = OptInt(*storage, "input_capacity", at, spec.inputCapacity);
        spec.outputCapacity = OptInt(*storage, "output_capacity", at, spec.outputCapacity);
        if (spec.inputCapacity < 0 || spec.outputCapacity < 0)
            Fail(at, "capacities must not be negative");
        def.storage = spec;
    }

    return def;
}

[[nodiscard]] bool ParseDocument(std::string_view text, json& out, std::string* outError)
{
    out = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (out.is_discarded())
    {
        if (outError) *outError = "Not valid JSON.";
        return false;
    }
    if (!out.is_array() && !out.is_object())
    {
        if (outError) *outError = "Expected a JSON array or object.";
        return false;
    }
    if (out.is_object())
    {
        json arr = json::array();
        arr.push_back(std::move(out));
        out = std::move(arr);
    }
    return true;
}

[[nodiscard]] std::vector<std::filesystem::path> JsonFilesIn(const std::filesystem::path& dir, std::error_code& ec)
{
    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const auto& entry = *it;
        std::error_code fileEc;
        if (entry.is_regular_file(fileEc) && entry.path().extension() == ".json")
            files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

bool LoadResourceDefinitionsJson(std::string_view text, sim::ResourceCatalog& out, std::string* outError) noexcept
{
    try
    {
        json doc;
        if (!ParseDocument(text, doc, outError))
            return false;

        std::vector<sim::ResourceInfo> infos;
        std::unordered_set<std::string> seen;
        for (std::size_t i = 0; i < doc.size(); ++i)
        {
            const json& j = doc[i];
            std::string where = "resource[" + std::to_string(i) + "]";
            if (!j.is_object())
                Fail(where, "must be an object");

            sim::ResourceInfo info;
            info.id = ReqString(j, "id", where);
            where = "'" + info.id + "'";
            info.name = ReqString(j, "name", where);
            info.description = OptString(j, "description", where);
            info.category = ReqString(j, "category", where);
            info.baseValue = OptInt(j, "base_value", where, info.baseValue);
            info.stackSize = OptInt(j, "stack_size", where, info.stackSize);
            if (info.baseValue <= 0)
                Fail(where, "'base_value' must be positive");
            if (info.stackSize <= 0)
                Fail(where, "'stack_size' must be positive");
            if (!seen.insert(info.id).second)
                Fail(where, "duplicate resource id");

            infos.push_back(std::move(info));
        }

        for (auto& info : infos)
            (void)out.Register(std::move(info));

        LOG_DEBUG("registered %zu resource definitions (%zu total)", doc.size(), out.Count());
        return true;
    }
    catch (const ParseError& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = std::string("Resource definitions: ") + e.what();
        return false;
    }
}

bool LoadResourceDefinitionsFile(const std::filesystem::path& path, sim::ResourceCatalog& out, std::string* outError) noexcept
{
    std::string text;
    if (!core::ReadFileToString(path, text, outError))
        return false;

    std::string err;
    if (!LoadResourceDefinitionsJson(text, out, &err))
    {
        if (outError) *outError = path.filename().string() + ": " + err;
        return false;
    }
    return true;
}

bool DefinitionCatalog::LoadFromJson(std::string_view text, const sim::ResourceCatalog& resources, std::string* outError) noexcept
{
    try
    {
        json doc;
        if (!ParseDocument(text, doc, outError))
            return false;

        std::vector<std::unique_ptr<StructureDefinition>> parsed;
        parsed.reserve(doc.size());
        std::unordered_set<std::string> seen;

        for (std::size_t i = 0; i < doc.size(); ++i)
        {
            auto def = std::make_unique<StructureDefinition>(ParseDefinition(doc[i], i, resources));
            if (m_byId.count(def->id) != 0 || !seen.insert(def->id).second)
                Fail("'" + def->id + "'", "duplicate definition id");
            parsed.push_back(std::move(def));
        }

        m_defs.reserve(m_defs.size() + parsed.size());
        m_byId.reserve(m_byId.size() + parsed.size());
        for (auto& def : parsed)
        {
            m_byId.emplace(def->id, def.get());
            m_defs.push_back(std::move(def));
        }
        return true;
    }
    catch (const ParseError& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = std::string("Structure definitions: ") + e.what();
        return false;
    }
}

bool DefinitionCatalog::LoadFile(const std::filesystem::path& path, const sim::ResourceCatalog& resources, std::string* outError) noexcept
{
    std::string text;
    if (!core::ReadFileToString(path, text, outError))
        return false;

    std::string err;
    if (!LoadFromJson(text, resources, &err))
    {
        if (outError) *outError = path.filename().string() + ": " + err;
        return false;
    }
    return true;
}

bool DefinitionCatalog::LoadDirectory(const std::filesystem::path& dir, const sim::ResourceCatalog& resources, std::string* outError) noexcept
{
    try
    {
        std::error_code ec;
        const auto files = JsonFilesIn(dir, ec);
        if (ec)
        {
            if (outError) *outError = "Cannot list '" + dir.string() + "': " + ec.message();
            return false;
        }

        for (const auto& file : files)
        {
            if (!LoadFile(file, resources, outError))
                return false;
        }

        LOG_INFO("loaded %zu structure definitions from %s", m_defs.size(), dir.string().c_str());
        return true;
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
}

const StructureDefinition* DefinitionCatalog::Find(std::string_view id) const
{
    auto it = m_byId.find(std::string(id));
    return it != m_byId.end() ? it->second : nullptr;
}

std::vector<std::string> DefinitionCatalog::Ids() const
{
    std::vector<std::string> out;
    out.reserve(m_defs.size());
    for (const auto& d : m_defs)
        out.push_back(d->id);
    return out;
}

std::vector<std::string> DefinitionCatalog::Categories() const
{
    std::set<std::string> cats;
    for (const auto& d : m_defs)
        cats.insert(d->category);
    return { cats.begin(), cats.end() };
}

std::vector<const StructureDefinition*> DefinitionCatalog::ByCategory(std::string_view category) const
{
    std::vector<const StructureDefinition*> out;
    for (const auto& d : m_defs)
    {
        if (EqualsI(d->category, category))
            out.push_back(d.get());
    }
    return out;
}

std::vector<const StructureDefinition*> DefinitionCatalog::Buildable() const
{
    std::vector<const StructureDefinition*> out;
    for (const auto& d : m_defs)
    {
        if (d->placement.buildable)
            out.push_back(d.get());
    }
    std::stable_sort(out.begin(), out.end(), [](const StructureDefinition* a, const StructureDefinition* b) {
        if (a->category != b->category)
            return a->category < b->category;
        return a->cost < b->cost;
    });
    return out;
}

void DefinitionCatalog::Clear() noexcept
{
    m_byId.clear();
    m_defs.clear();
}

} // namespace outpost::content
