// tools/outpost_sim/outpost_sim_main.cpp
//
// Headless driver for the structure simulation:
//   - loads outpost.ini, resource and structure definitions
//   - builds a flat terrain grid and applies a JSON scenario (terrain rects, placements,
//     input deliveries)
//   - runs N production ticks and prints a per-structure status report
//   - optionally saves (and/or starts from) a structure save file

#include "content/DefinitionCatalog.h"
#include "content/StructureSave.h"
#include "core/Config.h"
#include "core/FileIO.h"
#include "core/Log.h"
#include "sim/BuildingRegistry.h"
#include "sim/DispatcherEventSink.h"
#include "sim/OccupancyIndex.h"
#include "sim/ProductionClock.h"
#include "sim/ProductionScheduler.h"
#include "sim/ResourceCatalog.h"
#include "sim/Terrain.h"

#include <entt/entt.hpp>
#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdio>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace outpost;
using json = nlohmann::json;
using std::string;

// --- utilities ---------------------------------------------------------------

static std::map<string, string> parse_kv(int argc, char** argv)
{
    std::map<string, string> kv;
    for (int i = 1; i < argc; ++i)
    {
        string a = argv[i];
        auto eq = a.find('=');
        if (eq != string::npos)
            kv[a.substr(0, eq)] = a.substr(eq + 1);
        else if (a.rfind("--", 0) == 0 && i + 1 < argc && string(argv[i + 1]).rfind("--", 0) != 0)
            kv[a] = argv[++i];
        else
            kv[a] = "";
    }
    return kv;
}

static bool parse_int(const string& s, int& out)
{
    const char* b = s.data();
    const char* e = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(b, e, out);
    return ec == std::errc{} && ptr == e && b != e;
}

static string opt(const std::map<string, string>& kv, const char* key, const string& def)
{
    auto it = kv.find(key);
    return (it != kv.end() && !it->second.empty()) ? it->second : def;
}

static void usage()
{
    std::fprintf(stderr,
        "Usage:\n"
        "  outpost_sim [--config <dir>] [--resources <file>] [--structures <dir|file>]\n"
        "              [--scenario <file>] [--load <save.json>] [--ticks <n>] [--save <file>]\n"
        "              [--log-dir <dir>] [--list]\n");
}

// --- scenario ----------------------------------------------------------------

struct Delivery {
    sim::Cell at{};
    sim::ResourceId resource{};
    int amount = 0;
    int everyTicks = 0; // 0 = once, before the first tick
};

struct Scenario {
    int width = 0;
    int height = 0;
    sim::TerrainKind fill = sim::TerrainKind::Grass;

    struct Rect { sim::Cell origin; int w = 0; int h = 0; sim::TerrainKind kind{}; };
    std::vector<Rect> terrain;

    struct Placement { string definition; sim::Cell anchor; sim::Rotation rotation = sim::Rotation::R0; };
    std::vector<Placement> placements;

    std::vector<Delivery> deliveries;
};

static int int_field(const json& obj, const char* key, int def, string& err, const string& where)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    if (!it->is_number_integer())
    {
        err = where + ": '" + key + "' must be an integer";
        return def;
    }
    return it->get<int>();
}

static string string_field(const json& obj, const char* key)
{
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<string>() : string{};
}

static bool terrain_field(const json& obj, const char* key, sim::TerrainKind& out, string& err, const string& where)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return true;
    if (!it->is_string() || !sim::TerrainKindFromName(it->get<string>(), out))
    {
        err = where + ": '" + key + "' is not a terrain kind";
        return false;
    }
    return true;
}

static bool load_scenario(const std::filesystem::path& path, const sim::ResourceCatalog& resources,
                          Scenario& sc, string& err)
{
    string text;
    if (!core::ReadFileToString(path, text, &err))
        return false;

    const json j = json::parse(text, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (j.is_discarded() || !j.is_object())
    {
        err = path.string() + " is not a JSON object";
        return false;
    }

    if (auto w = j.find("world"); w != j.end() && w->is_object())
    {
        sc.width = int_field(*w, "width", sc.width, err, "world");
        sc.height = int_field(*w, "height", sc.height, err, "world");
        if (!terrain_field(*w, "fill", sc.fill, err, "world"))
            return false;
    }

    if (auto t = j.find("terrain"); t != j.end() && t->is_array())
    {
        for (std::size_t i = 0; i < t->size(); ++i)
        {
            const json& e = (*t)[i];
            const string where = "terrain[" + std::to_string(i) + "]";
            if (!e.is_object())
            {
                err = where + ": must be an object";
                return false;
            }
            Scenario::Rect r;
            r.origin = { int_field(e, "x", 0, err, where), int_field(e, "y", 0, err, where) };
            r.w = int_field(e, "width", 1, err, where);
            r.h = int_field(e, "height", 1, err, where);
            if (!e.contains("kind") || !terrain_field(e, "kind", r.kind, err, where))
            {
                if (err.empty()) err = where + ": missing 'kind'";
                return false;
            }
            sc.terrain.push_back(r);
        }
    }

    if (auto p = j.find("placements"); p != j.end() && p->is_array())
    {
        for (std::size_t i = 0; i < p->size(); ++i)
        {
            const json& e = (*p)[i];
            const string where = "placements[" + std::to_string(i) + "]";
            if (!e.is_object())
            {
                err = where + ": must be an object";
                return false;
            }
            Scenario::Placement pl;
            pl.definition = string_field(e, "definition");
            pl.anchor = { int_field(e, "x", 0, err, where), int_field(e, "y", 0, err, where) };
            if (!sim::RotationFromDegrees(int_field(e, "rotation", 0, err, where), pl.rotation))
            {
                err = where + ": rotation must be a multiple of 90";
                return false;
            }
            if (pl.definition.empty())
            {
                err = where + ": missing 'definition'";
                return false;
            }
            sc.placements.push_back(std::move(pl));
        }
    }

    if (auto d = j.find("deliveries"); d != j.end() && d->is_array())
    {
        for (std::size_t i = 0; i < d->size(); ++i)
        {
            const json& e = (*d)[i];
            const string where = "deliveries[" + std::to_string(i) + "]";
            if (!e.is_object())
            {
                err = where + ": must be an object";
                return false;
            }
            Delivery del;
            del.at = { int_field(e, "x", 0, err, where), int_field(e, "y", 0, err, where) };
            del.amount = int_field(e, "amount", 0, err, where);
            del.everyTicks = int_field(e, "every_ticks", 0, err, where);
            const auto res = resources.Find(string_field(e, "resource"));
            if (!res)
            {
                err = where + ": unknown resource";
                return false;
            }
            del.resource = *res;
            sc.deliveries.push_back(del);
        }
    }

    return err.empty();
}

static void deliver(sim::BuildingRegistry& registry, const Delivery& d, const sim::ResourceCatalog& resources)
{
    const sim::PlacedStructure* s = registry.structureAt(d.at);
    if (!s)
    {
        LOG_WARN("no structure at (%d,%d) for delivery of %d %s", d.at.x, d.at.y, d.amount,
                 resources.Name(d.resource).c_str());
        return;
    }
    const int added = registry.deliverInput(s->id, d.resource, d.amount);
    LOG_DEBUG("delivered %d/%d %s to %s #%u", added, d.amount, resources.Name(d.resource).c_str(),
              s->definitionId.c_str(), s->id);
}

// --- report ------------------------------------------------------------------

// Totals per resource, fed from ProductionCycleCompleted events.
struct ProductionTally {
    std::map<sim::ResourceId, long long> consumed;
    std::map<sim::ResourceId, long long> produced;

    void onCycle(const sim::evt::ProductionCycleCompleted& e)
    {
        for (const auto& in : e.consumed)
            consumed[in.resource] += in.amount;
        for (const auto& out : e.produced)
            produced[out.resource] += out.amount;
    }
};

static string tally_text(const std::map<sim::ResourceId, long long>& totals, const sim::ResourceCatalog& resources)
{
    string out;
    for (const auto& [res, amount] : totals)
    {
        if (!out.empty()) out += ", ";
        out += resources.Name(res) + ":" + std::to_string(amount);
    }
    return out.empty() ? string("-") : out;
}

static string storage_text(const sim::ResourceStorage& st, const sim::ResourceCatalog& resources)
{
    string out = "[";
    bool first = true;
    for (const auto& [res, amount] : st.contents())
    {
        if (!first) out += ", ";
        out += resources.Name(res) + ":" + std::to_string(amount);
        first = false;
    }
    out += "] " + std::to_string(st.usedCapacity()) + "/" + std::to_string(st.capacity());
    return out;
}

static void print_report(const sim::BuildingRegistry& registry, const sim::ResourceCatalog& resources,
                         const sim::TickReport& total, const ProductionTally& tally, int ticks)
{
    std::printf("=== %zu structures, %zu operational, sim time %.1fs (%d ticks) ===\n",
                registry.size(), registry.operationalCount(), registry.simSeconds(), ticks);
    for (const sim::PlacedStructure* s : registry.all())
    {
        std::printf("#%u %-14s (%d,%d) rot %3d  %-17s",
                    s->id, s->definitionId.c_str(), s->anchor.x, s->anchor.y,
                    sim::RotationDegrees(s->rotation), sim::LifecycleStateName(s->state));
        if (!s->operational())
            std::printf(" %3.0f%%", s->constructionProgress * 100.0f);
        std::printf("\n    cycles=%llu  in %s  out %s\n",
                    static_cast<unsigned long long>(s->productionCycleCount),
                    storage_text(s->inputStorage, resources).c_str(),
                    storage_text(s->outputStorage, resources).c_str());
    }
    std::printf("cycles=%d skipped(input)=%d skipped(output)=%d lost=%d\n",
                total.cyclesCompleted, total.skippedMissingInput, total.skippedOutputFull,
                total.overflowDiscarded);
    std::printf("consumed %s\nproduced %s\n", tally_text(tally.consumed, resources).c_str(),
                tally_text(tally.produced, resources).c_str());
}

// --- entry -------------------------------------------------------------------

int main(int argc, char** argv)
{
    const auto kv = parse_kv(argc, argv);
    if (kv.count("--help") || kv.count("-h"))
    {
        usage();
        return 0;
    }

    core::LogInit(opt(kv, "--log-dir", "logs"));

    core::Config cfg;
    const std::filesystem::path cfgDir = opt(kv, "--config", ".");
    if (!core::LoadConfig(cfg, cfgDir))
        LOG_INFO("no %s, using defaults", core::ConfigPath(cfgDir).string().c_str());
    core::SetLogLevel(cfg.logLevel);

    int ticks = 10;
    if (kv.count("--ticks") && (!parse_int(kv.at("--ticks"), ticks) || ticks < 0))
    {
        usage();
        core::LogShutdown();
        return 1;
    }

    string err;
    sim::ResourceCatalog resources;
    if (!content::LoadResourceDefinitionsFile(opt(kv, "--resources", "data/resources.json"), resources, &err))
    {
        LOG_ERROR("resource definitions: %s", err.c_str());
        core::LogShutdown();
        return 1;
    }

    content::DefinitionCatalog defs;
    const std::filesystem::path defsPath = opt(kv, "--structures", "data/structures");
    std::error_code ec;
    const bool defsOk = std::filesystem::is_directory(defsPath, ec)
        ? defs.LoadDirectory(defsPath, resources, &err)
        : defs.LoadFile(defsPath, resources, &err);
    if (!defsOk)
    {
        LOG_ERROR("structure definitions: %s", err.c_str());
        core::LogShutdown();
        return 1;
    }

    if (kv.count("--list"))
    {
        for (const sim::StructureDefinition* d : defs.Buildable())
            std::printf("%-12s %-16s %dx%d  cost %d  build %.0fs\n", d->category.c_str(), d->id.c_str(),
                        d->size.width, d->size.height, d->cost, d->constructionTimeSeconds);
        core::LogShutdown();
        return 0;
    }

    Scenario sc;
    sc.width = cfg.worldWidth;
    sc.height = cfg.worldHeight;
    if (kv.count("--scenario") && !load_scenario(kv.at("--scenario"), resources, sc, err))
    {
        LOG_ERROR("scenario: %s", err.c_str());
        core::LogShutdown();
        return 1;
    }

    sim::TerrainGrid terrain(sc.width, sc.height, sc.fill);
    for (const auto& r : sc.terrain)
        terrain.fillRect(r.origin, r.w, r.h, r.kind);

    entt::dispatcher dispatcher;
    sim::DispatcherEventSink events(dispatcher);
    ProductionTally tally;
    dispatcher.sink<sim::evt::ProductionCycleCompleted>().connect<&ProductionTally::onCycle>(tally);

    sim::OccupancyIndex occupancy;
    sim::BuildingRegistry registry(occupancy, terrain,
                                   sim::StorageDefaults{ cfg.defaultInputCapacity, cfg.defaultOutputCapacity },
                                   &events);
    registry.setResourceCatalog(&resources);
    registry.setOverflowWarnings(cfg.logOverflowWarnings);

    if (kv.count("--load") && !content::LoadRegistryJson(kv.at("--load"), registry, defs, resources, &err))
    {
        LOG_ERROR("load: %s", err.c_str());
        core::LogShutdown();
        return 1;
    }

    for (const auto& p : sc.placements)
    {
        const sim::StructureDefinition* def = defs.Find(p.definition);
        if (!def)
        {
            LOG_ERROR("scenario places unknown definition '%s'", p.definition.c_str());
            core::LogShutdown();
            return 1;
        }
        const sim::PlacementResult r = registry.place(*def, p.anchor, p.rotation);
        if (r != sim::PlacementResult::Ok)
            std::printf("rejected %s at (%d,%d): %s\n", def->id.c_str(), p.anchor.x, p.anchor.y,
                        sim::PlacementResultName(r));
    }

    for (const auto& d : sc.deliveries)
    {
        if (d.everyTicks == 0)
            deliver(registry, d, resources);
    }

    sim::ProductionScheduler scheduler(registry);
    sim::ProductionClock clock(scheduler, sim::ClockSettings{ cfg.tickIntervalSeconds, cfg.maxCatchUpTicks, cfg.maxFrameSeconds });

    sim::TickReport total{};
    for (int t = 1; t <= ticks; ++t)
    {
        for (const auto& d : sc.deliveries)
        {
            if (d.everyTicks > 0 && t % d.everyTicks == 0)
                deliver(registry, d, resources);
        }
        clock.runTicks(1, &total);
    }

    print_report(registry, resources, total, tally, ticks);

    int rc = 0;
    if (kv.count("--save"))
    {
        if (content::SaveRegistryJson(kv.at("--save"), registry, resources, &err))
            LOG_INFO("saved %zu structures to %s", registry.size(), kv.at("--save").c_str());
        else
        {
            LOG_ERROR("save: %s", err.c_str());
            rc = 1;
        }
    }

    core::LogShutdown();
    return rc;
}
