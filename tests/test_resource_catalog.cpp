#include <doctest/doctest.h>

#include "content/DefinitionCatalog.h"
#include "sim/ResourceCatalog.h"

#include <string>

using namespace outpost;
using namespace outpost::sim;

TEST_CASE("ResourceCatalog interns names into dense ids")
{
    ResourceCatalog catalog;
    const ResourceId grain = catalog.Register("grain");
    const ResourceId food = catalog.Register("food");

    CHECK(grain.value == 0);
    CHECK(food.value == 1);
    CHECK(catalog.Register("grain") == grain);
    CHECK(catalog.Count() == 2);

    REQUIRE(catalog.Find("food").has_value());
    CHECK(*catalog.Find("food") == food);
    CHECK_FALSE(catalog.Find("Food").has_value());
    CHECK_FALSE(catalog.Contains("steel"));

    CHECK(catalog.Name(food) == "food");
    CHECK(catalog.Name(ResourceId{ 9 }).empty());
    CHECK(catalog.Info(ResourceId{ 9 }) == nullptr);
}

TEST_CASE("ResourceCatalog re-registration replaces metadata but keeps the id")
{
    ResourceCatalog catalog;
    const ResourceId id = catalog.Register("steel");
    CHECK(catalog.Info(id)->baseValue == 10);

    ResourceInfo info;
    info.id = "steel";
    info.name = "Steel";
    info.category = "processed";
    info.baseValue = 35;
    CHECK(catalog.Register(info) == id);
    CHECK(catalog.Info(id)->name == "Steel");
    CHECK(catalog.Info(id)->baseValue == 35);
    CHECK(catalog.Count() == 1);
}

TEST_CASE("ResourceLabel falls back to the raw index")
{
    ResourceCatalog catalog;
    const ResourceId coal = catalog.Register("coal");
    CHECK(ResourceLabel(&catalog, coal) == "coal");
    CHECK(ResourceLabel(&catalog, ResourceId{ 4 }) == "#4");
    CHECK(ResourceLabel(nullptr, coal) == "#0");
}

TEST_CASE("LoadResourceDefinitionsJson validates every entry before registering")
{
    ResourceCatalog catalog;
    std::string err;

    SUBCASE("valid document")
    {
        REQUIRE(content::LoadResourceDefinitionsJson(R"([
            { "id": "grain", "name": "Grain", "category": "raw", "base_value": 8, "stack_size": 100 },
            { "id": "food",  "name": "Food",  "category": "processed" }
        ])", catalog, &err));
        CHECK(catalog.Count() == 2);
        const ResourceInfo* food = catalog.Info(*catalog.Find("food"));
        REQUIRE(food != nullptr);
        CHECK(food->baseValue == 10);
        CHECK(food->stackSize == 100);
    }

    SUBCASE("single object")
    {
        CHECK(content::LoadResourceDefinitionsJson(R"({ "id": "coal", "name": "Coal", "category": "raw" })",
                                                   catalog, &err));
        CHECK(catalog.Contains("coal"));
    }

    SUBCASE("non-positive base value")
    {
        CHECK_FALSE(content::LoadResourceDefinitionsJson(R"([
            { "id": "grain", "name": "Grain", "category": "raw" },
            { "id": "dirt",  "name": "Dirt",  "category": "raw", "base_value": 0 }
        ])", catalog, &err));
        CHECK(err.find("base_value") != std::string::npos);
        CHECK(catalog.Count() == 0);
    }

    SUBCASE("duplicate id")
    {
        CHECK_FALSE(content::LoadResourceDefinitionsJson(R"([
            { "id": "grain", "name": "Grain", "category": "raw" },
            { "id": "grain", "name": "Grain again", "category": "raw" }
        ])", catalog, &err));
        CHECK(err.find("duplicate") != std::string::npos);
        CHECK(catalog.Count() == 0);
    }

    SUBCASE("missing category")
    {
        CHECK_FALSE(content::LoadResourceDefinitionsJson(R"([{ "id": "grain", "name": "Grain" }])", catalog, &err));
        CHECK(err.find("category") != std::string::npos);
    }

    SUBCASE("not JSON")
    {
        CHECK_FALSE(content::LoadResourceDefinitionsJson("[{ id: grain", catalog, &err));
        CHECK_FALSE(err.empty());
    }
}

TEST_CASE("LoadResourceDefinitionsFile reads the shipped resources")
{
    ResourceCatalog catalog;
    std::string err;
    REQUIRE_MESSAGE(content::LoadResourceDefinitionsFile("data/resources.json", catalog, &err), err);
    CHECK(catalog.Count() == 5);
    CHECK(catalog.Contains("grain"));
    CHECK(catalog.Contains("iron_ore"));
    CHECK(catalog.Contains("steel"));
    CHECK(catalog.Info(*catalog.Find("food"))->category == "processed");
}
