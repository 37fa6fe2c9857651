#include <doctest/doctest.h>

#include "../KmsDashTestHelper.hpp"

#include <kmsdash/catalog/CatalogExtractor.hpp>
#include <kmsdash/catalog/ProductDatabase.hpp>

#include <cstddef>
#include <string>

using namespace KD;

TEST_SUITE("catalog.database") {

TEST_CASE("JSON objects keep document key order") {
    auto parsed = ParseProductDatabase(R"({"zeta": 1, "alpha": "two", "mid": null})");
    REQUIRE(parsed.has_value());

    auto const* mapping = parsed->as_mapping();
    REQUIRE(mapping != nullptr);
    REQUIRE(mapping->size() == 3);
    CHECK(mapping->keys[0] == "zeta");
    CHECK(mapping->keys[1] == "alpha");
    CHECK(mapping->keys[2] == "mid");
    CHECK(mapping->find("mid")->as_leaf()->is_null());
    CHECK(*mapping->find("alpha")->as_leaf()->as_string() == "two");
}

TEST_CASE("Invalid JSON is reported as malformed input") {
    auto parsed = ParseProductDatabase("{\"KmsItems\": [");
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().code == Error::Code::MalformedInput);
}

TEST_CASE("Nesting depth is bounded") {
    auto nested = [](std::size_t levels) {
        return std::string(levels, '[') + std::string(levels, ']');
    };

    SUBCASE("At the limit") {
        auto parsed = ParseProductDatabase(nested(kMaxProductDatabaseDepth));
        REQUIRE(parsed.has_value());
        CHECK(parsed->as_sequence() != nullptr);
    }
    SUBCASE("One level past the limit") {
        auto parsed = ParseProductDatabase(nested(kMaxProductDatabaseDepth + 1));
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("Far past the limit") {
        auto parsed = ParseProductDatabase(nested(20000));
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code == Error::Code::MalformedInput);
        CHECK(describeError(parsed.error()).find("256") != std::string::npos);
    }
    SUBCASE("Deep objects") {
        std::string text;
        for (int i = 0; i < 1000; ++i) {
            text += "{\"KmsItems\":";
        }
        text += "null" + std::string(1000, '}');
        auto parsed = ParseProductDatabase(text);
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("Custom depth limit applies to already parsed documents") {
    auto document = nlohmann::ordered_json::parse(R"({"KmsItems": [{"SkuItems": []}]})");
    CHECK(RawRecordFromJson(document, 4).has_value());
    auto shallow = RawRecordFromJson(document, 3);
    REQUIRE_FALSE(shallow.has_value());
    CHECK(shallow.error().code == Error::Code::MalformedInput);
}

TEST_CASE("Missing database file is NotFound") {
    TempDir dir;
    auto    loaded = LoadProductDatabase(dir.file("absent.json"));
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code == Error::Code::NotFound);
}

TEST_CASE("Loaded database feeds the extractor") {
    TempDir dir;
    write_text_file(dir.file("kms.json"), R"json(
{
  "KmsItems": [
    {
      "DisplayName": "Windows",
      "SkuItems": [
        {"DisplayName": "Windows 10 Pro", "Gvlk": "W269N-WFGWX-YVC9B-4J6C9-T83GX"},
        {"DisplayName": "Windows 10 Home", "Gvlk": ""}
      ]
    },
    {
      "DisplayName": "Office",
      "SkuItems": [
        {"DisplayName": "Office Professional Plus 2019", "Gvlk": "NMMKJ-6RK4F-KMJVX-8D9MJ-6MWKP"}
      ]
    }
  ]
}
)json");

    auto loaded = LoadProductDatabase(dir.file("kms.json"));
    REQUIRE(loaded.has_value());

    ServerConfig config;
    config.bind_address = "192.168.1.20";
    auto catalog        = ExtractCatalog(*loaded, config);

    REQUIRE(catalog.size() == 2);
    CHECK(catalog.find("Windows 10 Home") == nullptr);
    CHECK(catalog.find("Office Professional Plus 2019")->commands.set_server == "slmgr /skms 192.168.1.20:1688");
}

} // TEST_SUITE
