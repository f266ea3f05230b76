#include <gtest/gtest.h>
#include <cmath>
#include <fstream>
#include "engine/layout.hpp"
#include "engine/vector_store.hpp"
#include "incidex/sha256.h"
#include "test_helpers.hpp"

using namespace incidex::engine;
using incidex::crypto::SHA256;
using incidex::testing::TempDir;
using json = nlohmann::json;

namespace {
    class LayoutTest : public ::testing::Test {
    protected:
        TempDir dir;
        VectorStore store{dir.path()};
        std::unique_ptr<Collection> col = store.open_or_create("incidents");
        std::filesystem::path cache_file = dir.path() / "layout_cache.json";

        void add(const std::string& id, const std::string& project, const std::string& doc = "doc") {
            col->add({id}, {doc}, {{1.0f, 0.5f, 0.0f}}, {{{"project", project}}});
        }
    };
}

TEST(SunPositionTest, DeterministicAndWithinBounds) {
    for (const std::string name : {"A", "Web Scraping", "No project", "Infraestructura"}) {
        auto p = position_for(name);
        auto q = position_for(name);
        EXPECT_DOUBLE_EQ(p.x, q.x);
        EXPECT_DOUBLE_EQ(p.y, q.y);
        EXPECT_DOUBLE_EQ(p.z, q.z);

        const auto digest = SHA256::hash(name);
        const double radius = std::sqrt(p.x * p.x + p.z * p.z);
        EXPECT_NEAR(radius, 30.0 + SHA256::mod(digest, 50), 1e-9);
        EXPECT_DOUBLE_EQ(p.y, static_cast<double>(SHA256::mod(digest, 20)) - 10.0);
        EXPECT_GE(p.y, -10.0);
        EXPECT_LT(p.y, 10.0);
    }
}

TEST_F(LayoutTest, GroupsByProjectInFirstAppearanceOrder) {
    add("1", "Mail");
    add("2", "Web", std::string(200, 'w'));
    add("3", "Mail");

    LayoutCache layout(*col, cache_file);
    auto result = layout.build();
    EXPECT_EQ(result["total_incidents"].get<int>(), 3);
    EXPECT_EQ(result["total_projects"].get<int>(), 2);

    const auto& mail = result["suns"][0];
    EXPECT_EQ(mail["name"], "Mail");
    EXPECT_EQ(mail["size"].get<int>(), 2);
    EXPECT_FALSE(mail["has_more"].get<bool>());
    EXPECT_EQ(mail["incidents"][1]["id"], "3");

    const auto& web = result["suns"][1];
    EXPECT_EQ(web["incidents"][0]["text"].get<std::string>().size(), kLayoutTextChars);
    EXPECT_EQ(web["incidents"][0]["metadata"]["project"], "Web");

    auto pos = position_for("Web");
    EXPECT_DOUBLE_EQ(web["x"].get<double>(), pos.x);
}

TEST_F(LayoutTest, CacheIsReusedUntilCountChanges) {
    add("1", "Mail");
    LayoutCache layout(*col, cache_file);
    auto first = layout.get_layout(true);
    ASSERT_TRUE(first["success"].get<bool>());
    ASSERT_TRUE(std::filesystem::exists(cache_file));

    // Mark the cached copy so a cache hit is observable.
    json marked = first;
    marked["marker"] = true;
    std::ofstream(cache_file) << marked.dump();

    auto cached = layout.get_layout(true);
    EXPECT_TRUE(cached.value("marker", false));

    auto forced = layout.get_layout(false);
    EXPECT_FALSE(forced.contains("marker"));

    std::ofstream(cache_file) << marked.dump();
    add("2", "Web");
    auto rebuilt = layout.get_layout(true);
    EXPECT_FALSE(rebuilt.contains("marker"));
    EXPECT_EQ(rebuilt["total_incidents"].get<int>(), 2);
}

TEST_F(LayoutTest, MalformedOrNonIntegerCacheIsIgnored) {
    add("1", "Mail");
    LayoutCache layout(*col, cache_file);

    std::ofstream(cache_file) << R"({"total_incidents": "1", "marker": true})";
    EXPECT_FALSE(layout.read_valid_cache(1).has_value());

    std::ofstream(cache_file) << "{broken";
    EXPECT_FALSE(layout.read_valid_cache(1).has_value());
    EXPECT_TRUE(layout.get_layout(true)["success"].get<bool>());
}

TEST_F(LayoutTest, EmptyCollectionIsNoData) {
    LayoutCache layout(*col, cache_file);
    auto result = layout.get_layout(true);
    EXPECT_FALSE(result["success"].get<bool>());
    EXPECT_EQ(result["error_kind"], "NoData");
    EXPECT_FALSE(std::filesystem::exists(cache_file));
}

TEST_F(LayoutTest, LargeProjectsAreCapped) {
    std::vector<std::string> ids, docs;
    std::vector<Embedding> vecs;
    std::vector<Metadata> metas;
    for (size_t i = 0; i < kMaxIncidentsPerSun + 1; ++i) {
        ids.push_back("id" + std::to_string(i));
        docs.push_back("doc");
        vecs.push_back({1.0f, static_cast<float>(i), 0.0f});
        metas.push_back({{"project", "Big"}});
    }
    col->add(ids, docs, vecs, metas);

    LayoutCache layout(*col, cache_file);
    auto sun = layout.build()["suns"][0];
    EXPECT_EQ(sun["incident_count"].get<size_t>(), kMaxIncidentsPerSun + 1);
    EXPECT_EQ(sun["incidents"].size(), kMaxIncidentsPerSun);
    EXPECT_TRUE(sun["has_more"].get<bool>());
}
