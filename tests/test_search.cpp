#include <gtest/gtest.h>
#include <cmath>
#include "engine/search.hpp"
#include "engine/vector_store.hpp"
#include "test_helpers.hpp"

using namespace incidex::engine;
using incidex::testing::FakeEmbedder;
using incidex::testing::TempDir;
using json = nlohmann::json;

namespace {
    Embedding at_cosine(float cosine) {
        return {cosine, std::sqrt(1.0f - cosine * cosine), 0.0f, 0.0f};
    }

    class SearchTest : public ::testing::Test {
    protected:
        TempDir dir;
        VectorStore store{dir.path()};
        std::unique_ptr<Collection> col = store.open_or_create("incidents");
        FakeEmbedder embedder{4};

        void SetUp() override {
            embedder.set("network outage", {1.0f, 0.0f, 0.0f, 0.0f});
        }
    };
}

TEST_F(SearchTest, OnlyHitsAboveThresholdAreReturned) {
    col->add({"close", "far"}, {"router reboot loop", "printer toner"}, {at_cosine(0.9f), at_cosine(0.25f)},
             {{{"project", "Net"}, {"source", "a.csv"}}, {{"project", "Office"}, {"source", "a.csv"}}});

    SimilaritySearch search(*col, embedder);
    auto result = search.search_similar("network outage", 5);
    ASSERT_TRUE(result["success"].get<bool>()) << result.dump();
    EXPECT_EQ(result["query"], "network outage");
    ASSERT_EQ(result["similar_incidents"].size(), 1u);
    EXPECT_EQ(result["total_found"].get<int>(), 1);

    const auto& hit = result["similar_incidents"][0];
    EXPECT_EQ(hit["id"], "close");
    EXPECT_NEAR(hit["similarity_score"].get<double>(), 0.9, 1e-4);
    EXPECT_EQ(hit["source"], "a.csv");
    EXPECT_TRUE(result.contains("search_time_ms"));
}

TEST_F(SearchTest, ResultsAreOrderedAndPreviewTruncated) {
    std::string long_doc(400, 'x');
    col->add({"b", "a"}, {"second", long_doc}, {at_cosine(0.6f), at_cosine(0.95f)}, {{}, {}});

    SimilaritySearch search(*col, embedder);
    auto hits = search.search_similar("network outage", 5)["similar_incidents"];
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0]["id"], "a");
    EXPECT_EQ(hits[1]["id"], "b");
    EXPECT_EQ(hits[0]["text"].get<std::string>().size(), kPreviewChars);
    EXPECT_EQ(hits[0]["full_text"], long_doc);
    EXPECT_EQ(hits[0]["source"], "");
}

TEST_F(SearchTest, FiltersAndTopK) {
    col->add({"a", "b", "c"}, {"a", "b", "c"}, {at_cosine(0.99f), at_cosine(0.9f), at_cosine(0.8f)},
             {{{"project", "X"}}, {{"project", "Y"}}, {{"project", "Y"}}});

    SimilaritySearch search(*col, embedder);
    auto filtered = search.search_similar("network outage", 5, {{"project", "Y"}})["similar_incidents"];
    ASSERT_EQ(filtered.size(), 2u);
    EXPECT_EQ(filtered[0]["id"], "b");

    auto top1 = search.search_similar("network outage", 1)["similar_incidents"];
    ASSERT_EQ(top1.size(), 1u);
    EXPECT_EQ(top1[0]["id"], "a");

    auto none = search.search_similar("network outage", 0);
    EXPECT_TRUE(none["success"].get<bool>());
    EXPECT_TRUE(none["similar_incidents"].empty());
}

TEST_F(SearchTest, EmptyQueryAndEmptyCollectionAreErrors) {
    SimilaritySearch search(*col, embedder);
    auto empty_collection = search.search_similar("network outage", 5);
    EXPECT_EQ(empty_collection["error_kind"], "NoData");
    EXPECT_TRUE(empty_collection["similar_incidents"].empty());
    EXPECT_EQ(empty_collection["query"], "network outage");

    col->add({"a"}, {"a"}, {at_cosine(0.9f)}, {{}});
    auto blank = search.search_similar("   ", 5);
    EXPECT_EQ(blank["error_kind"], "InvalidArgument");
    EXPECT_FALSE(blank.contains("success"));
}

TEST(DisplayMetadataTest, ResolvesAliasesAndPassesOthersThrough) {
    Metadata metadata = {
        {"Proyecto", "Red"},
        {"Fecha", "2024-05-01"},
        {"Solución", "Reinicio del switch"},
        {"Estado", "cerrado"},
        {"source", "export.csv"},
        {"Técnico", "Ana"}
    };
    auto out = display_metadata("csv_1", std::string(250, 'd'), metadata);
    EXPECT_EQ(out["ID"], "csv_1");
    EXPECT_EQ(out["project"], "Red");
    EXPECT_EQ(out["date"], "2024-05-01");
    EXPECT_EQ(out["description"].get<std::string>().size(), kDescriptionFallbackChars);
    EXPECT_EQ(out["resolution"], "Reinicio del switch");
    EXPECT_EQ(out["status"], "cerrado");
    EXPECT_EQ(out["priority"], "");
    EXPECT_EQ(out["Técnico"], "Ana");
    EXPECT_FALSE(out.contains("source"));
    EXPECT_FALSE(out.contains("Proyecto"));
}

TEST(DisplayMetadataTest, DefaultsWhenNothingIsRecorded) {
    auto out = display_metadata("x", "short doc", {});
    EXPECT_EQ(out["project"], "No project");
    EXPECT_EQ(out["date"], "N/A");
    EXPECT_EQ(out["description"], "short doc");
    EXPECT_EQ(out["resolution"], "Not recorded");
}

TEST(CanonicalFiltersTest, FoldedColumnNamesMapToStoredKeys) {
    auto filters = canonical_filters({{"Proyecto", "A"}, {"descripcion", "disk"}, {"Estado", "open"}});
    EXPECT_EQ(filters.size(), 3u);
    EXPECT_EQ(filters.at("project"), "A");
    EXPECT_EQ(filters.at("description"), "disk");
    EXPECT_EQ(filters.at("Estado"), "open");
    EXPECT_EQ(filters.count("Proyecto"), 0u);
}
