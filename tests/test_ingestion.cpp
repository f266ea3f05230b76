#include <gtest/gtest.h>
#include <sqlite3.h>
#include "engine/config.hpp"
#include "engine/incident_rag.hpp"
#include "engine/ingestion.hpp"
#include "engine/vector_store.hpp"
#include "test_helpers.hpp"

using namespace incidex::engine;
using incidex::testing::FakeEmbedder;
using incidex::testing::FakeFetcher;
using incidex::testing::TempDir;
using json = nlohmann::json;

namespace {
    Config config_for(const TempDir& dir) {
        Config cfg;
        cfg.data_dir = dir.path() / "store";
        return cfg;
    }

    std::string three_row_table() {
        return "Proyecto,Descripción\n"
               "A," + std::string(30, 'x') + "\n"
               "B," + std::string(5, 'y') + "\n"
               "A," + std::string(30, 'z') + "\n";
    }
}

TEST(IncidentMappingTest, AliasesDefaultsAndExtras) {
    Metadata fields = {
        {"ID", "INC-9"},
        {"titulo", "Caída"},
        {"desc", "VPN drops"},
        {"Estado", "open"},
        {"source", "spoofed"},
        {"notes", std::string(600, 'n')}
    };
    auto incident = to_incident(fields, "csv_0", "export.csv");
    EXPECT_EQ(incident.id, "INC-9");
    EXPECT_EQ(incident.title, "Caída");
    EXPECT_EQ(incident.description, "VPN drops");
    EXPECT_EQ(incident.project, "No project");
    EXPECT_EQ(incident.source, "export.csv");
    EXPECT_EQ(incident.extra.at("Estado"), "open");
    EXPECT_EQ(incident.extra.at("notes").size(), kMaxExtraFieldChars);
    EXPECT_EQ(incident.extra.count("ID"), 0u);
    EXPECT_EQ(incident.extra.count("source"), 0u);

    auto metadata = to_metadata(incident);
    EXPECT_EQ(metadata.at("source"), "export.csv");
    EXPECT_EQ(metadata.count("id"), 0u);
    EXPECT_EQ(document_text(incident), "Caída VPN drops No project");
}

TEST(IncidentMappingTest, EmptyIdFallsBackAndTitleDefaults) {
    auto incident = to_incident({{"id", ""}, {"description", "x"}}, "json_4", "f.json");
    EXPECT_EQ(incident.id, "json_4");
    EXPECT_EQ(incident.title, "Untitled");
}

TEST(IngestionTest, ThreeRowTableScenario) {
    TempDir dir;
    auto cfg = config_for(dir);
    IncidentRag rag(cfg, std::make_unique<FakeEmbedder>(), std::make_unique<FakeFetcher>());
    dir.write("store/incidents.csv", three_row_table());

    auto result = rag.ingest("incidents.csv", "file");
    ASSERT_TRUE(result.value("success", false)) << result.dump();
    EXPECT_EQ(result["incidents_loaded"].get<int>(), 3);
    EXPECT_EQ(result["source_type"], "file");
    EXPECT_EQ(result["degraded_embeddings"].get<int>(), 0);

    auto stats = rag.stats();
    EXPECT_EQ(stats["total_incidents"].get<int>(), 3);
    EXPECT_TRUE(stats["has_data"].get<bool>());
    EXPECT_TRUE(stats["rag_ready"].get<bool>());

    auto layout = rag.layout(false);
    ASSERT_TRUE(layout["success"].get<bool>()) << layout.dump();
    EXPECT_EQ(layout["total_projects"].get<int>(), 2);
    ASSERT_EQ(layout["suns"].size(), 2u);
    EXPECT_EQ(layout["suns"][0]["name"], "A");
    EXPECT_EQ(layout["suns"][0]["incident_count"].get<int>(), 2);
    EXPECT_EQ(layout["suns"][1]["name"], "B");
    EXPECT_EQ(layout["suns"][1]["incident_count"].get<int>(), 1);
}

TEST(IngestionTest, SearchFiltersAcceptSourceColumnNames) {
    TempDir dir;
    auto cfg = config_for(dir);
    IncidentRag rag(cfg, std::make_unique<FakeEmbedder>(), std::make_unique<FakeFetcher>());
    dir.write("store/projects.csv",
              "Proyecto,Descripción\n"
              "A,Server down after patch\n"
              "B,Server down after patch\n");
    ASSERT_TRUE(rag.ingest("projects.csv", "file").value("success", false));

    auto unfiltered = rag.search("A Server down after patch A", 5);
    ASSERT_TRUE(unfiltered.value("success", false)) << unfiltered.dump();
    EXPECT_EQ(unfiltered["similar_incidents"].size(), 2u);

    for (const char* key : {"Proyecto", "project"}) {
        auto filtered = rag.search("A Server down after patch A", 5, {{key, "A"}});
        ASSERT_TRUE(filtered.value("success", false)) << filtered.dump();
        ASSERT_EQ(filtered["similar_incidents"].size(), 1u) << key;
        EXPECT_EQ(filtered["similar_incidents"][0]["id"], "csv_0");
        EXPECT_EQ(filtered["similar_incidents"][0]["metadata"]["project"], "A");
    }
}

TEST(IngestionTest, FailedClearKeepsCollectionUsable) {
    TempDir dir;
    auto cfg = config_for(dir);
    IncidentRag rag(cfg, std::make_unique<FakeEmbedder>(), std::make_unique<FakeFetcher>());
    dir.write("store/incidents.csv", three_row_table());
    ASSERT_TRUE(rag.ingest("incidents.csv", "file").value("success", false));

    // A second writer holding the database lock makes the delete fail once the busy timeout runs out.
    sqlite3* other = nullptr;
    ASSERT_EQ(sqlite3_open((cfg.data_dir / "incidex.db").string().c_str(), &other), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(other, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr), SQLITE_OK);

    auto cleared = rag.clear();
    EXPECT_EQ(cleared["error_kind"], "StoreFailure");
    EXPECT_FALSE(cleared.contains("success"));

    sqlite3_exec(other, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(other);

    auto stats = rag.stats();
    ASSERT_TRUE(stats.value("success", false)) << stats.dump();
    EXPECT_EQ(stats["total_incidents"].get<int>(), 3);

    auto found = rag.search("A " + std::string(30, 'x') + " A", 5);
    ASSERT_TRUE(found.value("success", false)) << found.dump();
    ASSERT_FALSE(found["similar_incidents"].empty());
    EXPECT_EQ(found["similar_incidents"][0]["id"], "csv_0");

    EXPECT_TRUE(rag.clear().value("success", false));
    EXPECT_EQ(rag.stats()["total_incidents"].get<int>(), 0);
}

TEST(IngestionTest, ReingestingUpsertsInsteadOfDuplicating) {
    TempDir dir;
    auto cfg = config_for(dir);
    IncidentRag rag(cfg, std::make_unique<FakeEmbedder>(), std::make_unique<FakeFetcher>());
    dir.write("store/export.json", R"({"total": 2, "incidents": [
        {"id": "INC-1", "title": "Mail queue stuck", "project": "Mail"},
        {"id": "INC-2", "title": "Certificate expired", "project": "Web", "priority": 1}
    ]})");

    ASSERT_TRUE(rag.ingest("export.json", "file").value("success", false));
    auto again = rag.ingest("export.json", "file");
    ASSERT_TRUE(again.value("success", false)) << again.dump();
    EXPECT_EQ(rag.stats()["total_incidents"].get<int>(), 2);
}

TEST(IngestionTest, LooksInSiblingDataDirectoryFirst) {
    TempDir dir;
    auto cfg = config_for(dir);
    IncidentRag rag(cfg, std::make_unique<FakeEmbedder>(), std::make_unique<FakeFetcher>());
    dir.write("data/incidents.tsv", "title\tproject\nBroken build\tCI\n");

    auto result = rag.ingest("incidents.tsv", "file");
    ASSERT_TRUE(result.value("success", false)) << result.dump();
    EXPECT_EQ(result["incidents_loaded"].get<int>(), 1);
}

TEST(IngestionTest, DegradedEndpointStillLoads) {
    TempDir dir;
    auto cfg = config_for(dir);
    cfg.embedding_endpoint = "http://127.0.0.1:9/api/embeddings";
    cfg.embedding_dimension = 8;
    cfg.request_timeout_seconds = 2;
    IncidentRag rag(cfg, create_embedder(cfg), std::make_unique<FakeFetcher>());
    dir.write("store/two.csv", "title,description\nOne,first incident\nTwo,second incident\n");

    auto result = rag.ingest("two.csv", "file");
    ASSERT_TRUE(result.value("success", false)) << result.dump();
    EXPECT_EQ(result["incidents_loaded"].get<int>(), 2);
    EXPECT_EQ(result["degraded_embeddings"].get<int>(), 2);
    EXPECT_EQ(rag.stats()["total_incidents"].get<int>(), 2);
}

TEST(IngestionTest, FailuresAreReportedAsPayloads) {
    TempDir dir;
    auto cfg = config_for(dir);
    IncidentRag rag(cfg, std::make_unique<FakeEmbedder>(), std::make_unique<FakeFetcher>());
    dir.write("store/notes.txt", "hello");
    dir.write("store/empty.csv", "title,description\n");
    dir.write("store/broken.json", "{\"incidents\": [");

    auto unsupported = rag.ingest("notes.txt", "file");
    EXPECT_EQ(unsupported["error_kind"], "UnsupportedFormat");
    EXPECT_FALSE(unsupported.contains("success"));

    EXPECT_EQ(rag.ingest("missing.csv", "file")["error_kind"], "SourceNotFound");
    EXPECT_EQ(rag.ingest("empty.csv", "file")["error_kind"], "NoData");
    EXPECT_EQ(rag.ingest("broken.json", "file")["error_kind"], "UnsupportedFormat");
    EXPECT_EQ(rag.ingest("incidents.csv", "ftp")["error_kind"], "UnsupportedFormat");
    EXPECT_EQ(rag.stats()["total_incidents"].get<int>(), 0);
}

TEST(IngestionTest, WebPageBlocksBecomeIncidents) {
    TempDir dir;
    auto cfg = config_for(dir);
    auto fetcher = std::make_unique<FakeFetcher>();
    fetcher->set("http://status.example/", R"(
        <div class="incident">short</div>
        <div class="incident">Database cluster lost quorum at 03:00</div>
        <li class="ticket">Printer on floor three keeps jamming</li>)");
    IncidentRag rag(cfg, std::make_unique<FakeEmbedder>(), std::move(fetcher));

    auto result = rag.ingest("http://status.example/", "url");
    ASSERT_TRUE(result.value("success", false)) << result.dump();
    EXPECT_EQ(result["incidents_loaded"].get<int>(), 2);

    auto layout = rag.layout(false);
    ASSERT_EQ(layout["suns"].size(), 1u);
    EXPECT_EQ(layout["suns"][0]["name"], "Web Scraping");
    EXPECT_EQ(layout["suns"][0]["incidents"][0]["id"], "web_1");

    EXPECT_EQ(rag.ingest("http://down.example/", "url")["error_kind"], "SourceNotFound");
}
