#include "incident_rag.hpp"
#include "envelope.hpp"
#include "ingestion.hpp"
#include "layout.hpp"
#include "search.hpp"
#include "incidex/errors.hpp"
#include <iostream>

using json = nlohmann::json;

namespace incidex::engine {

    IncidentRag::IncidentRag(const Config& cfg)
        : IncidentRag(cfg, create_embedder(cfg), create_http_fetcher(cfg.fetch_timeout_seconds)) {}

    IncidentRag::IncidentRag(const Config& cfg, std::unique_ptr<Embedder> embedder, std::unique_ptr<PageFetcher> fetcher)
        : m_config(cfg), m_embedder(std::move(embedder)), m_fetcher(std::move(fetcher)), m_store(cfg.data_dir) {
        std::cout << "[IncidentRag] Embedding backend: " << m_embedder->name() << " (" << m_embedder->dimension()
                  << " dimensions)\n";
        m_collection = m_store.open_or_create(m_config.collection_name);
    }

    Collection& IncidentRag::collection() {
        if (!m_collection) {
            // An interrupted clear() leaves no handle; the rows are still in the database.
            m_collection = m_store.open_or_create(m_config.collection_name);
        }
        return *m_collection;
    }

    json IncidentRag::ingest(const std::string& source, const std::string& source_type) {
        try {
            IngestionPipeline pipeline(collection(), *m_embedder, *m_fetcher, m_config.data_dir);
            return pipeline.ingest(source, source_type);
        } catch (const std::exception& e) {
            return error_payload(e, "error loading incidents");
        }
    }

    json IncidentRag::search(const std::string& query, int top_k, const Metadata& filters) {
        try {
            SimilaritySearch searcher(collection(), *m_embedder);
            return searcher.search_similar(query, top_k, filters);
        } catch (const std::exception& e) {
            json payload = error_payload(e, "search failed");
            payload["query"] = query;
            payload["similar_incidents"] = json::array();
            return payload;
        }
    }

    json IncidentRag::stats() {
        try {
            const size_t count = collection().count();
            std::error_code ec;
            const bool has_index = std::filesystem::exists(collection().index_path(), ec);
            return {
                {"success", true},
                {"total_incidents", count},
                {"collection_name", collection().name()},
                {"has_data", count > 0},
                {"files", {
                    {"database", std::filesystem::exists(m_store.database_path(), ec)},
                    {"index", has_index},
                    {"layout_cache", std::filesystem::exists(layout_cache_path(), ec)}
                }},
                {"embedding_backend", m_embedder->name()},
                {"rag_ready", count > 0 && has_index}
            };
        } catch (const std::exception& e) {
            json payload = error_payload(e, "stats failed");
            payload["total_incidents"] = 0;
            payload["has_data"] = false;
            payload["rag_ready"] = false;
            return payload;
        }
    }

    json IncidentRag::layout(bool use_cache) {
        try {
            LayoutCache cache(collection(), layout_cache_path());
            return cache.get_layout(use_cache);
        } catch (const std::exception& e) {
            json payload = error_payload(e, "layout failed");
            payload["success"] = false;
            return payload;
        }
    }

    json IncidentRag::clear() {
        try {
            m_collection.reset();
            m_store.delete_collection(m_config.collection_name);
            std::error_code ec;
            std::filesystem::remove(layout_cache_path(), ec);
            m_collection = m_store.open_or_create(m_config.collection_name);
            return {{"success", true}, {"message", "Collection '" + m_config.collection_name + "' cleared"}};
        } catch (const std::exception& e) {
            std::cerr << "[IncidentRag] Clear failed: " << describe_nested(e) << "\n";
            if (!m_collection) {
                try {
                    m_collection = m_store.open_or_create(m_config.collection_name);
                } catch (const std::exception& reopen) {
                    std::cerr << "[IncidentRag] Reopen after failed clear also failed, will retry on next call: "
                              << reopen.what() << "\n";
                }
            }
            return error_payload(e, "clear failed");
        }
    }

}
