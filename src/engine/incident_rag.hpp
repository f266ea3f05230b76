#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "embedder.hpp"
#include "page_fetcher.hpp"
#include "vector_store.hpp"

namespace incidex::engine {

    /**
     * @brief Incident retrieval engine: ingest, search, stats, layout and clear over one collection.
     *
     * Every operation returns a JSON payload carrying either "success" or "error"; none throws.
     */
    class IncidentRag {
    public:
        /**
         * @throws incidex::Error InvalidConfig for a bad embedding backend, StoreFailure if the store cannot open.
         */
        explicit IncidentRag(const Config& cfg);

        IncidentRag(const Config& cfg, std::unique_ptr<Embedder> embedder, std::unique_ptr<PageFetcher> fetcher);

        nlohmann::json ingest(const std::string& source, const std::string& source_type);
        nlohmann::json search(const std::string& query, int top_k = 5, const Metadata& filters = {});
        nlohmann::json stats();
        nlohmann::json layout(bool use_cache = true);
        nlohmann::json clear();

        std::filesystem::path layout_cache_path() const { return m_config.data_dir / "layout_cache.json"; }

    private:
        Config m_config;
        std::unique_ptr<Embedder> m_embedder;
        std::unique_ptr<PageFetcher> m_fetcher;
        VectorStore m_store;
        std::unique_ptr<Collection> m_collection;

        Collection& collection();
    };

}
