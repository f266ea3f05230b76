#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "incidex/types.hpp"

namespace incidex::engine {

    class Collection;
    class Embedder;
    class PageFetcher;

    constexpr size_t kParseBatchSize = 100;
    constexpr size_t kMaxExtraFieldChars = 500;
    constexpr size_t kMinBlockChars = 20;
    constexpr size_t kWebTitleChars = 100;

    /**
     * @brief Maps one source record onto the canonical incident shape.
     * @param fallback_id Used when no id alias is present (e.g. "csv_3").
     */
    IncidentRecord to_incident(const Metadata& fields, const std::string& fallback_id, const std::string& source);

    /**
     * @brief Text that gets embedded: title, description and project.
     */
    std::string document_text(const IncidentRecord& incident);

    /**
     * @brief The record minus its id, as stored beside the vector.
     */
    Metadata to_metadata(const IncidentRecord& incident);

    /**
     * @brief Loads incidents from a file or web page and writes them into a collection.
     */
    class IngestionPipeline {
    public:
        IngestionPipeline(Collection& collection, Embedder& embedder, PageFetcher& fetcher,
                          std::filesystem::path data_dir);

        /**
         * @brief {success, incidents_loaded, source, source_type, degraded_embeddings},
         * or an error payload. Never throws.
         * @param source_type "file" or "url".
         */
        nlohmann::json ingest(const std::string& source, const std::string& source_type);

        std::vector<IncidentRecord> load_from_file(const std::string& filename) const;
        std::vector<IncidentRecord> load_from_url(const std::string& url) const;

        /**
         * @brief Embeds and stores incidents in batches; a failed strict add is retried once as upsert.
         */
        void write(const std::vector<IncidentRecord>& incidents);

        /**
         * @brief First existing candidate among data/<name> beside the data dir,
         * <data_dir>/<name> and <name> itself.
         * @throws incidex::Error (SourceNotFound)
         */
        std::filesystem::path resolve_path(const std::string& filename) const;

    private:
        Collection& m_collection;
        Embedder& m_embedder;
        PageFetcher& m_fetcher;
        std::filesystem::path m_data_dir;

        std::vector<IncidentRecord> load_document(const std::filesystem::path& path, const std::string& filename) const;
        std::vector<IncidentRecord> load_table(const std::filesystem::path& path, const std::string& filename,
                                               char delimiter, const std::string& id_prefix) const;
    };

}
