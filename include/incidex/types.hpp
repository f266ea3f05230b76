#pragma once
#include <map>
#include <string>
#include <vector>

namespace incidex::engine {

    using Metadata = std::map<std::string, std::string>;
    using Embedding = std::vector<float>;

    /**
     * @brief Canonical incident as produced by ingestion.
     */
    struct IncidentRecord {
        std::string id;
        std::string title;
        std::string description;
        std::string project;
        std::string source;
        Metadata extra;
    };

    /**
     * @brief One nearest-neighbour hit returned by a collection query.
     */
    struct QueryHit {
        std::string id;
        float distance = 0.0f;
        std::string document;
        Metadata metadata;
    };

    /**
     * @brief Bulk dump of a collection, ordered by insertion.
     */
    struct CollectionDump {
        std::vector<std::string> ids;
        std::vector<std::string> documents;
        std::vector<Metadata> metadatas;
        std::vector<Embedding> embeddings;
    };

}
