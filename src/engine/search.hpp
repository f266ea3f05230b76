#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "incidex/types.hpp"

namespace incidex::engine {

    class Collection;
    class Embedder;

    // Hits at or below this similarity are noise and never returned.
    constexpr double kSimilarityThreshold = 0.3;
    constexpr size_t kPreviewChars = 300;
    constexpr size_t kDescriptionFallbackChars = 200;

    /**
     * @brief Display record for a stored entry: the canonical fields resolved through
     * their aliases, followed by every unclaimed metadata key unchanged.
     */
    nlohmann::json display_metadata(const std::string& id, const std::string& document, const Metadata& metadata);

    /**
     * @brief Rewrites filter keys that name a source column folded into a canonical
     * field (e.g. "Proyecto" to "project"); other keys pass through unchanged.
     */
    Metadata canonical_filters(const Metadata& filters);

    class SimilaritySearch {
    public:
        SimilaritySearch(const Collection& collection, Embedder& embedder);

        /**
         * @brief {success, query, similar_incidents, total_found, search_time_ms}, ordered by
         * decreasing similarity; on failure {query, error, error_kind, traceback, similar_incidents: []}.
         * Never throws.
         * @param filters Metadata equality constraints.
         */
        nlohmann::json search_similar(const std::string& query, int top_k = 5, const Metadata& filters = {});

    private:
        const Collection& m_collection;
        Embedder& m_embedder;
    };

}
