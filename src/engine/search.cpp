#include "search.hpp"
#include "aliases.hpp"
#include "embedder.hpp"
#include "envelope.hpp"
#include "text.hpp"
#include "vector_store.hpp"
#include "incidex/errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

using json = nlohmann::json;

namespace incidex::engine {

    namespace {
        bool is_claimed(const std::string& key) {
            static const aliases::AliasList* const claimed[] = {
                &aliases::kDisplayId, &aliases::kDisplayProject, &aliases::kDisplayDate,
                &aliases::kDisplayDescription, &aliases::kDisplayResolution,
                &aliases::kDisplayStatus, &aliases::kDisplayPriority
            };
            if (key == "source") return true;
            return std::any_of(std::begin(claimed), std::end(claimed),
                               [&](const aliases::AliasList* list) { return aliases::contains(*list, key); });
        }
    }

    json display_metadata(const std::string& id, const std::string& document, const Metadata& metadata) {
        json out = {
            {"ID", aliases::resolve_or(metadata, aliases::kDisplayId, id)},
            {"project", aliases::resolve_or(metadata, aliases::kDisplayProject, aliases::kDefaultProject)},
            {"date", aliases::resolve_or(metadata, aliases::kDisplayDate, "N/A")},
            {"description", aliases::resolve_or(metadata, aliases::kDisplayDescription,
                                                text::utf8_truncate(document, kDescriptionFallbackChars))},
            {"resolution", aliases::resolve_or(metadata, aliases::kDisplayResolution, "Not recorded")},
            {"status", aliases::resolve_or(metadata, aliases::kDisplayStatus, "")},
            {"priority", aliases::resolve_or(metadata, aliases::kDisplayPriority, "")}
        };
        for (const auto& [key, value] : metadata) {
            if (!is_claimed(key)) out[key] = value;
        }
        return out;
    }

    Metadata canonical_filters(const Metadata& filters) {
        static const std::pair<const aliases::AliasList*, const char*> folded[] = {
            {&aliases::kProject, "project"},
            {&aliases::kTitle, "title"},
            {&aliases::kDescription, "description"}
        };
        Metadata out;
        for (const auto& [key, value] : filters) {
            std::string canonical = key;
            for (const auto& [list, name] : folded) {
                if (aliases::contains(*list, key)) {
                    canonical = name;
                    break;
                }
            }
            out[canonical] = value;
        }
        return out;
    }

    SimilaritySearch::SimilaritySearch(const Collection& collection, Embedder& embedder)
        : m_collection(collection), m_embedder(embedder) {}

    json SimilaritySearch::search_similar(const std::string& query, int top_k, const Metadata& filters) {
        const auto started = std::chrono::steady_clock::now();
        try {
            std::cout << "[SimilaritySearch] Searching similar to: '" << text::utf8_truncate(query, 50) << "...'\n";
            if (text::trim(query).empty()) {
                throw Error(ErrorKind::InvalidArgument, "query text is empty");
            }
            if (m_collection.count() == 0) {
                throw Error(ErrorKind::NoData, "collection '" + m_collection.name() + "' is empty; load incidents first");
            }

            json similar = json::array();
            if (top_k > 0) {
                const Embedding query_embedding = m_embedder.embed_batch({query}).front();
                const size_t k = std::min(static_cast<size_t>(top_k), kMaxQueryResults);

                for (const auto& hit : m_collection.query(query_embedding, k, canonical_filters(filters))) {
                    const double similarity = 1.0 - static_cast<double>(hit.distance);
                    if (similarity <= kSimilarityThreshold) continue;

                    auto source = hit.metadata.find("source");
                    similar.push_back(json{
                        {"id", hit.id},
                        {"similarity_score", similarity},
                        {"text", text::utf8_truncate(hit.document, kPreviewChars)},
                        {"full_text", hit.document},
                        {"source", source != hit.metadata.end() ? source->second : ""},
                        {"metadata", display_metadata(hit.id, hit.document, hit.metadata)}
                    });
                }
            }

            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            std::cout << "[SimilaritySearch] Found " << similar.size() << " similar incidents\n";

            return {
                {"success", true},
                {"query", query},
                {"similar_incidents", similar},
                {"total_found", similar.size()},
                {"search_time_ms", elapsed}
            };
        } catch (const std::exception& e) {
            std::cerr << "[SimilaritySearch] " << describe_nested(e) << "\n";
            json payload = error_payload(e, "search failed");
            payload["query"] = query;
            payload["similar_incidents"] = json::array();
            return payload;
        }
    }

}
