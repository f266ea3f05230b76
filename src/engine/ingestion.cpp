#include "ingestion.hpp"
#include "aliases.hpp"
#include "embedder.hpp"
#include "envelope.hpp"
#include "page_fetcher.hpp"
#include "source_reader.hpp"
#include "text.hpp"
#include "vector_store.hpp"
#include "incidex/errors.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace incidex::engine {

    namespace {
        const char* const kCanonicalKeys[] = {"id", "title", "description", "project", "source"};

        bool is_canonical_key(const std::string& key) {
            for (const char* canonical : kCanonicalKeys) {
                if (key == canonical) return true;
            }
            return false;
        }
    }

    IncidentRecord to_incident(const Metadata& fields, const std::string& fallback_id, const std::string& source) {
        std::set<std::string> consumed;
        auto take = [&](const aliases::AliasList& names, const std::string& fallback) {
            auto match = aliases::resolve(fields, names);
            if (!match) return fallback;
            consumed.insert(match->first);
            return match->second;
        };

        IncidentRecord incident;
        incident.id = take(aliases::kId, fallback_id);
        if (incident.id.empty()) incident.id = fallback_id;
        incident.title = take(aliases::kTitle, aliases::kDefaultTitle);
        incident.description = take(aliases::kDescription, "");
        incident.project = take(aliases::kProject, aliases::kDefaultProject);
        incident.source = source;

        for (const auto& [key, value] : fields) {
            if (consumed.count(key) || is_canonical_key(key)) continue;
            incident.extra[key] = text::utf8_truncate(value, kMaxExtraFieldChars);
        }
        return incident;
    }

    std::string document_text(const IncidentRecord& incident) {
        return incident.title + " " + incident.description + " " + incident.project;
    }

    Metadata to_metadata(const IncidentRecord& incident) {
        Metadata metadata = incident.extra;
        metadata["title"] = incident.title;
        metadata["description"] = incident.description;
        metadata["project"] = incident.project;
        metadata["source"] = incident.source;
        return metadata;
    }

    IngestionPipeline::IngestionPipeline(Collection& collection, Embedder& embedder, PageFetcher& fetcher,
                                         std::filesystem::path data_dir)
        : m_collection(collection), m_embedder(embedder), m_fetcher(fetcher), m_data_dir(std::move(data_dir)) {}

    nlohmann::json IngestionPipeline::ingest(const std::string& source, const std::string& source_type) {
        try {
            std::vector<IncidentRecord> incidents;
            if (source_type == "url") {
                incidents = load_from_url(source);
            } else if (source_type == "file") {
                incidents = load_from_file(source);
            } else {
                throw Error(ErrorKind::UnsupportedFormat, "unsupported source type: " + source_type);
            }

            if (incidents.empty()) {
                throw Error(ErrorKind::NoData, "no incidents found in " + source);
            }

            const size_t degraded_before = m_embedder.degraded_count();
            write(incidents);
            const size_t degraded = m_embedder.degraded_count() - degraded_before;
            if (degraded > 0) {
                std::cerr << "[IngestionPipeline] " << degraded << " of " << incidents.size()
                          << " embeddings degraded to placeholder vectors\n";
            }

            return {
                {"success", true},
                {"incidents_loaded", incidents.size()},
                {"source", source},
                {"source_type", source_type},
                {"degraded_embeddings", degraded}
            };
        } catch (const std::exception& e) {
            std::cerr << "[IngestionPipeline] " << describe_nested(e) << "\n";
            return error_payload(e, "error loading incidents");
        }
    }

    std::filesystem::path IngestionPipeline::resolve_path(const std::string& filename) const {
        const std::filesystem::path candidates[] = {
            m_data_dir.parent_path() / "data" / filename,
            m_data_dir / filename,
            std::filesystem::path(filename)
        };
        for (const auto& candidate : candidates) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
        }
        throw Error(ErrorKind::SourceNotFound, "file not found: " + filename);
    }

    std::vector<IncidentRecord> IngestionPipeline::load_from_file(const std::string& filename) const {
        const std::string ext = text::extension_of(filename);
        if (ext != ".json" && ext != ".csv" && ext != ".tsv") {
            throw Error(ErrorKind::UnsupportedFormat, "unsupported file format: " + filename);
        }
        const auto path = resolve_path(filename);

        try {
            if (ext == ".json") return load_document(path, filename);
            if (ext == ".tsv") return load_table(path, filename, '\t', "tsv_");
            return load_table(path, filename, ',', "csv_");
        } catch (const std::exception&) {
            std::throw_with_nested(Error(ErrorKind::UnsupportedFormat, "while reading " + path.string()));
        }
    }

    std::vector<IncidentRecord> IngestionPipeline::load_document(const std::filesystem::path& path,
                                                                 const std::string& filename) const {
        std::cout << "[IngestionPipeline] Loading JSON from: " << path << "\n";
        const auto document = read_document(path);
        const auto* items = find_item_list(document);
        if (!items) {
            std::cerr << "[IngestionPipeline] No list of records in " << filename << "\n";
            return {};
        }
        std::cout << "[IngestionPipeline] Processing " << items->size() << " items...\n";

        std::vector<IncidentRecord> incidents;
        size_t skipped = 0;
        for (size_t batch_start = 0; batch_start < items->size(); batch_start += kParseBatchSize) {
            const size_t batch_end = std::min(batch_start + kParseBatchSize, items->size());
            for (size_t idx = batch_start; idx < batch_end; ++idx) {
                const auto& item = (*items)[idx];
                if (!item.is_object()) {
                    ++skipped;
                    continue;
                }
                incidents.push_back(to_incident(flatten_item(item), "json_" + std::to_string(idx), filename));
            }
            if (batch_start % 500 == 0 && batch_start > 0) {
                std::cout << "[IngestionPipeline]   Processed " << batch_start << " incidents...\n";
            }
        }
        if (skipped > 0) {
            std::cerr << "[IngestionPipeline] Skipped " << skipped << " non-object items\n";
        }
        std::cout << "[IngestionPipeline] Parsed " << incidents.size() << " incidents.\n";
        return incidents;
    }

    std::vector<IncidentRecord> IngestionPipeline::load_table(const std::filesystem::path& path,
                                                              const std::string& filename, char delimiter,
                                                              const std::string& id_prefix) const {
        std::cout << "[IngestionPipeline] Loading table from: " << path << "\n";
        const auto table = read_delimited(path, delimiter);

        std::vector<IncidentRecord> incidents;
        incidents.reserve(table.rows.size());
        for (size_t idx = 0; idx < table.rows.size(); ++idx) {
            Metadata fields;
            for (size_t col = 0; col < table.columns.size(); ++col) {
                fields.emplace(table.columns[col], table.rows[idx][col]);
            }
            incidents.push_back(to_incident(fields, id_prefix + std::to_string(idx), filename));
        }
        std::cout << "[IngestionPipeline] Parsed " << incidents.size() << " rows.\n";
        return incidents;
    }

    std::vector<IncidentRecord> IngestionPipeline::load_from_url(const std::string& url) const {
        std::cout << "[IngestionPipeline] Fetching: " << url << "\n";
        const auto blocks = extract_incident_blocks(m_fetcher.fetch(url));

        std::vector<IncidentRecord> incidents;
        for (size_t i = 0; i < blocks.size(); ++i) {
            if (text::utf8_length(blocks[i]) <= kMinBlockChars) continue;
            IncidentRecord incident;
            incident.id = "web_" + std::to_string(i);
            incident.title = text::utf8_truncate(blocks[i], kWebTitleChars);
            incident.description = blocks[i];
            incident.source = url;
            incident.project = "Web Scraping";
            incidents.push_back(std::move(incident));
        }
        std::cout << "[IngestionPipeline] " << incidents.size() << " of " << blocks.size()
                  << " matched blocks kept.\n";
        return incidents;
    }

    void IngestionPipeline::write(const std::vector<IncidentRecord>& incidents) {
        const size_t batch_size = std::max<size_t>(m_embedder.batch_size(), 1);
        std::cout << "[IngestionPipeline] Adding " << incidents.size() << " incidents to '"
                  << m_collection.name() << "'...\n";

        for (size_t batch_start = 0; batch_start < incidents.size(); batch_start += batch_size) {
            const size_t batch_end = std::min(batch_start + batch_size, incidents.size());
            const size_t batch_no = batch_start / batch_size + 1;

            std::vector<std::string> ids;
            std::vector<std::string> documents;
            std::vector<Metadata> metadatas;
            for (size_t i = batch_start; i < batch_end; ++i) {
                ids.push_back(incidents[i].id);
                documents.push_back(document_text(incidents[i]));
                metadatas.push_back(to_metadata(incidents[i]));
            }

            if (batch_start % 100 == 0) {
                std::cout << "[IngestionPipeline]   Embedding batch " << batch_no << "... ("
                          << batch_start << "/" << incidents.size() << ")\n";
            }
            auto embeddings = m_embedder.embed_batch(documents);

            try {
                m_collection.add(ids, documents, embeddings, metadatas);
            } catch (const std::exception& e) {
                std::cout << "[IngestionPipeline]   Using upsert for batch " << batch_no << " (" << e.what() << ")\n";
                try {
                    m_collection.upsert(ids, documents, embeddings, metadatas);
                } catch (const std::exception&) {
                    std::throw_with_nested(Error(ErrorKind::StoreFailure,
                                                 "while writing batch " + std::to_string(batch_no)));
                }
            }
        }
        std::cout << "[IngestionPipeline] Completed: " << incidents.size() << " incidents in '"
                  << m_collection.name() << "'.\n";
    }

}
