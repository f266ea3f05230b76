#include "vector_store.hpp"
#include "incidex/errors.hpp"
#include <algorithm>
#include <iostream>

namespace incidex::engine {

    Collection::Collection(Database& db, const CollectionInfo& info, std::filesystem::path index_path)
        : m_db(db), m_id(info.id), m_name(info.name), m_dimension(info.dimension),
          m_index_path(std::move(index_path)) {
        if (m_dimension > 0) load_index();
    }

    void Collection::add(const std::vector<std::string>& ids, const std::vector<std::string>& documents,
                         const std::vector<Embedding>& embeddings, const std::vector<Metadata>& metadatas) {
        write(ids, documents, embeddings, metadatas, false);
    }

    void Collection::upsert(const std::vector<std::string>& ids, const std::vector<std::string>& documents,
                            const std::vector<Embedding>& embeddings, const std::vector<Metadata>& metadatas) {
        write(ids, documents, embeddings, metadatas, true);
    }

    void Collection::write(const std::vector<std::string>& ids, const std::vector<std::string>& documents,
                           const std::vector<Embedding>& embeddings, const std::vector<Metadata>& metadatas,
                           bool replace) {
        if (documents.size() != ids.size() || embeddings.size() != ids.size() || metadatas.size() != ids.size()) {
            throw Error(ErrorKind::InvalidArgument, "ids, documents, embeddings and metadatas differ in length");
        }
        if (ids.empty()) return;

        const size_t dim = m_dimension > 0 ? m_dimension : embeddings.front().size();
        if (dim == 0) throw Error(ErrorKind::StoreFailure, "empty embedding for id " + ids.front());
        for (size_t i = 0; i < embeddings.size(); ++i) {
            if (embeddings[i].size() != dim) {
                throw Error(ErrorKind::StoreFailure, "embedding for id " + ids[i] + " has dimension " +
                                                     std::to_string(embeddings[i].size()) + ", collection uses " +
                                                     std::to_string(dim));
            }
        }

        std::vector<int64_t> labels;
        labels.reserve(ids.size());
        bool index_touched = false;
        try {
            Transaction tx(m_db.handle());
            if (m_dimension == 0) m_db.set_dimension(m_id, dim);
            for (size_t i = 0; i < ids.size(); ++i) {
                labels.push_back(m_db.write_entry(m_id, ids[i], documents[i], embeddings[i], metadatas[i], replace));
            }

            // Index first, commit last: a failed index insert rolls the rows back too.
            if (!m_librarian) m_librarian = std::make_unique<Librarian>(dim);
            index_touched = true;
            for (size_t i = 0; i < labels.size(); ++i) {
                m_librarian->add_item(static_cast<size_t>(labels[i]), embeddings[i]);
            }
            tx.commit();
        } catch (const std::exception&) {
            if (index_touched) restore_index();
            throw;
        }

        m_dimension = dim;
        m_librarian->save(m_index_path);
    }

    void Collection::restore_index() {
        std::cerr << "[VectorStore] Index insert for '" << m_name << "' failed; restoring index from database\n";
        if (m_dimension == 0) {
            m_librarian.reset();
            return;
        }
        try {
            rebuild_index();
        } catch (const std::exception& e) {
            std::cerr << "[VectorStore] Index restore failed, it will be rebuilt on next open: " << e.what() << "\n";
        }
    }

    size_t Collection::indexed_count() const {
        return m_librarian ? m_librarian->count() : 0;
    }

    std::vector<QueryHit> Collection::query(const Embedding& query_embedding, size_t k, const Metadata& where) const {
        std::vector<QueryHit> hits;
        k = std::min(k, kMaxQueryResults);
        if (k == 0 || !m_librarian) return hits;

        std::unordered_set<size_t> allowed;
        if (!where.empty()) {
            for (int64_t label : m_db.labels_matching(m_id, where)) {
                allowed.insert(static_cast<size_t>(label));
            }
            if (allowed.empty()) return hits;
        }

        auto neighbours = m_librarian->search(query_embedding, k, where.empty() ? nullptr : &allowed);
        for (const auto& [label, distance] : neighbours) {
            auto row = m_db.get_entry(static_cast<int64_t>(label));
            if (!row) continue; // index ahead of a rolled-back write
            hits.push_back({row->id, distance, row->document, row->metadata});
        }
        return hits;
    }

    size_t Collection::count() const {
        return m_db.count_entries(m_id);
    }

    CollectionDump Collection::get(const Include& include) const {
        CollectionDump dump;
        m_db.for_each_entry(m_id, include.embeddings, [&](EntryRow&& row) {
            dump.ids.push_back(row.id);
            if (include.documents) dump.documents.push_back(std::move(row.document));
            if (include.metadatas) dump.metadatas.push_back(std::move(row.metadata));
            if (include.embeddings) dump.embeddings.push_back(std::move(row.embedding));
        });
        return dump;
    }

    void Collection::load_index() {
        m_librarian = std::make_unique<Librarian>(m_dimension);
        const size_t rows = count();
        if (m_librarian->load(m_index_path) && m_librarian->count() == rows) {
            std::cout << "[VectorStore] Index for '" << m_name << "' loaded with " << rows << " vectors.\n";
            return;
        }
        rebuild_index();
    }

    void Collection::rebuild_index() {
        std::cout << "[VectorStore] Rebuilding index for '" << m_name << "' from database...\n";
        m_librarian = std::make_unique<Librarian>(m_dimension, std::max<size_t>(count(), 1000));
        m_db.for_each_entry(m_id, true, [&](EntryRow&& row) {
            if (row.embedding.size() == m_dimension) {
                m_librarian->add_item(static_cast<size_t>(row.label), row.embedding);
            } else {
                std::cerr << "[VectorStore] Skipping '" << row.id << "': stored vector has dimension "
                          << row.embedding.size() << "\n";
            }
        });
        m_librarian->save(m_index_path);
        std::cout << "[VectorStore] Index ready with " << m_librarian->count() << " vectors.\n";
    }

    VectorStore::VectorStore(const std::filesystem::path& data_dir) : m_data_dir(data_dir) {
        std::error_code ec;
        std::filesystem::create_directories(m_data_dir, ec);
        if (ec) {
            throw Error(ErrorKind::StoreFailure, "cannot create data directory " + m_data_dir.string() + ": " + ec.message());
        }
        m_db.open(database_path());
    }

    std::unique_ptr<Collection> VectorStore::open_or_create(const std::string& name) {
        auto info = m_db.ensure_collection(name, "Incidents for semantic search");
        if (info.created) {
            // A stale index file from an earlier collection of the same name must not be reused.
            std::error_code ec;
            std::filesystem::remove(index_path(name), ec);
        }
        auto collection = std::make_unique<Collection>(m_db, info, index_path(name));
        if (info.created) {
            std::cout << "[VectorStore] Collection '" << name << "' created (empty).\n";
        } else {
            std::cout << "[VectorStore] Collection '" << name << "' loaded with " << collection->count() << " entries.\n";
        }
        return collection;
    }

    bool VectorStore::delete_collection(const std::string& name) {
        bool existed = m_db.delete_collection(name);
        std::error_code ec;
        std::filesystem::remove(index_path(name), ec);
        if (ec) {
            std::cerr << "[VectorStore] Could not remove index file: " << ec.message() << "\n";
        }
        return existed;
    }

}
