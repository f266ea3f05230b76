#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "incidex/types.hpp"
#include "database.hpp"
#include "librarian.hpp"

namespace incidex::engine {

    // Upper bound on neighbours returned by a single query, whatever k asks for.
    constexpr size_t kMaxQueryResults = 50;

    struct Include {
        bool documents = true;
        bool metadatas = true;
        bool embeddings = false;
    };

    /**
     * @brief A named set of (id, document, embedding, metadata) entries.
     *
     * Entries live in SQLite; nearest-neighbour search goes through a hnswlib
     * index persisted beside the database and rebuilt from SQLite whenever the
     * two disagree on cardinality.
     */
    class Collection {
    public:
        Collection(Database& db, const CollectionInfo& info, std::filesystem::path index_path);

        const std::string& name() const { return m_name; }
        size_t dimension() const { return m_dimension; }
        const std::filesystem::path& index_path() const { return m_index_path; }

        /**
         * @brief Strict insert of a batch.
         * @throws incidex::Error StoreConflict if any id already exists (nothing is written),
         *         StoreFailure for any other store error.
         */
        void add(const std::vector<std::string>& ids, const std::vector<std::string>& documents,
                 const std::vector<Embedding>& embeddings, const std::vector<Metadata>& metadatas);

        /**
         * @brief Insert-or-replace of a batch.
         */
        void upsert(const std::vector<std::string>& ids, const std::vector<std::string>& documents,
                    const std::vector<Embedding>& embeddings, const std::vector<Metadata>& metadatas);

        /**
         * @brief Up to min(k, kMaxQueryResults) nearest entries, nearest first.
         * @param where Metadata equality constraints; empty means no filter.
         */
        std::vector<QueryHit> query(const Embedding& query_embedding, size_t k, const Metadata& where = {}) const;

        size_t count() const;

        /**
         * @brief Vectors currently held by the nearest-neighbour index.
         */
        size_t indexed_count() const;

        /**
         * @brief Bulk dump in insertion order.
         */
        CollectionDump get(const Include& include = Include{}) const;

    private:
        Database& m_db;
        int64_t m_id;
        std::string m_name;
        size_t m_dimension;
        std::filesystem::path m_index_path;
        std::unique_ptr<Librarian> m_librarian;

        void write(const std::vector<std::string>& ids, const std::vector<std::string>& documents,
                   const std::vector<Embedding>& embeddings, const std::vector<Metadata>& metadatas, bool replace);
        void load_index();
        void rebuild_index();
        void restore_index();
    };

    /**
     * @brief Persistent store of named collections under one data directory.
     */
    class VectorStore {
    public:
        /**
         * @throws incidex::Error (StoreFailure) if the database cannot be opened.
         */
        explicit VectorStore(const std::filesystem::path& data_dir);

        /**
         * @brief Returns the existing collection, or creates it empty. Never fails on "already exists".
         */
        std::unique_ptr<Collection> open_or_create(const std::string& name);

        /**
         * @brief Deletes a collection, its entries and its index file.
         * Collections previously returned for this name must not be used afterwards.
         * @return false if it did not exist.
         */
        bool delete_collection(const std::string& name);

        const std::filesystem::path& data_dir() const { return m_data_dir; }
        std::filesystem::path database_path() const { return m_data_dir / "incidex.db"; }
        std::filesystem::path index_path(const std::string& name) const { return m_data_dir / (name + ".hnsw"); }

    private:
        std::filesystem::path m_data_dir;
        Database m_db;
    };

}
