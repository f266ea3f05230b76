#pragma once

#include <vector>
#include <string>
#include <memory>
#include <utility>
#include <filesystem>
#include <unordered_set>
#include "incidex/types.hpp"

namespace incidex::engine {

    /**
     * @brief In-memory HNSW index over cosine distance (1 - dot of L2-normalised vectors).
     */
    class Librarian {
    public:
        Librarian(size_t dim, size_t max_elements = 10000);
        ~Librarian();

        /**
         * @brief Adds a vector to the index, replacing any vector already stored under label.
         * @param label The stable entry label (from database).
         * @param vector The embedding vector; normalised internally.
         * @throws incidex::Error (StoreFailure) on dimension mismatch.
         */
        void add_item(size_t label, const Embedding& vector);

        /**
         * @brief Searches for the nearest neighbors.
         * @param query_vector The query vector.
         * @param k Number of results to return.
         * @param allowed If non-null, only these labels may be returned.
         * @return (label, distance) pairs, nearest first.
         */
        std::vector<std::pair<size_t, float>> search(const Embedding& query_vector, size_t k,
                                                     const std::unordered_set<size_t>* allowed = nullptr) const;

        /**
         * @brief Persists the index to disk.
         */
        void save(const std::filesystem::path& path) const;

        /**
         * @brief Loads the index from disk.
         * @return false if the file is missing or unreadable; the index is left empty.
         */
        bool load(const std::filesystem::path& path);

        /**
         * @brief Returns current number of elements.
         */
        size_t count() const;

        size_t dimension() const { return m_dim; }

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
        size_t m_dim;
    };

}
