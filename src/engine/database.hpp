#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <functional>
#include <optional>
#include <sqlite3.h>
#include "incidex/types.hpp"

namespace incidex::engine {

    /**
     * @brief Owning wrapper around a prepared statement.
     * @throws incidex::Error (StoreFailure) when preparation fails.
     */
    class Statement {
    public:
        Statement(sqlite3* db, const std::string& sql);
        ~Statement();

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        void bind(int index, const std::string& value);
        void bind(int index, int64_t value);
        void bind_blob(int index, const void* data, size_t bytes);

        /**
         * @brief Steps once. Returns true for SQLITE_ROW, false for SQLITE_DONE.
         * @throws incidex::Error StoreConflict on unique violations, StoreFailure otherwise.
         */
        bool step();
        void reset();

        std::string column_text(int index) const;
        int64_t column_int(int index) const;
        Embedding column_vector(int index) const;

    private:
        sqlite3* m_db;
        sqlite3_stmt* m_stmt = nullptr;
    };

    /**
     * @brief BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
     */
    class Transaction {
    public:
        explicit Transaction(sqlite3* db);
        ~Transaction();
        void commit();

    private:
        sqlite3* m_db;
        bool m_done = false;
    };

    struct CollectionInfo {
        int64_t id = 0;
        std::string name;
        size_t dimension = 0;
        bool created = false;
    };

    struct EntryRow {
        int64_t label = 0;
        std::string id;
        std::string document;
        Embedding embedding;
        Metadata metadata;
    };

    class Database {
    public:
        Database();
        ~Database();

        /**
         * @brief Opens (creating if needed) the database file and its schema.
         * @throws incidex::Error (StoreFailure) if the file cannot be opened.
         */
        void open(const std::filesystem::path& path);
        void close();

        /**
         * @brief Initializes the schema if it doesn't exist.
         */
        void initialize_schema();

        /**
         * @brief Returns the named collection, creating it empty if absent.
         */
        CollectionInfo ensure_collection(const std::string& name, const std::string& description);

        /**
         * @brief Removes a collection and all of its entries.
         * @return false if no such collection existed.
         */
        bool delete_collection(const std::string& name);

        void set_dimension(int64_t collection_id, size_t dimension);

        /**
         * @brief Writes one entry and replaces its metadata.
         * @param replace false for strict insert (duplicate id throws StoreConflict).
         * @return The entry's stable label.
         */
        int64_t write_entry(int64_t collection_id, const std::string& id, const std::string& document,
                            const Embedding& embedding, const Metadata& metadata, bool replace);

        size_t count_entries(int64_t collection_id);

        /**
         * @brief Labels of entries whose metadata matches every key/value pair.
         */
        std::vector<int64_t> labels_matching(int64_t collection_id, const Metadata& where);

        /**
         * @brief Loads one entry (without its embedding).
         */
        std::optional<EntryRow> get_entry(int64_t label);

        /**
         * @brief Iterates all entries of a collection in insertion order.
         */
        void for_each_entry(int64_t collection_id, bool with_embeddings,
                            const std::function<void(EntryRow&&)>& callback);

        sqlite3* handle() const { return m_db; }

    private:
        sqlite3* m_db = nullptr;

        Metadata load_metadata(int64_t label);
    };

}
