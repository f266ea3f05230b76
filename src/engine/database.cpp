#include "database.hpp"
#include "incidex/errors.hpp"
#include <iostream>
#include <cstring>
#include <unordered_map>

namespace incidex::engine {

    namespace {
        Error store_failure(sqlite3* db, const std::string& what) {
            return Error(ErrorKind::StoreFailure, what + ": " + (db ? sqlite3_errmsg(db) : "no database"));
        }
    }

    Statement::Statement(sqlite3* db, const std::string& sql) : m_db(db) {
        if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw store_failure(m_db, "prepare failed");
        }
    }

    Statement::~Statement() {
        sqlite3_finalize(m_stmt);
    }

    void Statement::bind(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void Statement::bind(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    void Statement::bind_blob(int index, const void* data, size_t bytes) {
        sqlite3_bind_blob(m_stmt, index, data, static_cast<int>(bytes), SQLITE_TRANSIENT);
    }

    bool Statement::step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        if (sqlite3_extended_errcode(m_db) == SQLITE_CONSTRAINT_UNIQUE ||
            sqlite3_extended_errcode(m_db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
            throw Error(ErrorKind::StoreConflict, std::string("constraint violation: ") + sqlite3_errmsg(m_db));
        }
        throw store_failure(m_db, "step failed");
    }

    void Statement::reset() {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }

    std::string Statement::column_text(int index) const {
        const unsigned char* text = sqlite3_column_text(m_stmt, index);
        if (!text) return "";
        return std::string(reinterpret_cast<const char*>(text), sqlite3_column_bytes(m_stmt, index));
    }

    int64_t Statement::column_int(int index) const {
        return sqlite3_column_int64(m_stmt, index);
    }

    Embedding Statement::column_vector(int index) const {
        const void* blob = sqlite3_column_blob(m_stmt, index);
        int bytes = sqlite3_column_bytes(m_stmt, index);
        Embedding vec;
        if (blob && bytes > 0) {
            vec.resize(bytes / sizeof(float));
            memcpy(vec.data(), blob, vec.size() * sizeof(float));
        }
        return vec;
    }

    Transaction::Transaction(sqlite3* db) : m_db(db) {
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, "BEGIN IMMEDIATE;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : "unknown";
            sqlite3_free(err_msg);
            throw Error(ErrorKind::StoreFailure, "begin transaction failed: " + msg);
        }
    }

    Transaction::~Transaction() {
        if (!m_done) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void Transaction::commit() {
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, "COMMIT;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : "unknown";
            sqlite3_free(err_msg);
            throw Error(ErrorKind::StoreFailure, "commit failed: " + msg);
        }
        m_done = true;
    }

    Database::Database() = default;
    Database::~Database() { close(); }

    void Database::open(const std::filesystem::path& path) {
        if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            close();
            throw Error(ErrorKind::StoreFailure, "failed to open " + path.string() + ": " + msg);
        }
        sqlite3_busy_timeout(m_db, 5000);
        initialize_schema();
    }

    void Database::close() {
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    void Database::initialize_schema() {
        const char* sql =
            "PRAGMA foreign_keys = ON;"
            "CREATE TABLE IF NOT EXISTS collections ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  name TEXT UNIQUE NOT NULL,"
            "  dimension INTEGER NOT NULL DEFAULT 0,"
            "  description TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS entries ("
            "  label INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  collection_id INTEGER NOT NULL,"
            "  entry_id TEXT NOT NULL,"
            "  document TEXT NOT NULL,"
            "  embedding BLOB NOT NULL,"
            "  UNIQUE(collection_id, entry_id),"
            "  FOREIGN KEY(collection_id) REFERENCES collections(id) ON DELETE CASCADE"
            ");"
            "CREATE TABLE IF NOT EXISTS entry_metadata ("
            "  label INTEGER NOT NULL,"
            "  key TEXT NOT NULL,"
            "  value TEXT NOT NULL,"
            "  PRIMARY KEY(label, key),"
            "  FOREIGN KEY(label) REFERENCES entries(label) ON DELETE CASCADE"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_metadata_key_value ON entry_metadata(key, value);";
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : "unknown";
            sqlite3_free(err_msg);
            throw Error(ErrorKind::StoreFailure, "schema error: " + msg);
        }
    }

    CollectionInfo Database::ensure_collection(const std::string& name, const std::string& description) {
        CollectionInfo info;
        info.name = name;

        auto lookup = [&]() {
            Statement select(m_db, "SELECT id, dimension FROM collections WHERE name = ?;");
            select.bind(1, name);
            if (!select.step()) return false;
            info.id = select.column_int(0);
            info.dimension = static_cast<size_t>(select.column_int(1));
            return true;
        };

        // Opening an existing collection only reads.
        if (lookup()) return info;

        Statement insert(m_db, "INSERT OR IGNORE INTO collections (name, description) VALUES (?, ?);");
        insert.bind(1, name);
        insert.bind(2, description);
        insert.step();
        info.created = sqlite3_changes(m_db) > 0;

        if (!lookup()) {
            throw Error(ErrorKind::StoreFailure, "collection vanished after creation: " + name);
        }
        return info;
    }

    bool Database::delete_collection(const std::string& name) {
        Statement stmt(m_db, "DELETE FROM collections WHERE name = ?;");
        stmt.bind(1, name);
        stmt.step();
        return sqlite3_changes(m_db) > 0;
    }

    void Database::set_dimension(int64_t collection_id, size_t dimension) {
        Statement stmt(m_db, "UPDATE collections SET dimension = ? WHERE id = ?;");
        stmt.bind(1, static_cast<int64_t>(dimension));
        stmt.bind(2, collection_id);
        stmt.step();
    }

    int64_t Database::write_entry(int64_t collection_id, const std::string& id, const std::string& document,
                                  const Embedding& embedding, const Metadata& metadata, bool replace) {
        const char* insert_sql =
            "INSERT INTO entries (collection_id, entry_id, document, embedding) VALUES (?, ?, ?, ?);";
        const char* upsert_sql =
            "INSERT INTO entries (collection_id, entry_id, document, embedding) VALUES (?, ?, ?, ?) "
            "ON CONFLICT(collection_id, entry_id) DO UPDATE SET "
            "document = excluded.document, "
            "embedding = excluded.embedding;";

        {
            Statement stmt(m_db, replace ? upsert_sql : insert_sql);
            stmt.bind(1, collection_id);
            stmt.bind(2, id);
            stmt.bind(3, document);
            stmt.bind_blob(4, embedding.data(), embedding.size() * sizeof(float));
            stmt.step();
        }

        int64_t label = 0;
        {
            Statement stmt(m_db, "SELECT label FROM entries WHERE collection_id = ? AND entry_id = ?;");
            stmt.bind(1, collection_id);
            stmt.bind(2, id);
            if (!stmt.step()) throw Error(ErrorKind::StoreFailure, "entry vanished after write: " + id);
            label = stmt.column_int(0);
        }

        {
            Statement clear(m_db, "DELETE FROM entry_metadata WHERE label = ?;");
            clear.bind(1, label);
            clear.step();
        }

        Statement meta(m_db, "INSERT INTO entry_metadata (label, key, value) VALUES (?, ?, ?);");
        for (const auto& [key, value] : metadata) {
            meta.bind(1, label);
            meta.bind(2, key);
            meta.bind(3, value);
            meta.step();
            meta.reset();
        }
        return label;
    }

    size_t Database::count_entries(int64_t collection_id) {
        Statement stmt(m_db, "SELECT COUNT(*) FROM entries WHERE collection_id = ?;");
        stmt.bind(1, collection_id);
        stmt.step();
        return static_cast<size_t>(stmt.column_int(0));
    }

    std::vector<int64_t> Database::labels_matching(int64_t collection_id, const Metadata& where) {
        std::string sql = "SELECT e.label FROM entries e WHERE e.collection_id = ?";
        for (size_t i = 0; i < where.size(); ++i) {
            sql += " AND EXISTS (SELECT 1 FROM entry_metadata m WHERE m.label = e.label AND m.key = ? AND m.value = ?)";
        }
        sql += ";";

        Statement stmt(m_db, sql);
        int index = 1;
        stmt.bind(index++, collection_id);
        for (const auto& [key, value] : where) {
            stmt.bind(index++, key);
            stmt.bind(index++, value);
        }

        std::vector<int64_t> labels;
        while (stmt.step()) {
            labels.push_back(stmt.column_int(0));
        }
        return labels;
    }

    std::optional<EntryRow> Database::get_entry(int64_t label) {
        Statement stmt(m_db, "SELECT entry_id, document FROM entries WHERE label = ?;");
        stmt.bind(1, label);
        if (!stmt.step()) return std::nullopt;

        EntryRow row;
        row.label = label;
        row.id = stmt.column_text(0);
        row.document = stmt.column_text(1);
        row.metadata = load_metadata(label);
        return row;
    }

    Metadata Database::load_metadata(int64_t label) {
        Metadata metadata;
        Statement stmt(m_db, "SELECT key, value FROM entry_metadata WHERE label = ?;");
        stmt.bind(1, label);
        while (stmt.step()) {
            metadata.emplace(stmt.column_text(0), stmt.column_text(1));
        }
        return metadata;
    }

    void Database::for_each_entry(int64_t collection_id, bool with_embeddings,
                                  const std::function<void(EntryRow&&)>& callback) {
        std::vector<EntryRow> rows;
        std::unordered_map<int64_t, size_t> by_label;
        {
            Statement stmt(m_db, with_embeddings
                ? "SELECT label, entry_id, document, embedding FROM entries WHERE collection_id = ? ORDER BY label;"
                : "SELECT label, entry_id, document FROM entries WHERE collection_id = ? ORDER BY label;");
            stmt.bind(1, collection_id);
            while (stmt.step()) {
                EntryRow row;
                row.label = stmt.column_int(0);
                row.id = stmt.column_text(1);
                row.document = stmt.column_text(2);
                if (with_embeddings) row.embedding = stmt.column_vector(3);
                by_label.emplace(row.label, rows.size());
                rows.push_back(std::move(row));
            }
        }
        {
            Statement stmt(m_db,
                "SELECT m.label, m.key, m.value FROM entry_metadata m "
                "JOIN entries e ON e.label = m.label WHERE e.collection_id = ?;");
            stmt.bind(1, collection_id);
            while (stmt.step()) {
                auto it = by_label.find(stmt.column_int(0));
                if (it != by_label.end()) {
                    rows[it->second].metadata.emplace(stmt.column_text(1), stmt.column_text(2));
                }
            }
        }
        for (auto& row : rows) {
            callback(std::move(row));
        }
    }

}
