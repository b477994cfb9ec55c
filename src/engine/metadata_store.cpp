#include "metadata_store.hpp"
#include <sqlite3.h>
#include <iostream>
#include <string>

namespace retina::engine {

    namespace {

        enum class ValueKind : int {
            Bool = 0,
            Integer = 1,
            Real = 2,
            Text = 3
        };

        class Connection {
        public:
            Connection() = default;
            Connection(const Connection&) = delete;
            Connection& operator=(const Connection&) = delete;
            ~Connection() { close(); }

            bool open(const std::filesystem::path& path, int flags) {
                if (sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
                    m_error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
                    close();
                    return false;
                }
                return true;
            }

            void close() {
                if (m_db) {
                    sqlite3_close(m_db);
                    m_db = nullptr;
                }
            }

            bool exec(const char* sql) {
                char* err_msg = nullptr;
                if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
                    m_error = err_msg ? err_msg : "unknown error";
                    sqlite3_free(err_msg);
                    return false;
                }
                return true;
            }

            sqlite3* handle() const { return m_db; }
            std::string error() const { return m_db ? sqlite3_errmsg(m_db) : m_error; }

        private:
            sqlite3* m_db = nullptr;
            std::string m_error;
        };

        const char* kSchema =
            "CREATE TABLE items ("
            "  id INTEGER PRIMARY KEY"
            ");"
            "CREATE TABLE attributes ("
            "  item_id INTEGER NOT NULL,"
            "  ordinal INTEGER NOT NULL,"
            "  key TEXT NOT NULL,"
            "  kind INTEGER NOT NULL,"
            "  value,"
            "  PRIMARY KEY(item_id, ordinal),"
            "  FOREIGN KEY(item_id) REFERENCES items(id)"
            ");";

        void bind_value(sqlite3_stmt* stmt, int column, const Value& value) {
            if (std::holds_alternative<bool>(value)) {
                sqlite3_bind_int(stmt, column, std::get<bool>(value) ? 1 : 0);
            } else if (std::holds_alternative<std::int64_t>(value)) {
                sqlite3_bind_int64(stmt, column, std::get<std::int64_t>(value));
            } else if (std::holds_alternative<double>(value)) {
                sqlite3_bind_double(stmt, column, std::get<double>(value));
            } else {
                const auto& text = std::get<std::string>(value);
                sqlite3_bind_text(stmt, column, text.c_str(), static_cast<int>(text.size()), SQLITE_STATIC);
            }
        }

        ValueKind kind_of(const Value& value) {
            if (std::holds_alternative<bool>(value)) return ValueKind::Bool;
            if (std::holds_alternative<std::int64_t>(value)) return ValueKind::Integer;
            if (std::holds_alternative<double>(value)) return ValueKind::Real;
            return ValueKind::Text;
        }

        std::string column_string(sqlite3_stmt* stmt, int column) {
            const unsigned char* text = sqlite3_column_text(stmt, column);
            if (!text) return {};
            return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
        }

        Error io_error(const std::string& what, const Connection& db) {
            return make_error(ErrorCode::IoError, "metadata: " + what + ": " + db.error());
        }

        Error corrupt(const std::string& what) {
            return make_error(ErrorCode::CorruptState, "metadata: " + what);
        }

    }

    std::uint64_t MetadataStore::append(Record record) {
        m_records.push_back(std::move(record));
        return m_records.size() - 1;
    }

    const Record* MetadataStore::get(std::uint64_t id) const {
        if (id >= m_records.size()) return nullptr;
        return &m_records[id];
    }

    Result<void> MetadataStore::write(const std::filesystem::path& path) const {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            return make_error(ErrorCode::IoError, "metadata: refusing to overwrite " + path.string());
        }

        Connection db;
        if (!db.open(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)) return io_error("open " + path.string(), db);
        if (!db.exec(kSchema)) return io_error("schema", db);
        if (!db.exec("BEGIN TRANSACTION;")) return io_error("begin", db);

        sqlite3_stmt* item_stmt = nullptr;
        sqlite3_stmt* attr_stmt = nullptr;
        if (sqlite3_prepare_v2(db.handle(), "INSERT INTO items (id) VALUES (?);", -1, &item_stmt, nullptr) != SQLITE_OK) {
            return io_error("prepare", db);
        }
        if (sqlite3_prepare_v2(db.handle(),
                               "INSERT INTO attributes (item_id, ordinal, key, kind, value) VALUES (?, ?, ?, ?, ?);",
                               -1, &attr_stmt, nullptr) != SQLITE_OK) {
            sqlite3_finalize(item_stmt);
            return io_error("prepare", db);
        }

        bool success = true;
        for (size_t id = 0; id < m_records.size() && success; ++id) {
            sqlite3_bind_int64(item_stmt, 1, static_cast<sqlite3_int64>(id));
            success = (sqlite3_step(item_stmt) == SQLITE_DONE);
            sqlite3_reset(item_stmt);

            int ordinal = 0;
            for (const auto& [key, value] : m_records[id]) {
                if (!success) break;
                sqlite3_bind_int64(attr_stmt, 1, static_cast<sqlite3_int64>(id));
                sqlite3_bind_int(attr_stmt, 2, ordinal++);
                sqlite3_bind_text(attr_stmt, 3, key.c_str(), static_cast<int>(key.size()), SQLITE_STATIC);
                sqlite3_bind_int(attr_stmt, 4, static_cast<int>(kind_of(value)));
                bind_value(attr_stmt, 5, value);
                success = (sqlite3_step(attr_stmt) == SQLITE_DONE);
                sqlite3_reset(attr_stmt);
                sqlite3_clear_bindings(attr_stmt);
            }
        }
        sqlite3_finalize(item_stmt);
        sqlite3_finalize(attr_stmt);

        if (!success) {
            auto err = io_error("insert", db);
            if (!db.exec("ROLLBACK;")) {
                std::cerr << "[MetadataStore] Rollback failed: " << db.error() << "\n";
            }
            return err;
        }
        if (!db.exec("COMMIT;")) return io_error("commit", db);
        return {};
    }

    Result<MetadataStore> MetadataStore::read(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return make_error(ErrorCode::NotFound, "metadata: missing " + path.string());
        }

        Connection db;
        if (!db.open(path, SQLITE_OPEN_READONLY)) return corrupt("cannot open: " + db.error());

        MetadataStore store;
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db.handle(), "SELECT id FROM items ORDER BY id;", -1, &stmt, nullptr) != SQLITE_OK) {
            return corrupt("items table: " + db.error());
        }
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            auto id = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
            if (id != store.size()) {
                sqlite3_finalize(stmt);
                return corrupt("non-contiguous item ids");
            }
            store.m_records.emplace_back();
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) return corrupt("reading items: " + db.error());

        const char* sql = "SELECT item_id, key, kind, value FROM attributes ORDER BY item_id, ordinal;";
        if (sqlite3_prepare_v2(db.handle(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return corrupt("attributes table: " + db.error());
        }
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            auto id = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
            if (id >= store.size()) {
                sqlite3_finalize(stmt);
                return corrupt("attribute for unknown item");
            }
            std::string key = column_string(stmt, 1);
            Value value;
            switch (static_cast<ValueKind>(sqlite3_column_int(stmt, 2))) {
                case ValueKind::Bool: value = sqlite3_column_int(stmt, 3) != 0; break;
                case ValueKind::Integer: value = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 3)); break;
                case ValueKind::Real: value = sqlite3_column_double(stmt, 3); break;
                case ValueKind::Text: value = column_string(stmt, 3); break;
                default:
                    sqlite3_finalize(stmt);
                    return corrupt("unknown value kind for key " + key);
            }
            store.m_records[id].set(key, std::move(value));
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) return corrupt("reading attributes: " + db.error());

        return std::move(store);
    }

}
