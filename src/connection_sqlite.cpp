#include "tabula/sqlconnection.hpp"
#include <sqlite3.h>
#include <cctype>
#include <iostream>
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    // Extended result code -> SQLITE_* name used by the error classifier.
    std::string code_name(int extended) {
        switch (extended) {
            case SQLITE_CONSTRAINT_UNIQUE:     return "SQLITE_CONSTRAINT_UNIQUE";
            case SQLITE_CONSTRAINT_PRIMARYKEY: return "SQLITE_CONSTRAINT_PRIMARYKEY";
            case SQLITE_CONSTRAINT_FOREIGNKEY: return "SQLITE_CONSTRAINT_FOREIGNKEY";
            case SQLITE_CONSTRAINT_NOTNULL:    return "SQLITE_CONSTRAINT_NOTNULL";
            case SQLITE_CONSTRAINT_CHECK:      return "SQLITE_CONSTRAINT_CHECK";
        }
        switch (extended & 0xff) {
            case SQLITE_CONSTRAINT: return "SQLITE_CONSTRAINT";
            case SQLITE_CANTOPEN:   return "SQLITE_CANTOPEN";
            case SQLITE_NOTADB:     return "SQLITE_NOTADB";
            case SQLITE_IOERR:      return "SQLITE_IOERR";
            case SQLITE_AUTH:       return "SQLITE_AUTH";
            case SQLITE_BUSY:       return "SQLITE_BUSY";
            case SQLITE_LOCKED:     return "SQLITE_LOCKED";
            case SQLITE_READONLY:   return "SQLITE_READONLY";
            case SQLITE_FULL:       return "SQLITE_FULL";
            case SQLITE_MISUSE:     return "SQLITE_MISUSE";
            case SQLITE_RANGE:      return "SQLITE_RANGE";
            case SQLITE_MISMATCH:   return "SQLITE_MISMATCH";
        }
        return "SQLITE_ERROR";
    }

    class SQLiteStatement {
    public:
        explicit SQLiteStatement(sqlite3_stmt* stmt) : stmt_(stmt) {}
        ~SQLiteStatement() {
            if (stmt_) sqlite3_finalize(stmt_);
        }
        SQLiteStatement(const SQLiteStatement&) = delete;
        SQLiteStatement& operator=(const SQLiteStatement&) = delete;

        sqlite3_stmt* get() const { return stmt_; }

        // Numbered placeholders: params[i] goes to ?i+1. Statements without placeholders take none.
        int bind(const Params& params) {
            const int count = sqlite3_bind_parameter_count(stmt_);
            for (int i = 0; i < count && i < static_cast<int>(params.size()); ++i) {
                int rc = bind_one(i + 1, params[i]);
                if (rc != SQLITE_OK) return rc;
            }
            return SQLITE_OK;
        }

        void read_row(jval& rows, jdaloc& a) const {
            jval row(json::kObjectType);
            const int cols = sqlite3_column_count(stmt_);
            for (int c = 0; c < cols; ++c) {
                jval name(sqlite3_column_name(stmt_, c), a);
                jval v;
                switch (sqlite3_column_type(stmt_, c)) {
                    case SQLITE_INTEGER: v.SetInt64(sqlite3_column_int64(stmt_, c)); break;
                    case SQLITE_FLOAT:   v.SetDouble(sqlite3_column_double(stmt_, c)); break;
                    case SQLITE_NULL:    v.SetNull(); break;
                    case SQLITE_TEXT: {
                        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, c));
                        v.SetString(text, static_cast<json::SizeType>(sqlite3_column_bytes(stmt_, c)), a);
                    } break;
                    default: {  // BLOB as raw bytes
                        const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt_, c));
                        v.SetString(blob ? blob : "", static_cast<json::SizeType>(sqlite3_column_bytes(stmt_, c)), a);
                    } break;
                }
                row.AddMember(name, v, a);
            }
            rows.PushBack(row, a);
        }

    private:
        int bind_one(int idx, const Value& value) {
            if (value.is_null()) return sqlite3_bind_null(stmt_, idx);
            if (value.is_bool()) return sqlite3_bind_int(stmt_, idx, value.as_bool() ? 1 : 0);
            if (value.is_int()) return sqlite3_bind_int64(stmt_, idx, value.as_int());
            if (value.is_double()) return sqlite3_bind_double(stmt_, idx, value.as_double());
            //handle unicode string UTF-8
            const std::string text = value.is_string() ? value.as_string() : to_string(value);
            return sqlite3_bind_text(stmt_, idx, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }

        sqlite3_stmt* stmt_;
    };
}

class SQLiteConnection final : public SQLConnection {
public:
    ~SQLiteConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        if (sqlite3_open(dsn.c_str(), &db_) != SQLITE_OK) {
            std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
            disconnect();
            throw ConnectionError("Failed to open SQLite DB " + dsn + ": " + err);
        }
        sqlite3_extended_result_codes(db_, 1);
        query("PRAGMA foreign_keys = ON", {});
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        tr_started_ = false;
    }

    const SqlDialect& dialect() const override { return sqlite_dialect(); }

    QueryResult query(const std::string& sql, const Params& params) override {
        if (!db_) throw ConnectionError("sqlite: not connected");

        QueryResult result;
        jdaloc& a = result.rows.GetAllocator();
        const char* tail = sql.c_str();

        // One prepare per statement so multi-statement migration bodies run in order.
        while (tail && *tail) {
            sqlite3_stmt* raw = nullptr;
            const char* next = nullptr;
            if (sqlite3_prepare_v2(db_, tail, -1, &raw, &next) != SQLITE_OK) fail(sql);
            tail = next;
            if (!raw) continue;  // whitespace or comment only

            SQLiteStatement stmt(raw);
            if (stmt.bind(params) != SQLITE_OK) fail(sql);

            const bool has_columns = sqlite3_column_count(raw) > 0;
            const int64_t changes_before = sqlite3_total_changes(db_);
            int64_t rows = 0;
            int rc;
            while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
                stmt.read_row(result.rows, a);
                ++rows;
            }
            if (rc != SQLITE_DONE) fail(sql);
            result.row_count += has_columns ? rows : sqlite3_total_changes(db_) - changes_before;
        }
        return result;
    }

    // transaction control
    bool begin() override {
        if (tr_started_) return true;
        query("BEGIN", {});
        tr_started_ = true;
        return true;
    }

    bool commit() override {
        if (!tr_started_) return false;
        query("COMMIT", {});
        tr_started_ = false;
        return true;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        query("ROLLBACK", {});
    }

private:
    [[noreturn]] void fail(const std::string& sql) {
        const int extended = sqlite3_extended_errcode(db_);
        BackendError e(Dialect::SQLite, code_name(extended), sqlite3_errmsg(db_));
        e.native_code = extended;
        std::cerr << "[sqlite] " << e.vendor_code << ": " << e.what() << " in: " << sql << std::endl;
        throw e;
    }

    sqlite3* db_ = nullptr;
};

PSQLConnection make_sqlite_connection() {
    return std::make_unique<SQLiteConnection>();
}

} // namespace tabula
