// connection_postgres.cpp
#include "tabula/sqlconnection.hpp"
#if HAVE_POSTGRESQL
#include <libpq-fe.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    // pg_type OIDs decoded to native JSON types; everything else stays text.
    constexpr Oid OID_BOOL = 16;
    constexpr Oid OID_INT8 = 20;
    constexpr Oid OID_INT2 = 21;
    constexpr Oid OID_INT4 = 23;
    constexpr Oid OID_FLOAT4 = 700;
    constexpr Oid OID_FLOAT8 = 701;
    constexpr Oid OID_NUMERIC = 1700;

    std::string array_element(const Value& v) {
        if (v.is_null()) return "NULL";
        if (v.is_bool()) return v.as_bool() ? "t" : "f";
        if (v.is_int() || v.is_double()) return to_string(v);
        std::string text = v.is_string() ? v.as_string() : to_string(v);
        std::string out = "\"";
        for (char c : text) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        return out + "\"";
    }

    // Text-format rendering of a parameter. Lists become array literals: {"a","b"}
    std::string param_text(const Value& v) {
        if (v.is_bool()) return v.as_bool() ? "t" : "f";
        if (v.is_string()) return v.as_string();
        if (v.is_list()) {
            strings items;
            for (const auto& item : v.as_list()) items.push_back(array_element(item));
            return "{" + join(items, ",") + "}";
        }
        return to_string(v);
    }

    std::optional<std::string> field(const PGresult* res, int code) {
        const char* s = PQresultErrorField(res, code);
        if (!s || !*s) return std::nullopt;
        return std::string(s);
    }
}

/*=============================  PgParams  =============================*/
// Owns the text of each parameter; params_ points into values_.
class PgParams {
public:
    explicit PgParams(const Params& params) {
        values_.reserve(params.size());
        for (const auto& p : params) {
            if (p.is_null()) {
                values_.emplace_back();
                nulls_.push_back(true);
            } else {
                values_.push_back(param_text(p));
                nulls_.push_back(false);
            }
        }
        for (size_t i = 0; i < values_.size(); ++i) {
            params_.push_back(nulls_[i] ? nullptr : values_[i].c_str());
            lengths_.push_back(static_cast<int>(values_[i].size()));
            formats_.push_back(0);  // text
        }
    }

    int size() const { return static_cast<int>(params_.size()); }
    const char* const* values() const { return params_.empty() ? nullptr : params_.data(); }
    const int* lengths() const { return lengths_.empty() ? nullptr : lengths_.data(); }
    const int* formats() const { return formats_.empty() ? nullptr : formats_.data(); }

private:
    std::vector<std::string> values_;
    std::vector<bool> nulls_;
    std::vector<const char*> params_;
    std::vector<int> lengths_;
    std::vector<int> formats_;
};

/*=============================  PgConnection  =============================*/
class PgConnection final : public SQLConnection {
public:
    ~PgConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        conn_ = PQconnectdb(dsn.c_str());
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            std::string err = conn_ ? PQerrorMessage(conn_) : "no connection";
            disconnect();
            throw ConnectionError("Postgres connect failed: " + err);
        }
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        tr_started_ = false;
    }

    const SqlDialect& dialect() const override { return pg_dialect(); }

    QueryResult query(const std::string& sql, const Params& params) override {
        if (!conn_) throw ConnectionError("postgres: not connected");

        PGresult* res = nullptr;
        if (params.empty()) {
            // simple protocol: allows multi-statement migration bodies
            res = PQexec(conn_, sql.c_str());
        } else {
            PgParams p(params);
            res = PQexecParams(conn_, sql.c_str(), p.size(),
                               nullptr,                // let server infer types
                               p.values(), p.lengths(), p.formats(),
                               0);                     // text results
        }
        if (!res) throw ConnectionError(std::string("Postgres exec failed: ") + PQerrorMessage(conn_));

        const auto st = PQresultStatus(res);
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) fail(res, sql);

        QueryResult result;
        if (st == PGRES_TUPLES_OK) {
            read_rows(res, result);
            result.row_count = PQntuples(res);
        } else {
            const char* t = PQcmdTuples(res);
            result.row_count = (t && *t) ? std::atoll(t) : 0;
        }
        PQclear(res);
        return result;
    }

    bool begin() override {
        if (tr_started_) return true;
        tr_started_ = execSQL("BEGIN;");
        return tr_started_;
    }

    bool commit() override {
        if (!tr_started_) return false;
        if (execSQL("COMMIT;")) {
            tr_started_ = false;
            return true;
        }
        return false;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        execSQL("ROLLBACK;");
    }

private:
    static void read_rows(const PGresult* res, QueryResult& result) {
        jdaloc& a = result.rows.GetAllocator();
        const int nrows = PQntuples(res);
        const int ncols = PQnfields(res);
        for (int r = 0; r < nrows; ++r) {
            jval row(json::kObjectType);
            for (int c = 0; c < ncols; ++c) {
                jval name(PQfname(res, c), a);
                jval v;
                if (!PQgetisnull(res, r, c)) {
                    const char* text = PQgetvalue(res, r, c);
                    switch (PQftype(res, c)) {
                        case OID_BOOL: v.SetBool(text[0] == 't'); break;
                        case OID_INT2:
                        case OID_INT4:
                        case OID_INT8: v.SetInt64(std::strtoll(text, nullptr, 10)); break;
                        case OID_FLOAT4:
                        case OID_FLOAT8:
                        case OID_NUMERIC: v.SetDouble(std::strtod(text, nullptr)); break;
                        default: v.SetString(text, static_cast<json::SizeType>(PQgetlength(res, r, c)), a);
                    }
                }
                row.AddMember(name, v, a);
            }
            result.rows.PushBack(row, a);
        }
    }

    [[noreturn]] void fail(PGresult* res, const std::string& sql) {
        const std::string message = field(res, PG_DIAG_MESSAGE_PRIMARY).value_or(PQerrorMessage(conn_));
        BackendError e(Dialect::Postgres, field(res, PG_DIAG_SQLSTATE).value_or(""), message);
        e.detail = field(res, PG_DIAG_MESSAGE_DETAIL);
        e.table = field(res, PG_DIAG_TABLE_NAME);
        e.column = field(res, PG_DIAG_COLUMN_NAME);
        e.constraint = field(res, PG_DIAG_CONSTRAINT_NAME);
        PQclear(res);
        std::cerr << "[postgres] " << e.vendor_code << ": " << message << " in: " << sql << std::endl;
        throw e;
    }

    bool execSQL(const char* sql) {
        query(sql, {});
        return true;
    }

    PGconn* conn_ = nullptr;
};

PSQLConnection make_postgres_connection() {
    return std::make_unique<PgConnection>();
}

} // namespace tabula
#endif
