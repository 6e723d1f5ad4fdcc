#include "tabula/dialect.hpp"
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

void SqlDialect::require_array_ops() const {
    if (!supports_array_ops())
        throw QueryError("Array operators (arrayContains, arrayContainedBy, arrayOverlaps) are not supported on " + name());
}

void SqlDialect::require_json_path() const {
    if (!supports_json_path())
        throw QueryError("JSONB path operators (->>, ->) are not supported on " + name());
}

void SqlDialect::require_returning() const {
    if (!supports_returning())
        throw QueryError("RETURNING is not supported on " + name());
}

/* ---------- PostgreSQL ---------- */

std::string PgDialect::param(size_t i) const { return "$" + std::to_string(i); }

/* ---------- SQLite ---------- */

std::string SqliteDialect::param(size_t i) const { return "?" + std::to_string(i); }

std::string SqliteDialect::map_type(const std::string& type) const {
    std::string t = to_upper(trim(type));
    // VARCHAR(255), NUMERIC(10,2) ...
    if (auto p = t.find('('); p != std::string::npos) t = trim(t.substr(0, p));

    if (t == "UUID"      || t == "TEXT"        || t == "VARCHAR" ||
        t == "CHAR"      || t == "CHARACTER VARYING" ||
        t == "TIMESTAMP" || t == "TIMESTAMPTZ" ||
        t == "TIMESTAMP WITH TIME ZONE" || t == "TIMESTAMP WITHOUT TIME ZONE" ||
        t == "DATE"      || t == "TIME"        ||
        t == "JSON"      || t == "JSONB"       ) return "TEXT";
    if (t == "BOOLEAN"   || t == "BOOL"        || t == "INTEGER" || t == "INT" ||
        t == "BIGINT"    || t == "SMALLINT"    || t == "SERIAL"  || t == "BIGSERIAL") return "INTEGER";
    if (t == "REAL"      || t == "FLOAT"       || t == "DOUBLE PRECISION" ||
        t == "DOUBLE"    || t == "NUMERIC"     || t == "DECIMAL" ) return "REAL";
    if (t == "BYTEA"     || t == "BLOB"        ) return "BLOB";
    return type;
}

const SqlDialect& pg_dialect() {
    static const PgDialect instance;
    return instance;
}

const SqlDialect& sqlite_dialect() {
    static const SqliteDialect instance;
    return instance;
}

const SqlDialect& dialect_for(Dialect dialect) {
    return dialect == Dialect::SQLite ? sqlite_dialect() : pg_dialect();
}

Dialect parse_dialect(const std::string& name) {
    const std::string n = to_lower(name);
    if (n == "postgres" || n == "postgresql" || n == "pg") return Dialect::Postgres;
    if (n == "sqlite" || n == "sqlite3") return Dialect::SQLite;
    TABULA_THROW("unknown dialect: %s", name.c_str());
}

} // namespace tabula
