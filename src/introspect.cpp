#include "tabula/introspect.hpp"
#include <map>
#include <set>
#include <sstream>
#include "tabula/lib.hpp"
#include "tabula/runner.hpp"

namespace tabula {

namespace {
    std::string text(const jval& row, const char* key) {
        auto it = row.FindMember(key);
        if (it == row.MemberEnd() || it->value.IsNull()) return "";
        return jhlp::dump(it->value);
    }

    int64_t number(const jval& row, const char* key) {
        auto it = row.FindMember(key);
        if (it == row.MemberEnd() || it->value.IsNull()) return 0;
        if (it->value.IsInt64()) return it->value.GetInt64();
        if (it->value.IsNumber()) return static_cast<int64_t>(it->value.GetDouble());
        if (it->value.IsString()) return std::stoll(it->value.GetString());
        return 0;
    }

    bool truthy(const jval& row, const char* key) {
        auto it = row.FindMember(key);
        if (it == row.MemberEnd()) return false;
        if (it->value.IsBool()) return it->value.GetBool();
        if (it->value.IsString()) return std::string(it->value.GetString()) == "t";
        return number(row, key) != 0;
    }

    std::string map_sqlite_type(const std::string& raw) {
        const std::string upper = to_upper(raw);
        if (upper == "TEXT") return "text";
        if (upper == "INTEGER" || upper == "INT") return "integer";
        if (upper == "REAL") return "float";
        if (upper == "BLOB") return "blob";
        return to_lower(raw);
    }

    strings split(const std::string& s, char sep) {
        strings out;
        std::istringstream is(s);
        std::string item;
        while (std::getline(is, item, sep)) if (!item.empty()) out.push_back(item);
        return out;
    }
}

/* ---------- SQLite ---------- */

SchemaSnapshot introspect_sqlite(const Executor& executor) {
    SchemaSnapshot snap;
    QueryResult tables = executor.execute(
        "SELECT name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%' ORDER BY rowid");

    for (const auto& trow : tables.rows.GetArray()) {
        const std::string table = text(trow, "name");
        if (table == TABULA_HISTORY_TABLE) continue;
        const std::string tref = quote_ident(table);
        TableSnapshot& t = snap.tables[table];

        QueryResult cols = executor.execute("PRAGMA table_info(" + tref + ")");
        for (const auto& c : cols.rows.GetArray()) {
            ColumnSnapshot col;
            col.type = map_sqlite_type(text(c, "type"));
            col.primary = number(c, "pk") > 0;
            col.nullable = number(c, "notnull") == 0 && !col.primary;
            if (c.HasMember("dflt_value") && !c["dflt_value"].IsNull()) col.default_value = text(c, "dflt_value");
            t.columns.set(text(c, "name"), col);
        }

        QueryResult idx = executor.execute("PRAGMA index_list(" + tref + ")");
        for (const auto& i : idx.rows.GetArray()) {
            const std::string name = text(i, "name");
            const std::string origin = text(i, "origin");  // c = CREATE INDEX, u = UNIQUE, pk
            const bool unique = number(i, "unique") == 1;

            QueryResult info = executor.execute("PRAGMA index_info(" + quote_ident(name) + ")");
            std::vector<std::string> columns;
            for (const auto& r : info.rows.GetArray()) columns.push_back(text(r, "name"));

            if (unique && origin == "u" && columns.size() == 1) {
                if (ColumnSnapshot* col = t.columns.find(columns.front())) col->unique = true;
            }
            if (origin == "c") t.indexes.push_back(IndexSnapshot{columns, name, unique});
        }

        QueryResult fks = executor.execute("PRAGMA foreign_key_list(" + tref + ")");
        for (const auto& f : fks.rows.GetArray()) {
            t.foreign_keys.push_back(ForeignKeySnapshot{text(f, "from"), text(f, "table"), text(f, "to")});
        }
    }
    return snap;
}

/* ---------- PostgreSQL ---------- */

SchemaSnapshot introspect_postgres(const Executor& executor) {
    SchemaSnapshot snap;
    const SqlDialect& d = executor.dialect();

    QueryResult tables = executor.execute(
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema = 'public' AND table_type = 'BASE TABLE' ORDER BY table_name");

    QueryResult pks = executor.execute(
        "SELECT kcu.table_name, kcu.column_name "
        "FROM information_schema.table_constraints tc "
        "JOIN information_schema.key_column_usage kcu "
        "ON tc.constraint_name = kcu.constraint_name AND tc.table_schema = kcu.table_schema "
        "WHERE tc.constraint_type = 'PRIMARY KEY' AND tc.table_schema = 'public'");
    std::map<std::string, std::set<std::string>> pk_map;
    for (const auto& r : pks.rows.GetArray()) pk_map[text(r, "table_name")].insert(text(r, "column_name"));

    QueryResult uniques = executor.execute(
        "SELECT tc.table_name, kcu.column_name, tc.constraint_name "
        "FROM information_schema.table_constraints tc "
        "JOIN information_schema.key_column_usage kcu "
        "ON tc.constraint_name = kcu.constraint_name AND tc.table_schema = kcu.table_schema "
        "WHERE tc.constraint_type = 'UNIQUE' AND tc.table_schema = 'public'");
    std::map<std::string, std::pair<std::string, strings>> by_constraint;
    for (const auto& r : uniques.rows.GetArray()) {
        auto& entry = by_constraint[text(r, "constraint_name")];
        entry.first = text(r, "table_name");
        entry.second.push_back(text(r, "column_name"));
    }
    std::map<std::string, std::set<std::string>> unique_map;
    for (const auto& [_, entry] : by_constraint) {
        if (entry.second.size() == 1) unique_map[entry.first].insert(entry.second.front());
    }

    for (const auto& trow : tables.rows.GetArray()) {
        const std::string table = text(trow, "table_name");
        if (table == TABULA_HISTORY_TABLE) continue;
        TableSnapshot& t = snap.tables[table];

        QueryResult cols = executor.execute(
            "SELECT column_name, data_type, is_nullable, column_default "
            "FROM information_schema.columns "
            "WHERE table_name = " + d.param(1) + " AND table_schema = 'public' ORDER BY ordinal_position",
            {table});
        for (const auto& c : cols.rows.GetArray()) {
            const std::string name = text(c, "column_name");
            ColumnSnapshot col;
            col.type = text(c, "data_type");
            col.nullable = text(c, "is_nullable") == "YES";
            col.primary = pk_map[table].count(name) > 0;
            col.unique = unique_map[table].count(name) > 0;
            if (c.HasMember("column_default") && !c["column_default"].IsNull())
                col.default_value = text(c, "column_default");
            t.columns.set(name, col);
        }

        QueryResult fks = executor.execute(
            "SELECT kcu.column_name, ccu.table_name AS target_table, ccu.column_name AS target_column "
            "FROM information_schema.table_constraints tc "
            "JOIN information_schema.key_column_usage kcu "
            "ON tc.constraint_name = kcu.constraint_name AND tc.table_schema = kcu.table_schema "
            "JOIN information_schema.constraint_column_usage ccu "
            "ON tc.constraint_name = ccu.constraint_name AND tc.table_schema = ccu.table_schema "
            "WHERE tc.constraint_type = 'FOREIGN KEY' AND tc.table_name = " + d.param(1) +
            " AND tc.table_schema = 'public'",
            {table});
        for (const auto& f : fks.rows.GetArray()) {
            t.foreign_keys.push_back(ForeignKeySnapshot{
                text(f, "column_name"), text(f, "target_table"), text(f, "target_column")});
        }

        // Constraint-backed indexes are covered by primary/unique above.
        QueryResult idx = executor.execute(
            "SELECT i.relname AS index_name, "
            "string_agg(a.attname, ',' ORDER BY k.n) AS columns, "
            "ix.indisunique AS is_unique "
            "FROM pg_index ix "
            "JOIN pg_class i ON i.oid = ix.indexrelid "
            "JOIN pg_class t ON t.oid = ix.indrelid "
            "JOIN pg_namespace ns ON ns.oid = t.relnamespace "
            "JOIN LATERAL unnest(ix.indkey) WITH ORDINALITY AS k(attnum, n) ON true "
            "JOIN pg_attribute a ON a.attrelid = t.oid AND a.attnum = k.attnum "
            "WHERE t.relname = " + d.param(1) + " AND ns.nspname = 'public' "
            "AND NOT ix.indisprimary AND NOT ix.indisunique "
            "GROUP BY i.relname, ix.indisunique ORDER BY i.relname",
            {table});
        for (const auto& i : idx.rows.GetArray()) {
            t.indexes.push_back(IndexSnapshot{split(text(i, "columns"), ','), text(i, "index_name"),
                                              truthy(i, "is_unique")});
        }
    }

    QueryResult enums = executor.execute(
        "SELECT t.typname AS enum_name, e.enumlabel AS enum_value "
        "FROM pg_type t "
        "JOIN pg_enum e ON t.oid = e.enumtypid "
        "JOIN pg_catalog.pg_namespace n ON n.oid = t.typnamespace "
        "WHERE n.nspname = 'public' "
        "ORDER BY t.typname, e.enumsortorder");
    for (const auto& r : enums.rows.GetArray()) {
        snap.enums[text(r, "enum_name")].push_back(text(r, "enum_value"));
    }
    return snap;
}

SchemaSnapshot introspect(const Executor& executor) {
    switch (executor.dialect().kind()) {
        case Dialect::SQLite:   return introspect_sqlite(executor);
        case Dialect::Postgres: return introspect_postgres(executor);
    }
    TABULA_THROW("introspection is not available for %s", executor.dialect().name().c_str());
}

} // namespace tabula
