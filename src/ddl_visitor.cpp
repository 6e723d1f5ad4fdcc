#include "tabula/ddl_visitor.hpp"
#include "tabula/casing.hpp"
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    std::string ident(const std::string& name) {
        return quote_ident(camel_to_snake(name));
    }

    std::string ident_list(const std::vector<std::string>& names) {
        strings out;
        for (const auto& n : names) out.push_back(ident(n));
        return join(out, ", ");
    }

    std::string literal_list(const std::vector<std::string>& values) {
        strings out;
        for (const auto& v : values) out.push_back(quote_literal(v));
        return join(out, ", ");
    }

    std::string alter_table(const std::string& table) {
        return "ALTER TABLE " + ident(table) + " ";
    }
}

const std::vector<std::string>* DDLVisitor::enum_for_type(const std::string& type, std::string* enum_name) const {
    for (const auto& [name, values] : ctx_.enums) {
        if (type == name || type == camel_to_snake(name)) {
            if (enum_name) *enum_name = name;
            return &values;
        }
    }
    return nullptr;
}

std::string DDLVisitor::sql_type(const std::string& type) const {
    std::string enum_name;
    if (enum_for_type(type, &enum_name)) {
        if (dialect_.supports_native_enums()) return ident(enum_name);
        return "TEXT";
    }
    return dialect_.map_type(type);
}

std::string DDLVisitor::sql_default(const std::string& expr) const {
    if (to_lower(expr) == "now()") return dialect_.now_default();
    return expr;
}

std::string DDLVisitor::column_def(const std::string& name, const ColumnSnapshot& col) const {
    std::ostringstream ddl;
    ddl << ident(name) << " " << sql_type(col.type);
    if (!col.nullable) ddl << " NOT NULL";
    if (col.unique) ddl << " UNIQUE";
    if (col.default_value) ddl << " DEFAULT " << sql_default(*col.default_value);
    if (!dialect_.supports_native_enums()) {
        if (const auto* values = enum_for_type(col.type)) {
            ddl << " CHECK(" << ident(name) << " IN (" << literal_list(*values) << "))";
        }
    }
    return ddl.str();
}

std::string DDLVisitor::index_name(const std::string& table, const std::vector<std::string>& columns,
                                   const std::optional<std::string>& name) const {
    if (name && !name->empty()) return *name;
    std::string out = "idx_" + camel_to_snake(table);
    for (const auto& c : columns) out += "_" + camel_to_snake(c);
    return out;
}

/* ---------- tables ---------- */

std::vector<std::string> DDLVisitor::operator()(const TableAdded& c) const {
    const TableSnapshot* table = ctx_.tables.find(c.table);
    if (!table) throw MigrationError("No definition for added table " + c.table);

    std::vector<std::string> out;
    std::vector<std::string> lines, pk;
    for (const auto& [name, col] : table->columns) {
        lines.push_back("  " + column_def(name, col));
        if (col.primary) pk.push_back(name);
    }
    if (!pk.empty()) lines.push_back("  PRIMARY KEY (" + ident_list(pk) + ")");
    for (const auto& fk : table->foreign_keys) {
        lines.push_back("  FOREIGN KEY (" + ident(fk.column) + ") REFERENCES " +
                        ident(fk.target_table) + " (" + ident(fk.target_column) + ")");
    }

    std::ostringstream ddl;
    ddl << "CREATE TABLE " << ident(c.table) << " (\n" << join(lines, ",\n") << "\n);";
    out.push_back(ddl.str());

    for (const auto& idx : table->indexes) {
        std::ostringstream ix;
        ix << "CREATE ";
        if (idx.unique) ix << "UNIQUE ";
        ix << "INDEX " << quote_ident(index_name(c.table, idx.columns, idx.name))
           << " ON " << ident(c.table) << " (" << ident_list(idx.columns) << ");";
        out.push_back(ix.str());
    }
    return out;
}

std::vector<std::string> DDLVisitor::operator()(const TableRemoved& c) const {
    return {"DROP TABLE " + ident(c.table) + ";"};
}

/* ---------- columns ---------- */

std::vector<std::string> DDLVisitor::operator()(const ColumnAdded& c) const {
    const TableSnapshot* table = ctx_.tables.find(c.table);
    const ColumnSnapshot* col = table ? table->columns.find(c.column) : nullptr;
    if (!col) throw MigrationError("No definition for added column " + c.table + "." + c.column);
    return {alter_table(c.table) + "ADD COLUMN " + column_def(c.column, *col) + ";"};
}

std::vector<std::string> DDLVisitor::operator()(const ColumnRemoved& c) const {
    return {alter_table(c.table) + "DROP COLUMN " + ident(c.column) + ";"};
}

std::vector<std::string> DDLVisitor::operator()(const ColumnAltered& c) const {
    if (!dialect_.supports_alter_column()) {
        throw MigrationError("Cannot alter column " + c.table + "." + c.column + " on " + dialect_.name() +
                             "; the table has to be rebuilt");
    }
    const std::string prefix = alter_table(c.table) + "ALTER COLUMN " + ident(c.column) + " ";
    std::vector<std::string> out;
    if (c.new_type) out.push_back(prefix + "TYPE " + sql_type(*c.new_type) + ";");
    if (c.new_nullable) out.push_back(prefix + (*c.new_nullable ? "DROP NOT NULL;" : "SET NOT NULL;"));
    if (c.default_changed) {
        if (c.new_default) out.push_back(prefix + "SET DEFAULT " + sql_default(*c.new_default) + ";");
        else out.push_back(prefix + "DROP DEFAULT;");
    }
    return out;
}

std::vector<std::string> DDLVisitor::operator()(const ColumnRenamed& c) const {
    return {alter_table(c.table) + "RENAME COLUMN " + ident(c.old_column) + " TO " + ident(c.new_column) + ";"};
}

/* ---------- indexes ---------- */

std::vector<std::string> DDLVisitor::operator()(const IndexAdded& c) const {
    std::ostringstream ix;
    ix << "CREATE ";
    if (c.unique) ix << "UNIQUE ";
    ix << "INDEX " << quote_ident(index_name(c.table, c.columns, c.name))
       << " ON " << ident(c.table) << " (" << ident_list(c.columns) << ");";
    return {ix.str()};
}

std::vector<std::string> DDLVisitor::operator()(const IndexRemoved& c) const {
    return {"DROP INDEX " + quote_ident(index_name(c.table, c.columns, c.name)) + ";"};
}

/* ---------- enums (PostgreSQL only) ---------- */

std::vector<std::string> DDLVisitor::operator()(const EnumAdded& c) const {
    if (!dialect_.supports_native_enums()) return {};
    const auto* values = ctx_.enums.find(c.name);
    if (!values || values->empty()) return {};
    return {"CREATE TYPE " + ident(c.name) + " AS ENUM (" + literal_list(*values) + ");"};
}

std::vector<std::string> DDLVisitor::operator()(const EnumRemoved& c) const {
    if (!dialect_.supports_native_enums()) return {};
    return {"DROP TYPE " + ident(c.name) + ";"};
}

std::vector<std::string> DDLVisitor::operator()(const EnumAltered& c) const {
    if (!dialect_.supports_native_enums()) return {};
    const std::string type = ident(c.name);
    std::vector<std::string> out;

    if (c.removed_values.empty()) {
        for (const auto& v : c.added_values)
            out.push_back("ALTER TYPE " + type + " ADD VALUE " + quote_literal(v) + ";");
        return out;
    }

    // Values cannot be dropped from a Postgres enum: recreate the type and re-type its columns.
    const auto* values = ctx_.enums.find(c.name);
    if (!values) throw MigrationError("No definition for altered enum " + c.name);
    const std::string old_type = quote_ident(camel_to_snake(c.name) + "_old");
    out.push_back("ALTER TYPE " + type + " RENAME TO " + old_type + ";");
    out.push_back("CREATE TYPE " + type + " AS ENUM (" + literal_list(*values) + ");");
    for (const auto& [tname, table] : ctx_.tables) {
        for (const auto& [cname, col] : table.columns) {
            if (col.type != c.name && col.type != camel_to_snake(c.name)) continue;
            out.push_back(alter_table(tname) + "ALTER COLUMN " + ident(cname) + " TYPE " + type +
                          " USING " + ident(cname) + "::text::" + type + ";");
        }
    }
    out.push_back("DROP TYPE " + old_type + ";");
    return out;
}

/* ---------- entry points ---------- */

std::vector<std::string> generate_migration_statements(const DiffResult& changes,
                                                       const SchemaSnapshot& target,
                                                       const SqlDialect& dialect) {
    DDLVisitor visitor(dialect, target);
    std::vector<std::string> head, body, tail;
    for (const auto& change : changes) {
        auto stmts = std::visit(visitor, change);
        auto& dst = std::holds_alternative<EnumAdded>(change)   ? head
                  : std::holds_alternative<EnumRemoved>(change) ? tail
                                                                : body;
        dst.insert(dst.end(), stmts.begin(), stmts.end());
    }
    head.insert(head.end(), body.begin(), body.end());
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

std::string generate_migration_sql(const DiffResult& changes, const SchemaSnapshot& target,
                                   const SqlDialect& dialect) {
    return join(generate_migration_statements(changes, target, dialect), "\n\n");
}

std::string generate_rollback_sql(const DiffResult& changes, const SchemaSnapshot& before,
                                  const SqlDialect& dialect) {
    return generate_migration_sql(reverse_changes(changes), before, dialect);
}

std::string generate_schema_sql(const SchemaSnapshot& snapshot, const SqlDialect& dialect) {
    return generate_migration_sql(compute_diff(SchemaSnapshot{}, snapshot), snapshot, dialect);
}

} // namespace tabula
