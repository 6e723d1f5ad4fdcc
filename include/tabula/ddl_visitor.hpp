#pragma once
#include <sstream>
#include <string>
#include <vector>
#include "tabula/dialect.hpp"
#include "tabula/differ.hpp"
#include "tabula/snapshot.hpp"

namespace tabula {

/**
 * DDL generation for one DiffChange at a time (use with std::visit).
 *
 * The context snapshot is the state the statements move the database TO: the new
 * snapshot for a migration, the previous snapshot for a rollback. Table, column and
 * enum definitions are looked up there.
 *
 * - Identifiers are snake_cased then double-quoted.
 * - Literals (defaults, enum members) are inlined with single quotes doubled.
 * - Enum columns: native enum type on Postgres, TEXT + CHECK (...) on SQLite, where
 *   enum type statements are no-ops.
 * - ALTER COLUMN is rejected with a MigrationError on SQLite.
 */
class DDLVisitor {
public:
    DDLVisitor(const SqlDialect& dialect, const SchemaSnapshot& context)
        : dialect_(dialect), ctx_(context) {}

    std::vector<std::string> operator()(const TableAdded& c) const;
    std::vector<std::string> operator()(const TableRemoved& c) const;
    std::vector<std::string> operator()(const ColumnAdded& c) const;
    std::vector<std::string> operator()(const ColumnRemoved& c) const;
    std::vector<std::string> operator()(const ColumnAltered& c) const;
    std::vector<std::string> operator()(const ColumnRenamed& c) const;
    std::vector<std::string> operator()(const IndexAdded& c) const;
    std::vector<std::string> operator()(const IndexRemoved& c) const;
    std::vector<std::string> operator()(const EnumAdded& c) const;
    std::vector<std::string> operator()(const EnumRemoved& c) const;
    std::vector<std::string> operator()(const EnumAltered& c) const;

    // "col" TYPE NOT NULL UNIQUE DEFAULT x
    std::string column_def(const std::string& name, const ColumnSnapshot& col) const;
    std::string sql_type(const std::string& type) const;
    std::string sql_default(const std::string& expr) const;

private:
    const std::vector<std::string>* enum_for_type(const std::string& type, std::string* enum_name = nullptr) const;
    std::string index_name(const std::string& table, const std::vector<std::string>& columns,
                           const std::optional<std::string>& name) const;

    const SqlDialect& dialect_;
    const SchemaSnapshot& ctx_;
};

/**
 * Statements for @p changes, in change order, except that enum type creation is
 * emitted before and enum type removal after every table statement.
 */
std::vector<std::string> generate_migration_statements(const DiffResult& changes,
                                                       const SchemaSnapshot& target,
                                                       const SqlDialect& dialect = pg_dialect());

// Statements joined by a blank line.
std::string generate_migration_sql(const DiffResult& changes, const SchemaSnapshot& target,
                                   const SqlDialect& dialect = pg_dialect());

// Runs the generator over reverse_changes(changes) with the pre-change snapshot as context.
std::string generate_rollback_sql(const DiffResult& changes, const SchemaSnapshot& before,
                                  const SqlDialect& dialect = pg_dialect());

// Full CREATE script for a snapshot (diff against an empty one).
std::string generate_schema_sql(const SchemaSnapshot& snapshot, const SqlDialect& dialect = pg_dialect());

} // namespace tabula
