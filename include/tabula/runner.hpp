#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "tabula/dml_visitor.hpp"
#include "tabula/executor.hpp"

#define TABULA_HISTORY_TABLE "_tabula_migrations"

namespace tabula {

struct MigrationFile {
    std::string name;      // exact filename, the identity key
    std::string sql;
    int64_t sequence = 0;

    // Sequence parsed from the name (0 when the name does not follow NNNN_description.ext).
    static MigrationFile from(std::string name, std::string sql);
};

struct AppliedMigration {
    std::string name;
    std::string checksum;
    std::string applied_at;
};

struct MigrationName {
    int64_t sequence = 0;
    std::string description;
};

// 0003_add_email.sql -> {3, "add_email"}; anything else -> nullopt
std::optional<MigrationName> parse_migration_name(const std::string& filename);

// (7, "add_age") -> 0007_add_age.sql
std::string format_migration_name(int64_t sequence, const std::string& description, const std::string& ext = "sql");

// Lowercase hex SHA-256 of the migration text.
std::string compute_checksum(const std::string& sql);

struct ApplyOptions {
    bool dry_run = false;
};

struct ApplyResult {
    std::string name;
    std::string checksum;
    bool dry_run = false;
    std::vector<SqlQuery> statements;  // body, then the history insert
};

/**
 * Applies migrations through an Executor and records them in the history table.
 *
 * apply() issues two statements, the body and the history row. They form one
 * logical unit; run apply() inside SQLConnection::transaction() where the
 * backend supports it.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(const Executor& executor) : executor_(executor) {}

    // CREATE TABLE IF NOT EXISTS for the dialect at hand.
    void create_history_table() const;

    ApplyResult apply(const std::string& sql, const std::string& name, const ApplyOptions& options = {}) const;

    // Ordered by id.
    std::vector<AppliedMigration> get_applied() const;

    std::string history_table_sql() const;

private:
    const Executor& executor_;
};

// Files whose names were never applied, ascending by sequence.
std::vector<MigrationFile> get_pending(const std::vector<MigrationFile>& files,
                                       const std::vector<AppliedMigration>& applied);

// Names of applied files whose text changed since they were applied.
std::vector<std::string> detect_drift(const std::vector<MigrationFile>& files,
                                      const std::vector<AppliedMigration>& applied);

// Pending files numbered below the most recently applied one.
std::vector<std::string> detect_out_of_order(const std::vector<MigrationFile>& files,
                                             const std::vector<AppliedMigration>& applied);

} // namespace tabula
