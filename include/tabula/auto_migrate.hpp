#pragma once
#include <functional>
#include <string>
#include <vector>
#include "tabula/differ.hpp"
#include "tabula/executor.hpp"
#include "tabula/snapshot.hpp"

namespace tabula {

struct AutoMigrateOptions {
    SchemaSnapshot current;            // built from the declared tables
    std::string snapshot_path;         // storage key of the previous snapshot
    SnapshotStorage* storage = nullptr; // FileSnapshotStorage when null
    // Runs the apply step, e.g. conn.transaction(body). Called directly when empty.
    std::function<void(const std::function<void()>&)> transaction;
};

struct AutoMigrateResult {
    DiffResult changes;
    bool applied = false;
    std::string sql;
    std::vector<std::string> warnings;  // destructive changes, logged but not blocking
};

/**
 * @brief Brings the database in line with the current snapshot.
 *
 * 1. load the previous snapshot (absent means empty)
 * 2. diff it against options.current
 * 3. warn about table and column removals
 * 4. generate SQL for the executor's dialect
 * 5. when there is SQL: ensure the history table, apply as auto-migrate-initial
 *    or auto-migrate-<epoch ms>
 * 6. save options.current
 *
 * A second call without schema edits issues no statement.
 */
AutoMigrateResult auto_migrate(const Executor& executor, const AutoMigrateOptions& options);

} // namespace tabula
