#include "tabula/auto_migrate.hpp"
#include <chrono>
#include <iostream>
#include "tabula/ddl_visitor.hpp"
#include "tabula/lib.hpp"
#include "tabula/runner.hpp"

namespace tabula {

namespace {
    std::string describe(const DiffChange& change) {
        if (const auto* t = std::get_if<TableRemoved>(&change))
            return change_type(change) + " (table: " + t->table + ")";
        if (const auto* c = std::get_if<ColumnRemoved>(&change))
            return change_type(change) + " (table: " + c->table + ", column: " + c->column + ")";
        return change_type(change);
    }
}

AutoMigrateResult auto_migrate(const Executor& executor, const AutoMigrateOptions& options) {
    FileSnapshotStorage file_storage;
    SnapshotStorage& storage = options.storage ? *options.storage : file_storage;

    AutoMigrateResult result;
    std::optional<SchemaSnapshot> previous = storage.load(options.snapshot_path);
    if (!previous) std::cout << "[auto-migrate] No previous snapshot found. Applying full schema..." << std::endl;

    result.changes = compute_diff(previous ? *previous : SchemaSnapshot{}, options.current);
    if (result.changes.empty()) {
        std::cout << "[auto-migrate] No schema changes detected." << std::endl;
    }

    for (const auto& change : result.changes) {
        if (!is_destructive(change)) continue;
        result.warnings.push_back(describe(change));
        std::cerr << "[auto-migrate] Warning: destructive change detected: " << result.warnings.back() << std::endl;
    }

    result.sql = generate_migration_sql(result.changes, options.current, executor.dialect());
    if (!trim(result.sql).empty()) {
        MigrationRunner runner(executor);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        const std::string name = previous ? "auto-migrate-" + std::to_string(ms) : "auto-migrate-initial";

        runner.create_history_table();
        auto body = [&] { runner.apply(result.sql, name); };
        if (options.transaction) options.transaction(body);
        else body();

        result.applied = true;
        std::cout << "[auto-migrate] Applied " << result.changes.size() << " change(s) as " << name << "." << std::endl;
    }

    storage.save(options.snapshot_path, options.current);
    std::cout << "[auto-migrate] Snapshot saved." << std::endl;
    return result;
}

} // namespace tabula
