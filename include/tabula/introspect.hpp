#pragma once
#include "tabula/executor.hpp"
#include "tabula/snapshot.hpp"

namespace tabula {

/**
 * Reads the live catalog back into a SchemaSnapshot, for drift checks against
 * databases not provisioned purely through tracked migrations.
 * The history table and sqlite_* tables are left out.
 */
SchemaSnapshot introspect_sqlite(const Executor& executor);
SchemaSnapshot introspect_postgres(const Executor& executor);

// Dispatches on executor.dialect().
SchemaSnapshot introspect(const Executor& executor);

} // namespace tabula
