#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "tabula/aggregate.hpp"
#include "tabula/dml_visitor.hpp"
#include "tabula/executor.hpp"
#include "tabula/relation_loader.hpp"
#include "tabula/table.hpp"

namespace tabula {

struct FindOptions {
    WhereFilter where;
    Selection select;
    IncludeSpec include;
    OrderBy order_by;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    std::optional<int64_t> take;
    Fields cursor;
};

struct ListResult {
    jdoc rows;          // array
    int64_t total = 0;  // rows matching the filter, ignoring limit/offset/cursor
};

/**
 * Table-level CRUD on top of an Executor and a Registry.
 *
 * Rows go in as Fields keyed by declared (camelCase) names and come back as
 * RapidJSON documents with camelCase members. Read-only columns are dropped
 * from create and update payloads; auto-update columns are set to the current
 * time on every update.
 */
class Storage {
public:
    Storage(const Executor& executor, const Registry& registry, CasingOverrides overrides = {});

    // Object, or a null document when nothing matches.
    jdoc get(const std::string& table, const FindOptions& options = {}) const;

    // Throws NotFoundError when nothing matches.
    jdoc get_or_throw(const std::string& table, const FindOptions& options = {}) const;

    jdoc list(const std::string& table, const FindOptions& options = {}) const;

    // One round trip: COUNT(*) OVER() rides along and is stripped from the rows.
    ListResult list_and_count(const std::string& table, const FindOptions& options = {}) const;

    jdoc create(const std::string& table, const Fields& data, const Selection& select = {}) const;

    // Row count; an empty input returns 0 without a query.
    int64_t create_many(const std::string& table, const std::vector<Fields>& rows) const;

    jdoc create_many_and_return(const std::string& table, const std::vector<Fields>& rows,
                                const Selection& select = {}) const;

    // Throws NotFoundError when nothing matches.
    jdoc update(const std::string& table, const WhereFilter& where, const Fields& data,
                const Selection& select = {}) const;

    // Rejects an empty where.
    int64_t update_many(const std::string& table, const WhereFilter& where, const Fields& data) const;

    /**
     * @brief INSERT ... ON CONFLICT DO UPDATE keyed on the where columns.
     *
     * 1. the conflict target is the column list of @p where
     * 2. @p where values are merged into the create payload when missing
     * 3. @p update values are bound explicitly (they may differ from @p create)
     * 4. with nothing to update the row is inserted or left alone, then read back
     */
    jdoc upsert(const std::string& table, const Fields& where, const Fields& create,
                const Fields& update, const Selection& select = {}) const;

    // Throws NotFoundError when nothing matches.
    jdoc delete_one(const std::string& table, const WhereFilter& where, const Selection& select = {}) const;

    // Rejects an empty where.
    int64_t delete_many(const std::string& table, const WhereFilter& where) const;

    int64_t count(const std::string& table, const WhereFilter& where = {}) const;

    // {_count, _avg:{...}, ...}; an empty spec yields an empty object without a query.
    jdoc aggregate(const std::string& table, const WhereFilter& where, const AggregateSpec& spec) const;

    jdoc group_by(const GroupByOptions& options) const;

private:
    const TableDef& table_def(const std::string& table) const;
    Fields writable(const TableDef& def, const Fields& data) const;
    SelectOptions select_options(const TableDef& def, const FindOptions& options) const;

    const Executor& executor_;
    const Registry& registry_;
    CasingOverrides overrides_;
};

} // namespace tabula
