#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "tabula/dml_visitor.hpp"
#include "tabula/jsonhlp.hpp"

namespace tabula {

/**
 * Requested aggregation fields (declared column names).
 * count_all selects COUNT(*) AS "_count" and takes precedence over per-column counts.
 */
struct AggregateSpec {
    bool count_all = false;
    std::vector<std::string> count;
    std::vector<std::string> avg;
    std::vector<std::string> sum;
    std::vector<std::string> min;
    std::vector<std::string> max;

    bool empty() const;
};

struct GroupByOptions {
    std::string table;
    std::vector<std::string> by;
    WhereFilter where;
    AggregateSpec aggregate;
    OrderBy order_by;     // group columns, "_count", or one of the requested aliases
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    CasingOverrides overrides;
};

// SELECT COUNT(*) AS "count" FROM "t" [WHERE ...]
SqlQuery build_count(const std::string& table, const WhereFilter& where,
                     const SqlDialect& dialect = pg_dialect(), const CasingOverrides& overrides = {});

// One row of _count / _count_<col> / _<fn>_<col> projections. Throws QueryError when nothing is requested.
SqlQuery build_aggregate(const std::string& table, const WhereFilter& where, const AggregateSpec& spec,
                         const SqlDialect& dialect = pg_dialect(), const CasingOverrides& overrides = {});

/**
 * @brief GROUP BY statement with validated ordering.
 *
 * ORDER BY entries are checked before any SQL is built:
 *  1. direction must be asc or desc (any case)
 *  2. "_count" sorts by COUNT(*)
 *  3. other underscore names must be aliases implied by the aggregate spec
 *  4. plain names must be group-by columns
 */
SqlQuery build_group_by(const GroupByOptions& options, const SqlDialect& dialect = pg_dialect());

// Every alias the spec projects, e.g. _count_views, _avg_score
std::vector<std::string> aggregate_aliases(const AggregateSpec& spec, const CasingOverrides& overrides = {});

/**
 * Flat result row -> {_count: n | {col: n}, _avg: {col: x}, ...}.
 * Group-by columns listed in @p by are copied first.
 */
jval restructure_aggregate(const jval& row, const AggregateSpec& spec, const std::vector<std::string>& by,
                           jdaloc& allocator, const CasingOverrides& overrides = {});

} // namespace tabula
