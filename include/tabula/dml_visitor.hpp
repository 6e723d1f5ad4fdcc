#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "tabula/casing.hpp"
#include "tabula/dialect.hpp"
#include "tabula/value.hpp"
#include "tabula/where.hpp"

namespace tabula {

// A parameterized statement ready for the Executor. No trailing semicolon.
struct SqlQuery {
    std::string sql;
    Params params;
};

// (column, "asc" | "desc"), in sort priority order
using OrderBy = std::vector<std::pair<std::string, std::string>>;

struct SelectOptions {
    std::string table;
    std::vector<std::string> columns;  // declared names; empty selects *
    WhereFilter where;
    OrderBy order_by;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    std::optional<int64_t> take;       // cursor page size, wins over limit
    Fields cursor;                     // last seen row's sort key(s)
    bool with_count = false;           // adds COUNT(*) OVER() AS "totalCount"
    CasingOverrides overrides;
};

struct OnConflict {
    enum class Action { Nothing, Update };

    std::vector<std::string> columns;          // conflict target
    Action action = Action::Nothing;
    std::vector<std::string> update_columns;   // "c" = EXCLUDED."c"
    Fields update_values;                      // "c" = $n, wins over update_columns
};

struct InsertOptions {
    std::string table;
    std::vector<Fields> rows;                  // first row defines the column list
    bool returning = false;
    std::vector<std::string> returning_columns; // empty returns *
    std::vector<std::string> now_columns;      // "now" here means the current timestamp
    std::optional<OnConflict> on_conflict;
    CasingOverrides overrides;
};

struct UpdateOptions {
    std::string table;
    Fields data;
    WhereFilter where;
    bool returning = false;
    std::vector<std::string> returning_columns;
    std::vector<std::string> now_columns;
    CasingOverrides overrides;
};

struct DeleteOptions {
    std::string table;
    WhereFilter where;
    bool returning = false;
    std::vector<std::string> returning_columns;
    CasingOverrides overrides;
};

/**
 * DML generation for one dialect.
 * - Identifiers are snake_cased and double-quoted; declared names come back
 *   through "snake" AS "camel" aliases whenever the two differ.
 * - Every value is a bound parameter, except "now" in a now_columns entry,
 *   which becomes dialect.now().
 * - Parameter order:
 *     select: where, cursor, limit, offset
 *     insert: row by row in column order, then explicit conflict update values
 *     update: SET values, then where
 * - update and remove refuse an empty WHERE.
 */
class DMLVisitor {
public:
    explicit DMLVisitor(const SqlDialect& dialect = pg_dialect()) : dialect_(dialect) {}

    SqlQuery select(const SelectOptions& options) const;
    SqlQuery insert(const InsertOptions& options) const;
    SqlQuery update(const UpdateOptions& options) const;
    SqlQuery remove(const DeleteOptions& options) const;

    const SqlDialect& dialect() const { return dialect_; }

private:
    const SqlDialect& dialect_;
};

// "snake" AS "camel" when the names differ, "name" otherwise; empty -> *
std::string select_list(const std::vector<std::string>& columns, const CasingOverrides& overrides = {});

// Throws QueryError naming the operation when the filter would match every row.
void assert_non_empty_where(const WhereFilter& where, const std::string& operation);

} // namespace tabula
