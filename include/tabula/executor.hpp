#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include "tabula/casing.hpp"
#include "tabula/dialect.hpp"
#include "tabula/dml_visitor.hpp"
#include "tabula/jsonhlp.hpp"
#include "tabula/value.hpp"

namespace tabula {

struct QueryResult {
    jdoc rows;             // array of objects, members in statement column order
    int64_t row_count = 0; // rows returned, or rows affected for plain DML

    QueryResult() { rows.SetArray(); }
};

// The single outward call: (sql, ordered params) -> rows. May throw BackendError.
using QueryFn = std::function<QueryResult(const std::string&, const Params&)>;

/**
 * Wraps the caller's QueryFn and classifies failures exactly once:
 *   DbError          -> rethrown unchanged
 *   BackendError     -> ConstraintError / ConnectionError / QueryError
 *   other exceptions -> ConnectionError when the message talks about the
 *                       connection, QueryError otherwise
 */
class Executor {
public:
    Executor(QueryFn fn, const SqlDialect& dialect = pg_dialect());

    QueryResult execute(const std::string& sql, const Params& params = {}) const;
    QueryResult execute(const SqlQuery& query) const { return execute(query.sql, query.params); }

    const SqlDialect& dialect() const { return dialect_; }
    DMLVisitor dml() const { return DMLVisitor(dialect_); }

private:
    QueryFn fn_;
    const SqlDialect& dialect_;
};

// Copy of @p row with snake_case keys renamed to camelCase.
jval map_row(const jval& row, jdaloc& allocator, const CasingOverrides& overrides = {});

// In place over an array of rows.
void map_rows(jdoc& rows, const CasingOverrides& overrides = {});

} // namespace tabula
