#include "tabula/dml_visitor.hpp"
#include <algorithm>
#include <sstream>
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    std::string table_ref(const std::string& table) {
        return quote_ident(camel_to_snake(table));
    }

    std::string column_name(const std::string& name, const CasingOverrides& overrides) {
        return quote_ident(camel_to_snake(name, overrides));
    }

    bool listed(const std::vector<std::string>& xs, const std::string& x) {
        return std::find(xs.begin(), xs.end(), x) != xs.end();
    }

    std::string direction(const std::string& dir) {
        const std::string d = to_lower(dir);
        if (d != "asc" && d != "desc")
            throw QueryError("Invalid orderBy direction \"" + dir + "\". Only 'asc' or 'desc' are allowed.");
        return to_upper(d);
    }

    // Collects parameters and hands out placeholders for one statement.
    class Binder {
    public:
        explicit Binder(const SqlDialect& dialect) : dialect_(dialect) {}

        std::string bind(Value v) {
            params_.push_back(std::move(v));
            return dialect_.param(params_.size());
        }

        // Value or the dialect's timestamp expression for a "now" sentinel in a now column.
        std::string value(const std::string& column, const Value& v, const std::vector<std::string>& now_columns) {
            if (v.is_string() && v.as_string() == NOW_SENTINEL && listed(now_columns, column)) return dialect_.now();
            return bind(v);
        }

        // Appends a WHERE fragment whose placeholders continue after the current ones.
        std::string where(const WhereFilter& filter, const CasingOverrides& overrides) {
            WhereResult w = build_where(filter, dialect_, params_.size(), overrides);
            for (auto& p : w.params) params_.push_back(std::move(p));
            return w.sql;
        }

        size_t size() const { return params_.size(); }
        Params take() { return std::move(params_); }

    private:
        const SqlDialect& dialect_;
        Params params_;
    };

    std::string returning_clause(const SqlDialect& dialect, bool returning,
                                 const std::vector<std::string>& columns, const CasingOverrides& overrides) {
        if (!returning) return "";
        dialect.require_returning();
        return " RETURNING " + select_list(columns, overrides);
    }
}

std::string select_list(const std::vector<std::string>& columns, const CasingOverrides& overrides) {
    if (columns.empty()) return "*";
    strings out;
    for (const auto& col : columns) {
        const std::string snake = camel_to_snake(col, overrides);
        if (snake == col) out.push_back(quote_ident(col));
        else out.push_back(quote_ident(snake) + " AS " + quote_ident(col));
    }
    return join(out, ", ");
}

void assert_non_empty_where(const WhereFilter& where, const std::string& operation) {
    if (where.empty())
        throw QueryError(operation + " requires a non-empty where clause; refusing to touch every row");
}

/* ---------- SELECT ---------- */

SqlQuery DMLVisitor::select(const SelectOptions& o) const {
    Binder binder(dialect_);
    std::ostringstream sql;

    sql << "SELECT " << select_list(o.columns, o.overrides);
    if (o.with_count) sql << ", COUNT(*) OVER() AS \"totalCount\"";
    sql << " FROM " << table_ref(o.table);

    strings conditions;
    std::string filter = binder.where(o.where, o.overrides);
    if (!filter.empty()) conditions.push_back(filter);

    if (!o.cursor.empty()) {
        // Keyset: the first cursor column's sort direction decides the comparison.
        std::string dir = "asc";
        for (const auto& [col, d] : o.order_by) {
            if (col == o.cursor.front().first) { dir = to_lower(d); break; }
        }
        const char* op = dir == "desc" ? " < " : " > ";
        if (o.cursor.size() == 1) {
            const auto& [col, value] = o.cursor.front();
            conditions.push_back(column_name(col, o.overrides) + op + binder.bind(value));
        } else {
            strings cols, phs;
            for (const auto& [col, value] : o.cursor) {
                cols.push_back(column_name(col, o.overrides));
                phs.push_back(binder.bind(value));
            }
            conditions.push_back("(" + join(cols, ", ") + ")" + op + "(" + join(phs, ", ") + ")");
        }
    }
    if (!conditions.empty()) sql << " WHERE " << join(conditions, " AND ");

    strings order;
    if (!o.order_by.empty()) {
        for (const auto& [col, dir] : o.order_by) order.push_back(column_name(col, o.overrides) + " " + direction(dir));
    } else {
        for (const auto& [col, _] : o.cursor) order.push_back(column_name(col, o.overrides) + " ASC");
    }
    if (!order.empty()) sql << " ORDER BY " << join(order, ", ");

    if (auto limit = o.take ? o.take : o.limit) sql << " LIMIT " << binder.bind(*limit);
    if (o.offset) sql << " OFFSET " << binder.bind(*o.offset);

    return SqlQuery{sql.str(), binder.take()};
}

/* ---------- INSERT ---------- */

SqlQuery DMLVisitor::insert(const InsertOptions& o) const {
    if (o.rows.empty() || o.rows.front().empty())
        throw QueryError("insert into " + o.table + " needs at least one row with one column");

    Binder binder(dialect_);
    std::ostringstream sql;

    strings names;
    for (const auto& [col, _] : o.rows.front()) names.push_back(col);

    strings cols;
    for (const auto& n : names) cols.push_back(column_name(n, o.overrides));
    sql << "INSERT INTO " << table_ref(o.table) << " (" << join(cols, ", ") << ") VALUES ";

    strings tuples;
    for (const auto& row : o.rows) {
        strings vals;
        for (const auto& n : names) {
            const Value* v = find_field(row, n);
            vals.push_back(v ? binder.value(n, *v, o.now_columns) : binder.bind(nullptr));
        }
        tuples.push_back("(" + join(vals, ", ") + ")");
    }
    sql << join(tuples, ", ");

    if (o.on_conflict) {
        const OnConflict& oc = *o.on_conflict;
        strings target;
        for (const auto& c : oc.columns) target.push_back(column_name(c, o.overrides));
        sql << " ON CONFLICT (" << join(target, ", ") << ")";

        strings sets;
        if (oc.action == OnConflict::Action::Update) {
            if (!oc.update_values.empty()) {
                for (const auto& [col, v] : oc.update_values)
                    sets.push_back(column_name(col, o.overrides) + " = " + binder.value(col, v, o.now_columns));
            } else {
                for (const auto& col : oc.update_columns) {
                    const std::string c = column_name(col, o.overrides);
                    sets.push_back(c + " = EXCLUDED." + c);
                }
            }
        }
        if (sets.empty()) sql << " DO NOTHING";
        else sql << " DO UPDATE SET " << join(sets, ", ");
    }

    sql << returning_clause(dialect_, o.returning, o.returning_columns, o.overrides);
    return SqlQuery{sql.str(), binder.take()};
}

/* ---------- UPDATE ---------- */

SqlQuery DMLVisitor::update(const UpdateOptions& o) const {
    if (o.data.empty()) throw QueryError("update of " + o.table + " has no columns to set");
    assert_non_empty_where(o.where, "update of " + o.table);

    Binder binder(dialect_);
    std::ostringstream sql;

    strings sets;
    for (const auto& [col, v] : o.data)
        sets.push_back(column_name(col, o.overrides) + " = " + binder.value(col, v, o.now_columns));
    sql << "UPDATE " << table_ref(o.table) << " SET " << join(sets, ", ");
    sql << " WHERE " << binder.where(o.where, o.overrides);
    sql << returning_clause(dialect_, o.returning, o.returning_columns, o.overrides);
    return SqlQuery{sql.str(), binder.take()};
}

/* ---------- DELETE ---------- */

SqlQuery DMLVisitor::remove(const DeleteOptions& o) const {
    assert_non_empty_where(o.where, "delete from " + o.table);

    Binder binder(dialect_);
    std::ostringstream sql;
    sql << "DELETE FROM " << table_ref(o.table) << " WHERE " << binder.where(o.where, o.overrides);
    sql << returning_clause(dialect_, o.returning, o.returning_columns, o.overrides);
    return SqlQuery{sql.str(), binder.take()};
}

} // namespace tabula
