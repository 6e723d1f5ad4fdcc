#include "tabula/aggregate.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    struct FnColumns {
        const char* fn;  // lower case
        const std::vector<std::string>* columns;
    };

    std::vector<FnColumns> functions(const AggregateSpec& spec) {
        return {{"avg", &spec.avg}, {"sum", &spec.sum}, {"min", &spec.min}, {"max", &spec.max}};
    }

    std::string snake(const std::string& col, const CasingOverrides& overrides) {
        return camel_to_snake(col, overrides);
    }

    strings projections(const AggregateSpec& spec, const CasingOverrides& overrides) {
        strings parts;
        if (spec.count_all) {
            parts.push_back("COUNT(*) AS \"_count\"");
        } else {
            for (const auto& col : spec.count) {
                const std::string s = snake(col, overrides);
                parts.push_back("COUNT(" + quote_ident(s) + ") AS " + quote_ident("_count_" + s));
            }
        }
        for (const auto& f : functions(spec)) {
            for (const auto& col : *f.columns) {
                const std::string s = snake(col, overrides);
                parts.push_back(to_upper(f.fn) + "(" + quote_ident(s) + ") AS " +
                                quote_ident(std::string("_") + f.fn + "_" + s));
            }
        }
        return parts;
    }

    int64_t count_of(const jval& row, const std::string& key) {
        auto it = row.FindMember(key.c_str());
        if (it == row.MemberEnd() || it->value.IsNull()) return 0;
        const jval& v = it->value;
        if (v.IsInt64()) return v.GetInt64();
        if (v.IsNumber()) return static_cast<int64_t>(v.GetDouble());
        if (v.IsString()) return std::stoll(v.GetString());
        return 0;
    }

    jval number_of(const jval& row, const std::string& key) {
        auto it = row.FindMember(key.c_str());
        if (it == row.MemberEnd() || it->value.IsNull()) return jval(json::kNullType);
        const jval& v = it->value;
        if (v.IsInt64()) return jval(v.GetInt64());
        if (v.IsNumber()) return jval(v.GetDouble());
        if (v.IsString()) return jval(std::stod(v.GetString()));
        return jval(json::kNullType);
    }
}

bool AggregateSpec::empty() const {
    return !count_all && count.empty() && avg.empty() && sum.empty() && min.empty() && max.empty();
}

std::vector<std::string> aggregate_aliases(const AggregateSpec& spec, const CasingOverrides& overrides) {
    std::vector<std::string> out;
    if (spec.count_all) out.push_back("_count");
    else for (const auto& col : spec.count) out.push_back("_count_" + snake(col, overrides));
    for (const auto& f : functions(spec))
        for (const auto& col : *f.columns) out.push_back(std::string("_") + f.fn + "_" + snake(col, overrides));
    return out;
}

SqlQuery build_count(const std::string& table, const WhereFilter& where,
                     const SqlDialect& dialect, const CasingOverrides& overrides) {
    SqlQuery q;
    q.sql = "SELECT COUNT(*) AS \"count\" FROM " + quote_ident(camel_to_snake(table));
    WhereResult w = build_where(where, dialect, 0, overrides);
    if (!w.sql.empty()) {
        q.sql += " WHERE " + w.sql;
        q.params = std::move(w.params);
    }
    return q;
}

SqlQuery build_aggregate(const std::string& table, const WhereFilter& where, const AggregateSpec& spec,
                         const SqlDialect& dialect, const CasingOverrides& overrides) {
    if (spec.empty()) throw QueryError("aggregate on " + table + " requests no aggregation fields");

    SqlQuery q;
    q.sql = "SELECT " + join(projections(spec, overrides), ", ") + " FROM " + quote_ident(camel_to_snake(table));
    WhereResult w = build_where(where, dialect, 0, overrides);
    if (!w.sql.empty()) {
        q.sql += " WHERE " + w.sql;
        q.params = std::move(w.params);
    }
    return q;
}

SqlQuery build_group_by(const GroupByOptions& o, const SqlDialect& dialect) {
    if (o.by.empty()) throw QueryError("groupBy on " + o.table + " needs at least one column");

    // Validate ordering first; nothing derived from it reaches SQL unchecked.
    const std::vector<std::string> aliases = aggregate_aliases(o.aggregate, o.overrides);
    strings order;
    for (const auto& [col, dir] : o.order_by) {
        const std::string d = to_lower(dir);
        if (d != "asc" && d != "desc")
            throw QueryError("Invalid orderBy direction \"" + dir + "\". Only 'asc' or 'desc' are allowed.");
        const std::string safe_dir = d == "desc" ? "DESC" : "ASC";

        if (col == "_count") {
            order.push_back("COUNT(*) " + safe_dir);
        } else if (!col.empty() && col[0] == '_') {
            if (std::find(aliases.begin(), aliases.end(), col) == aliases.end())
                throw QueryError("Invalid orderBy column \"" + col +
                                 "\". Underscore-prefixed columns must match a requested aggregation alias.");
            order.push_back(quote_ident(col) + " " + safe_dir);
        } else {
            if (std::find(o.by.begin(), o.by.end(), col) == o.by.end())
                throw QueryError("Invalid orderBy column \"" + col + "\". It must be one of the groupBy columns.");
            order.push_back(quote_ident(snake(col, o.overrides)) + " " + safe_dir);
        }
    }

    strings parts = {select_list(o.by, o.overrides)};
    for (auto& p : projections(o.aggregate, o.overrides)) parts.push_back(std::move(p));

    strings group;
    for (const auto& col : o.by) group.push_back(quote_ident(snake(col, o.overrides)));

    SqlQuery q;
    std::ostringstream sql;
    sql << "SELECT " << join(parts, ", ") << " FROM " << quote_ident(camel_to_snake(o.table));
    WhereResult w = build_where(o.where, dialect, 0, o.overrides);
    if (!w.sql.empty()) {
        sql << " WHERE " << w.sql;
        q.params = std::move(w.params);
    }
    sql << " GROUP BY " << join(group, ", ");
    if (!order.empty()) sql << " ORDER BY " << join(order, ", ");
    if (o.limit) {
        q.params.push_back(*o.limit);
        sql << " LIMIT " << dialect.param(q.params.size());
    }
    if (o.offset) {
        q.params.push_back(*o.offset);
        sql << " OFFSET " << dialect.param(q.params.size());
    }
    q.sql = sql.str();
    return q;
}

jval restructure_aggregate(const jval& row, const AggregateSpec& spec, const std::vector<std::string>& by,
                           jdaloc& allocator, const CasingOverrides& overrides) {
    jval out(json::kObjectType);

    for (const auto& col : by) {
        jval v(json::kNullType);
        auto it = row.FindMember(col.c_str());
        if (it == row.MemberEnd()) it = row.FindMember(snake(col, overrides).c_str());
        if (it != row.MemberEnd()) v.CopyFrom(it->value, allocator);
        jhlp::put(out, col, v, allocator);
    }

    if (spec.count_all) {
        jhlp::set(out, "_count", count_of(row, "_count"), allocator);
    } else if (!spec.count.empty()) {
        jval counts(json::kObjectType);
        for (const auto& col : spec.count)
            jhlp::set(counts, col, count_of(row, "_count_" + snake(col, overrides)), allocator);
        jhlp::put(out, "_count", counts, allocator);
    }

    for (const auto& f : functions(spec)) {
        if (f.columns->empty()) continue;
        jval group(json::kObjectType);
        for (const auto& col : *f.columns) {
            jval v = number_of(row, std::string("_") + f.fn + "_" + snake(col, overrides));
            jhlp::put(group, col, v, allocator);
        }
        jhlp::put(out, std::string("_") + f.fn, group, allocator);
    }
    return out;
}

} // namespace tabula
