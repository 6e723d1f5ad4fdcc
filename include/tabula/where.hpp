#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "tabula/casing.hpp"
#include "tabula/dialect.hpp"
#include "tabula/jsonhlp.hpp"
#include "tabula/value.hpp"

namespace tabula {

enum class Op {
    Eq, Ne, Gt, Gte, Lt, Lte,
    Contains, StartsWith, EndsWith,
    In, NotIn, IsNull,
    ArrayContains, ArrayContainedBy, ArrayOverlaps
};

// eq, ne, ..., arrayOverlaps; throws QueryError on anything else
Op parse_op(const std::string& name);

struct WhereFilter;

// column may address a JSON path: "metadata->settings->theme"
struct Comparison {
    std::string column;
    Op op = Op::Eq;
    Value value;
};

struct AndFilter { std::vector<WhereFilter> children; };
struct OrFilter  { std::vector<WhereFilter> children; };
struct NotFilter { std::shared_ptr<const WhereFilter> child; };

/**
 * Recursive boolean filter. Identities that hold at any depth:
 *   In []     -> FALSE        NotIn [] -> TRUE
 *   Or {}     -> FALSE        And {}   -> TRUE
 * A top-level empty And produces no WHERE clause at all.
 */
struct WhereFilter {
    std::variant<Comparison, AndFilter, OrFilter, NotFilter> node;

    WhereFilter() : node(AndFilter{}) {}
    WhereFilter(Comparison c) : node(std::move(c)) {}
    WhereFilter(AndFilter f) : node(std::move(f)) {}
    WhereFilter(OrFilter f) : node(std::move(f)) {}
    WhereFilter(NotFilter f) : node(std::move(f)) {}

    bool empty() const;

    static WhereFilter cmp(std::string column, Op op, Value value);
    static WhereFilter eq(std::string column, Value value);
    static WhereFilter all(std::vector<WhereFilter> children);
    static WhereFilter any(std::vector<WhereFilter> children);
    static WhereFilter negate(WhereFilter child);
};

/**
 * Map form -> filter tree.
 *   {"name": "a", "age": {"gte": 18, "lt": 65}, "OR": [{...}], "AND": [{...}], "NOT": {...}}
 * A bare value is equality. Operators of one column compile in a fixed order.
 */
WhereFilter parse_where(const jval& obj);
WhereFilter parse_where(const std::string& json_text);

struct WhereResult {
    std::string sql;   // without the WHERE keyword
    Params params;
};

// Placeholders start at offset + 1.
WhereResult build_where(const WhereFilter& filter, const SqlDialect& dialect = pg_dialect(),
                        size_t offset = 0, const CasingOverrides& overrides = {});

// Escapes \ then % then _ with a backslash.
std::string escape_like(const std::string& text);

// "metadata->a->b" -> "metadata"->'a'->>'b'; plain names -> "snake_name"
std::string column_ref(const std::string& key, const SqlDialect& dialect, const CasingOverrides& overrides = {});

} // namespace tabula
