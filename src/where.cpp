#include "tabula/where.hpp"
#include <utility>
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    // Fixed compile order for the operators of one column.
    const std::pair<const char*, Op> OPERATORS[] = {
        {"eq", Op::Eq}, {"ne", Op::Ne}, {"gt", Op::Gt}, {"gte", Op::Gte}, {"lt", Op::Lt}, {"lte", Op::Lte},
        {"contains", Op::Contains}, {"startsWith", Op::StartsWith}, {"endsWith", Op::EndsWith},
        {"in", Op::In}, {"notIn", Op::NotIn}, {"isNull", Op::IsNull},
        {"arrayContains", Op::ArrayContains}, {"arrayContainedBy", Op::ArrayContainedBy},
        {"arrayOverlaps", Op::ArrayOverlaps},
    };

    bool is_operator_key(const char* key) {
        for (const auto& [name, op] : OPERATORS) if (std::string(name) == key) return true;
        return false;
    }

    bool is_operator_object(const jval& v) {
        if (!v.IsObject() || v.MemberCount() == 0) return false;
        for (jit it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
            if (!is_operator_key(it->name.GetString())) return false;
        }
        return true;
    }

    struct Compiler {
        const SqlDialect& dialect;
        const CasingOverrides& overrides;
        size_t offset;
        Params params;

        std::string bind(Value v) {
            params.push_back(std::move(v));
            return dialect.param(offset + params.size());
        }

        std::string comparison(const Comparison& c) {
            const std::string ref = column_ref(c.column, dialect, overrides);
            switch (c.op) {
                case Op::Eq:  return ref + " = "  + bind(c.value);
                case Op::Ne:  return ref + " != " + bind(c.value);
                case Op::Gt:  return ref + " > "  + bind(c.value);
                case Op::Gte: return ref + " >= " + bind(c.value);
                case Op::Lt:  return ref + " < "  + bind(c.value);
                case Op::Lte: return ref + " <= " + bind(c.value);
                case Op::Contains:
                    return ref + " LIKE " + bind("%" + escape_like(pattern(c)) + "%") + " ESCAPE '\\'";
                case Op::StartsWith:
                    return ref + " LIKE " + bind(escape_like(pattern(c)) + "%") + " ESCAPE '\\'";
                case Op::EndsWith:
                    return ref + " LIKE " + bind("%" + escape_like(pattern(c))) + " ESCAPE '\\'";
                case Op::In:
                case Op::NotIn: {
                    const ValueList& xs = list(c);
                    if (xs.empty()) return c.op == Op::In ? "FALSE" : "TRUE";
                    strings ph;
                    for (const auto& x : xs) ph.push_back(bind(x));
                    return ref + (c.op == Op::In ? " IN (" : " NOT IN (") + join(ph, ", ") + ")";
                }
                case Op::IsNull: {
                    bool is_null = c.value.is_bool() ? c.value.as_bool() : !c.value.is_null();
                    return ref + (is_null ? " IS NULL" : " IS NOT NULL");
                }
                case Op::ArrayContains:
                    dialect.require_array_ops();
                    return ref + " @> " + bind(list(c));
                case Op::ArrayContainedBy:
                    dialect.require_array_ops();
                    return ref + " <@ " + bind(list(c));
                case Op::ArrayOverlaps:
                    dialect.require_array_ops();
                    return ref + " && " + bind(list(c));
            }
            throw QueryError("unknown operator on column " + c.column);
        }

        static const std::string& pattern(const Comparison& c) {
            if (!c.value.is_string()) throw QueryError("pattern operators need a string value on column " + c.column);
            return c.value.as_string();
        }

        static const ValueList& list(const Comparison& c) {
            if (!c.value.is_list()) throw QueryError("list operators need an array value on column " + c.column);
            return c.value.as_list();
        }

        // Clauses of one level; an And node contributes its children, joined by the caller with AND.
        strings clauses(const WhereFilter& f) {
            strings out;
            if (const auto* a = std::get_if<AndFilter>(&f.node)) {
                for (const auto& child : a->children) out.push_back(item(child));
            } else {
                out.push_back(item(f));
            }
            return out;
        }

        // One OR/AND branch; parenthesized when it holds several clauses.
        std::string branch(const WhereFilter& f) {
            strings cl = clauses(f);
            if (cl.empty()) return "TRUE";
            if (cl.size() == 1) return cl.front();
            return "(" + join(cl, " AND ") + ")";
        }

        std::string item(const WhereFilter& f) {
            if (const auto* c = std::get_if<Comparison>(&f.node)) return comparison(*c);
            if (const auto* a = std::get_if<AndFilter>(&f.node)) {
                if (a->children.empty()) return "TRUE";
                strings parts;
                for (const auto& child : a->children) parts.push_back(branch(child));
                return "(" + join(parts, " AND ") + ")";
            }
            if (const auto* o = std::get_if<OrFilter>(&f.node)) {
                if (o->children.empty()) return "FALSE";
                strings parts;
                for (const auto& child : o->children) parts.push_back(branch(child));
                return "(" + join(parts, " OR ") + ")";
            }
            const auto& n = std::get<NotFilter>(f.node);
            if (!n.child) return "NOT (TRUE)";
            strings cl = clauses(*n.child);
            return "NOT (" + (cl.empty() ? std::string("TRUE") : join(cl, " AND ")) + ")";
        }
    };
}

Op parse_op(const std::string& name) {
    for (const auto& [key, op] : OPERATORS) if (name == key) return op;
    throw QueryError("unknown filter operator: " + name);
}

bool WhereFilter::empty() const {
    const auto* a = std::get_if<AndFilter>(&node);
    return a && a->children.empty();
}

WhereFilter WhereFilter::cmp(std::string column, Op op, Value value) {
    return Comparison{std::move(column), op, std::move(value)};
}

WhereFilter WhereFilter::eq(std::string column, Value value) {
    return cmp(std::move(column), Op::Eq, std::move(value));
}

WhereFilter WhereFilter::all(std::vector<WhereFilter> children) {
    return AndFilter{std::move(children)};
}

WhereFilter WhereFilter::any(std::vector<WhereFilter> children) {
    return OrFilter{std::move(children)};
}

WhereFilter WhereFilter::negate(WhereFilter child) {
    return NotFilter{std::make_shared<const WhereFilter>(std::move(child))};
}

WhereFilter parse_where(const jval& obj) {
    if (obj.IsNull()) return WhereFilter{};
    if (!obj.IsObject()) throw QueryError("where filter must be an object");

    std::vector<WhereFilter> items;
    for (jit it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        const std::string key = it->name.GetString();
        if (key == "OR" || key == "AND" || key == "NOT") continue;
        const jval& v = it->value;
        if (is_operator_object(v)) {
            for (const auto& [name, op] : OPERATORS) {
                if (v.HasMember(name)) items.push_back(WhereFilter::cmp(key, op, to_value(v[name])));
            }
        } else {
            items.push_back(WhereFilter::eq(key, to_value(v)));
        }
    }

    for (const char* group : {"OR", "AND"}) {
        if (!obj.HasMember(group)) continue;
        const jval& list = obj[group];
        if (!list.IsArray()) throw QueryError(std::string(group) + " must be an array of filters");
        std::vector<WhereFilter> children;
        for (const auto& sub : list.GetArray()) children.push_back(parse_where(sub));
        items.push_back(std::string(group) == "OR" ? WhereFilter::any(std::move(children))
                                                   : WhereFilter::all(std::move(children)));
    }

    if (obj.HasMember("NOT")) items.push_back(WhereFilter::negate(parse_where(obj["NOT"])));
    return WhereFilter::all(std::move(items));
}

WhereFilter parse_where(const std::string& json_text) {
    jdoc doc;
    if (!jhlp::parse_str(json_text, doc)) throw QueryError("where filter is not valid JSON");
    return parse_where(static_cast<const jval&>(doc));
}

WhereResult build_where(const WhereFilter& filter, const SqlDialect& dialect,
                        size_t offset, const CasingOverrides& overrides) {
    if (filter.empty()) return {};
    Compiler c{dialect, overrides, offset, {}};
    strings cl = c.clauses(filter);
    return WhereResult{join(cl, " AND "), std::move(c.params)};
}

std::string escape_like(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 4);
    for (char ch : text) {
        if (ch == '\\' || ch == '%' || ch == '_') out += '\\';
        out += ch;
    }
    return out;
}

std::string column_ref(const std::string& key, const SqlDialect& dialect, const CasingOverrides& overrides) {
    const size_t arrow = key.find("->");
    if (arrow == std::string::npos) return quote_ident(camel_to_snake(key, overrides));

    dialect.require_json_path();
    strings segments;
    size_t start = arrow + 2;
    while (true) {
        size_t next = key.find("->", start);
        segments.push_back(key.substr(start, next == std::string::npos ? std::string::npos : next - start));
        if (next == std::string::npos) break;
        start = next + 2;
    }
    std::string ref = quote_ident(camel_to_snake(key.substr(0, arrow), overrides));
    for (size_t i = 0; i < segments.size(); ++i) {
        ref += (i + 1 < segments.size() ? "->" : "->>") + quote_literal(segments[i]);
    }
    return ref;
}

} // namespace tabula
