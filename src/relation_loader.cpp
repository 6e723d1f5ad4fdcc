#include "tabula/relation_loader.hpp"
#include <algorithm>
#include <map>
#include <set>
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    // Distinct non-null values of one member across rows, in first-seen order.
    ValueList distinct_values(const jval& rows, const std::string& key) {
        ValueList out;
        std::set<std::string> seen;
        for (const auto& row : rows.GetArray()) {
            if (!row.IsObject()) continue;
            auto it = row.FindMember(key.c_str());
            if (it == row.MemberEnd() || it->value.IsNull()) continue;
            if (seen.insert(value_key(it->value)).second) out.push_back(to_value(it->value));
        }
        return out;
    }

    std::string key_of(const jval& row, const std::string& key) {
        auto it = row.FindMember(key.c_str());
        if (it == row.MemberEnd() || it->value.IsNull()) return "";
        return value_key(it->value);
    }

    std::vector<std::string> with_column(std::vector<std::string> columns, const std::string& col) {
        if (std::find(columns.begin(), columns.end(), col) == columns.end()) columns.push_back(col);
        return columns;
    }

    QueryResult fetch_in(const Executor& executor, const std::string& table,
                         const std::vector<std::string>& columns, const std::string& key, ValueList keys) {
        SelectOptions sel;
        sel.table = table;
        sel.columns = columns;
        sel.where = WhereFilter::cmp(key, Op::In, Value(std::move(keys)));
        return executor.execute(executor.dml().select(sel));
    }

    void attach(jval& row, const std::string& name, const jval& value, jdaloc& allocator) {
        jval copy(value, allocator);
        jhlp::put(row, name, copy, allocator);
    }

    void attach_list(jval& row, const std::string& name, const std::vector<const jval*>& items, jdaloc& allocator) {
        jval arr(json::kArrayType);
        for (const jval* item : items) arr.PushBack(jval(*item, allocator), allocator);
        jhlp::put(row, name, arr, allocator);
    }
}

IncludeSpec parse_include(const jval& obj) {
    IncludeSpec spec;
    if (!obj.IsObject()) return spec;
    for (jit it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        const jval& v = it->value;
        if (v.IsBool() && !v.GetBool()) continue;

        IncludeEntry entry;
        entry.relation = it->name.GetString();
        if (v.IsObject()) {
            if (v.HasMember("select")) {
                const jval& sel = v["select"];
                if (sel.IsArray()) {
                    entry.option.select = jhlp::get_strings(v, "select");
                } else if (sel.IsObject()) {
                    for (jit s = sel.MemberBegin(); s != sel.MemberEnd(); ++s) {
                        if (!s->value.IsBool() || s->value.GetBool()) entry.option.select.push_back(s->name.GetString());
                    }
                }
            }
            if (v.HasMember("include")) entry.option.include = parse_include(v["include"]);
        }
        spec.push_back(std::move(entry));
    }
    return spec;
}

int include_depth(const IncludeSpec& include) {
    int deepest = 0;
    for (const auto& entry : include) deepest = std::max(deepest, 1 + include_depth(entry.option.include));
    return deepest;
}

void load_relations(const Executor& executor, jval& rows, jdaloc& allocator,
                    const std::string& table, const IncludeSpec& include,
                    const Registry& registry, int depth) {
    if (depth == 0 && include_depth(include) > MAX_INCLUDE_DEPTH) {
        throw QueryError("Includes on " + table + " nest " + std::to_string(include_depth(include)) +
                         " levels deep; at most " + std::to_string(MAX_INCLUDE_DEPTH) + " are loaded");
    }
    if (include.empty() || !rows.IsArray() || rows.Empty()) return;
    const RegistryEntry& owner = registry.at(table);

    for (const auto& entry : include) {
        const RelationDef* rel = owner.relations.find(entry.relation);
        if (!rel) throw QueryError("Unknown relation \"" + entry.relation + "\" on table " + table);
        const TableDef& target = registry.at(rel->target).table;
        const std::string target_pk = target.primary_key();

        std::vector<std::string> columns = entry.option.select.empty()
            ? resolve_select_columns(target)
            : entry.option.select;
        columns = with_column(std::move(columns), target_pk);

        const bool nested = !entry.option.include.empty();

        if (rel->kind == RelationDef::Kind::One) {
            ValueList keys = distinct_values(rows, rel->foreign_key);
            std::map<std::string, const jval*> by_key;
            QueryResult found;
            if (!keys.empty()) {
                found = fetch_in(executor, target.name, columns, target_pk, std::move(keys));
                if (nested) load_relations(executor, found.rows, found.rows.GetAllocator(), target.name,
                                           entry.option.include, registry, depth + 1);
                for (const auto& r : found.rows.GetArray()) by_key.emplace(key_of(r, target_pk), &r);
            }
            const jval null_value(json::kNullType);
            for (auto& row : rows.GetArray()) {
                auto hit = by_key.find(key_of(row, rel->foreign_key));
                attach(row, entry.relation, hit == by_key.end() ? null_value : *hit->second, allocator);
            }
            continue;
        }

        const std::string owner_pk = owner.table.primary_key();
        ValueList parent_keys = distinct_values(rows, owner_pk);
        std::map<std::string, std::vector<const jval*>> by_parent;
        QueryResult found;
        QueryResult links;

        if (!parent_keys.empty() && !rel->through) {
            columns = with_column(std::move(columns), rel->foreign_key);
            found = fetch_in(executor, target.name, columns, rel->foreign_key, std::move(parent_keys));
            if (nested) load_relations(executor, found.rows, found.rows.GetAllocator(), target.name,
                                       entry.option.include, registry, depth + 1);
            for (const auto& r : found.rows.GetArray()) by_parent[key_of(r, rel->foreign_key)].push_back(&r);
        } else if (!parent_keys.empty()) {
            const auto& through = *rel->through;
            links = fetch_in(executor, through.table, {through.this_key, through.that_key},
                             through.this_key, std::move(parent_keys));
            ValueList other_keys = distinct_values(links.rows, through.that_key);
            if (!other_keys.empty()) {
                found = fetch_in(executor, target.name, columns, target_pk, std::move(other_keys));
                if (nested) load_relations(executor, found.rows, found.rows.GetAllocator(), target.name,
                                           entry.option.include, registry, depth + 1);
                std::map<std::string, const jval*> by_key;
                for (const auto& r : found.rows.GetArray()) by_key.emplace(key_of(r, target_pk), &r);
                for (const auto& link : links.rows.GetArray()) {
                    auto hit = by_key.find(key_of(link, through.that_key));
                    if (hit != by_key.end()) by_parent[key_of(link, through.this_key)].push_back(hit->second);
                }
            }
        }

        const std::vector<const jval*> none;
        for (auto& row : rows.GetArray()) {
            auto hit = by_parent.find(key_of(row, owner_pk));
            attach_list(row, entry.relation, hit == by_parent.end() ? none : hit->second, allocator);
        }
    }
}

} // namespace tabula
