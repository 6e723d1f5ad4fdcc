#include "tabula/differ.hpp"
#include <algorithm>
#include <set>
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    std::string index_key(const std::vector<std::string>& columns) {
        return join(columns, ",");
    }

    bool contains(const std::vector<std::string>& xs, const std::string& x) {
        return std::find(xs.begin(), xs.end(), x) != xs.end();
    }

    void diff_table(const std::string& name, const TableSnapshot& before,
                    const TableSnapshot& after, DiffResult& changes) {
        std::vector<std::string> removed, added;
        for (const auto& [col, _] : before.columns) if (!after.columns.contains(col)) removed.push_back(col);
        for (const auto& [col, _] : after.columns) if (!before.columns.contains(col)) added.push_back(col);

        std::vector<std::string> matched_removed, matched_added;
        std::vector<ColumnRenamed> renames;

        for (const auto& old_col : removed) {
            const ColumnSnapshot& old_snap = *before.columns.find(old_col);
            std::string best;
            double best_score = 0.0;
            for (const auto& new_col : added) {
                if (contains(matched_added, new_col)) continue;
                double score = column_similarity(old_snap, *after.columns.find(new_col));
                if (score > best_score) {
                    best_score = score;
                    best = new_col;
                }
            }
            if (!best.empty() && best_score >= RENAME_THRESHOLD) {
                renames.push_back(ColumnRenamed{name, old_col, best, best_score});
                matched_removed.push_back(old_col);
                matched_added.push_back(best);
            }
        }

        for (auto& r : renames) changes.emplace_back(std::move(r));
        for (const auto& col : added)
            if (!contains(matched_added, col)) changes.emplace_back(ColumnAdded{name, col});
        for (const auto& col : removed)
            if (!contains(matched_removed, col)) changes.emplace_back(ColumnRemoved{name, col});

        for (const auto& [col, a] : after.columns) {
            const ColumnSnapshot* b = before.columns.find(col);
            if (!b) continue;
            if (b->type == a.type && b->nullable == a.nullable && b->default_value == a.default_value) continue;
            ColumnAltered alt;
            alt.table = name;
            alt.column = col;
            if (b->type != a.type) { alt.old_type = b->type; alt.new_type = a.type; }
            if (b->nullable != a.nullable) { alt.old_nullable = b->nullable; alt.new_nullable = a.nullable; }
            if (b->default_value != a.default_value) {
                alt.default_changed = true;
                alt.old_default = b->default_value;
                alt.new_default = a.default_value;
            }
            changes.emplace_back(std::move(alt));
        }

        std::set<std::string> before_keys, after_keys;
        for (const auto& i : before.indexes) before_keys.insert(index_key(i.columns));
        for (const auto& i : after.indexes) after_keys.insert(index_key(i.columns));
        for (const auto& i : after.indexes)
            if (!before_keys.count(index_key(i.columns)))
                changes.emplace_back(IndexAdded{name, i.columns, i.name, i.unique});
        for (const auto& i : before.indexes)
            if (!after_keys.count(index_key(i.columns)))
                changes.emplace_back(IndexRemoved{name, i.columns, i.name, i.unique});
    }
}

double column_similarity(const ColumnSnapshot& a, const ColumnSnapshot& b) {
    int score = 0;
    const int total = 6;
    if (a.type == b.type) score += 3;
    if (a.nullable == b.nullable) score += 1;
    if (a.primary == b.primary) score += 1;
    if (a.unique == b.unique) score += 1;
    return static_cast<double>(score) / total;
}

DiffResult compute_diff(const SchemaSnapshot& before, const SchemaSnapshot& after) {
    DiffResult changes;

    for (const auto& [name, _] : after.tables)
        if (!before.tables.contains(name)) changes.emplace_back(TableAdded{name});
    for (const auto& [name, _] : before.tables)
        if (!after.tables.contains(name)) changes.emplace_back(TableRemoved{name});

    for (const auto& [name, table] : after.tables) {
        const TableSnapshot* prev = before.tables.find(name);
        if (!prev) continue;
        diff_table(name, *prev, table, changes);
    }

    for (const auto& [name, _] : after.enums)
        if (!before.enums.contains(name)) changes.emplace_back(EnumAdded{name});
    for (const auto& [name, _] : before.enums)
        if (!after.enums.contains(name)) changes.emplace_back(EnumRemoved{name});
    for (const auto& [name, values] : after.enums) {
        const auto* prev = before.enums.find(name);
        if (!prev) continue;
        EnumAltered alt;
        alt.name = name;
        for (const auto& v : values) if (!contains(*prev, v)) alt.added_values.push_back(v);
        for (const auto& v : *prev) if (!contains(values, v)) alt.removed_values.push_back(v);
        if (!alt.added_values.empty() || !alt.removed_values.empty()) changes.emplace_back(std::move(alt));
    }
    return changes;
}

DiffResult reverse_changes(const DiffResult& changes) {
    DiffResult out;
    out.reserve(changes.size());
    for (auto it = changes.rbegin(); it != changes.rend(); ++it) {
        out.push_back(std::visit(overloaded{
            [](const TableAdded& c) -> DiffChange { return TableRemoved{c.table}; },
            [](const TableRemoved& c) -> DiffChange { return TableAdded{c.table}; },
            [](const ColumnAdded& c) -> DiffChange { return ColumnRemoved{c.table, c.column}; },
            [](const ColumnRemoved& c) -> DiffChange { return ColumnAdded{c.table, c.column}; },
            [](const ColumnAltered& c) -> DiffChange {
                ColumnAltered r = c;
                std::swap(r.old_type, r.new_type);
                std::swap(r.old_nullable, r.new_nullable);
                std::swap(r.old_default, r.new_default);
                return r;
            },
            [](const ColumnRenamed& c) -> DiffChange {
                return ColumnRenamed{c.table, c.new_column, c.old_column, c.confidence};
            },
            [](const IndexAdded& c) -> DiffChange { return IndexRemoved{c.table, c.columns, c.name, c.unique}; },
            [](const IndexRemoved& c) -> DiffChange { return IndexAdded{c.table, c.columns, c.name, c.unique}; },
            [](const EnumAdded& c) -> DiffChange { return EnumRemoved{c.name}; },
            [](const EnumRemoved& c) -> DiffChange { return EnumAdded{c.name}; },
            [](const EnumAltered& c) -> DiffChange {
                return EnumAltered{c.name, c.removed_values, c.added_values};
            },
        }, *it));
    }
    return out;
}

std::string change_type(const DiffChange& change) {
    static const char* names[] = {
        "table_added", "table_removed",
        "column_added", "column_removed", "column_altered", "column_renamed",
        "index_added", "index_removed",
        "enum_added", "enum_removed", "enum_altered",
    };
    return names[change.index()];
}

bool is_destructive(const DiffChange& change) {
    return std::holds_alternative<TableRemoved>(change) || std::holds_alternative<ColumnRemoved>(change);
}

} // namespace tabula
