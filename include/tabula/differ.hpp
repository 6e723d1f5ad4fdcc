#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "tabula/snapshot.hpp"

namespace tabula {

struct TableAdded    { std::string table; };
struct TableRemoved  { std::string table; };
struct ColumnAdded   { std::string table; std::string column; };
struct ColumnRemoved { std::string table; std::string column; };

// Only the sub-fields that changed are set.
struct ColumnAltered {
    std::string table;
    std::string column;
    std::optional<std::string> old_type;
    std::optional<std::string> new_type;
    std::optional<bool> old_nullable;
    std::optional<bool> new_nullable;
    bool default_changed = false;
    std::optional<std::string> old_default;
    std::optional<std::string> new_default;
};

struct ColumnRenamed {
    std::string table;
    std::string old_column;
    std::string new_column;
    double confidence = 1.0;
};

struct IndexAdded {
    std::string table;
    std::vector<std::string> columns;
    std::optional<std::string> name;
    bool unique = false;
};

struct IndexRemoved {
    std::string table;
    std::vector<std::string> columns;
    std::optional<std::string> name;
    bool unique = false;
};

struct EnumAdded   { std::string name; };
struct EnumRemoved { std::string name; };
struct EnumAltered {
    std::string name;
    std::vector<std::string> added_values;
    std::vector<std::string> removed_values;
};

using DiffChange = std::variant<TableAdded, TableRemoved,
                                ColumnAdded, ColumnRemoved, ColumnAltered, ColumnRenamed,
                                IndexAdded, IndexRemoved,
                                EnumAdded, EnumRemoved, EnumAltered>;

using DiffResult = std::vector<DiffChange>;

// Rename detection threshold on the normalized similarity score.
inline constexpr double RENAME_THRESHOLD = 0.7;

// Type match weighs 3; nullable, primary, unique weigh 1 each. Normalized to [0,1].
double column_similarity(const ColumnSnapshot& a, const ColumnSnapshot& b);

/**
 * @brief Ordered list of structural changes turning @p before into @p after.
 *
 * Order: tables added, tables removed; then per shared table renames, remaining column
 * adds, remaining column removes, alterations, index adds, index removes; then enums
 * added, removed, altered.
 *
 * Rename pairing is greedy per removed column in declared order. Only a strictly higher
 * score replaces the current candidate, so ties go to the first added column in
 * declared order.
 */
DiffResult compute_diff(const SchemaSnapshot& before, const SchemaSnapshot& after);

// Each change with its direction swapped, in reverse order.
DiffResult reverse_changes(const DiffResult& changes);

// table_added, column_renamed, ...
std::string change_type(const DiffChange& change);

// Table or column removal.
bool is_destructive(const DiffChange& change);

} // namespace tabula
