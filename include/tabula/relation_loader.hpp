#pragma once
#include <string>
#include <vector>
#include "tabula/executor.hpp"
#include "tabula/jsonhlp.hpp"
#include "tabula/table.hpp"

namespace tabula {

// Includes resolve two levels below the primary query.
inline constexpr int MAX_INCLUDE_DEPTH = 2;

struct IncludeEntry;

struct IncludeOption {
    std::vector<std::string> select;   // declared target columns; empty selects every visible column
    std::vector<IncludeEntry> include; // nested relations of the target
};

struct IncludeEntry {
    std::string relation;
    IncludeOption option;
};

using IncludeSpec = std::vector<IncludeEntry>;

/**
 * {"author": true, "comments": {"select": {"id": true, "body": true}, "include": {...}}}
 * "select" may also be an array of names.
 */
IncludeSpec parse_include(const jval& obj);

// Levels below the primary query that @p include reaches; 0 when empty.
int include_depth(const IncludeSpec& include);

/**
 * @brief Attaches related rows to every row of @p rows, in place.
 *
 * For each include entry, one batched query per relation per depth level:
 * 1. one: distinct foreign-key values -> SELECT target WHERE pk IN (...); attaches the match or null
 * 2. many: distinct parent keys -> SELECT target WHERE fk IN (...); attaches an array, never null
 * 3. many-to-many: SELECT thisKey, thatKey FROM join WHERE thisKey IN (...),
 *    then SELECT target WHERE pk IN (distinct thatKeys); attaches an array in join row order
 * 4. nested includes run once over the whole fetched level before the rows are attached
 *
 * @param rows array of camelCase row objects owned by @p allocator
 * @param table declared name of the table @p rows come from
 * @param registry read-only table and relation definitions
 * @throws QueryError when @p include nests deeper than MAX_INCLUDE_DEPTH, before any query runs
 */
void load_relations(const Executor& executor, jval& rows, jdaloc& allocator,
                    const std::string& table, const IncludeSpec& include,
                    const Registry& registry, int depth = 0);

} // namespace tabula
