#pragma once
#include <map>
#include <string>

namespace tabula {

// camelCase name -> storage (snake_case) name, consulted before the algorithm in both directions.
using CasingOverrides = std::map<std::string, std::string>;

/**
 * camelCase -> snake_case.
 *   createdAt   -> created_at
 *   userID      -> user_id
 *   HTMLParser  -> html_parser
 *   _count      -> _count
 */
std::string camel_to_snake(const std::string& name, const CasingOverrides& overrides = {});

/**
 * snake_case -> camelCase. Leading underscores are kept.
 *   created_at  -> createdAt
 *   _count      -> _count
 */
std::string snake_to_camel(const std::string& name, const CasingOverrides& overrides = {});

} // namespace tabula
