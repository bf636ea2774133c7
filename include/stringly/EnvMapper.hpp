/**
 * @file EnvMapper.hpp
 * @brief Environment variable collection and mapping
 *
 * Maps PREFIX_SECTION_FIELD=value variables onto dotted keys
 * ("section.field") and applies them to a typed target:
 * 1. Prefix filtering (case-insensitive, PREFIX_ form)
 * 2. Underscore transformation
 * 3. Text parsing via parse_value()
 */

#ifndef STRINGLY_ENVMAPPER_HPP
#define STRINGLY_ENVMAPPER_HPP

#include "stringly/Document.hpp"
#include "stringly/Util.hpp"

#include <string>
#include <utility>
#include <vector>

namespace stringly {

/**
 * @brief Transform an environment variable name into a dotted key.
 *
 * 1. Convert to lowercase
 * 2. Replace `__` (double underscore) with a temporary marker
 * 3. Replace `_` (single underscore) with `.`
 * 4. Replace the marker back to `_`
 *
 * Examples:
 *   - DATABASE_HOST -> database.host
 *   - INNER_KEY__VALUE__PAIR_KEY -> inner.key_value_pair.key
 *
 * @param name The variable name after prefix removal
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Strip prefix from environment variable name.
 *
 * Matching is case-insensitive. Trailing underscores on the prefix are
 * ignored, so "APP" and "APP_" both strip "APP_" from "APP_INNER_Y".
 *
 * @return The name without prefix, or empty string if no match
 */
std::string strip_prefix(const std::string& var_name, const std::string& prefix);

/**
 * @brief Collect environment variables named PREFIX_*.
 *
 * @param prefix Non-empty prefix
 * @return (name, value) pairs with the original full names, sorted by name
 * @throws Error if prefix is empty
 */
std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix);

/**
 * @brief Turn the PREFIX_* environment into ordered assignments.
 *
 * @throws Error if prefix is empty
 */
Overrides env_overrides(const std::string& prefix);

/**
 * @brief Apply PREFIX_* environment variables to target.
 *
 * All-or-nothing like apply_overrides(). A variable naming no field
 * fails with UnknownField.
 *
 * Example:
 * ```cpp
 * // APP_INNER_Y=-7
 * apply_env(outer, "APP");   // outer.inner.y == -7
 * ```
 */
template <typename T>
void apply_env(T& target, const std::string& prefix) {
    apply_overrides(target, env_overrides(prefix));
}

} // namespace stringly

#endif // STRINGLY_ENVMAPPER_HPP
