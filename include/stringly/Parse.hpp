/**
 * @file Parse.hpp
 * @brief String-to-Value parsing
 *
 * Converts text from the command line, environment variables and
 * override lists into a Value.
 *
 * Parsing order (first match wins):
 * - Integer (matches ^-?[0-9]+$ and fits in int64)
 * - Double (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - Quoted String ("...", JSON escapes honored)
 * - Raw String (fallback)
 */

#ifndef STRINGLY_PARSE_HPP
#define STRINGLY_PARSE_HPP

#include "stringly/Value.hpp"
#include <string>

namespace stringly {

/**
 * @brief Parse text to the narrowest matching Value
 *
 * @param str Input string to parse
 * @return Parsed Value
 *
 * Examples:
 * ```cpp
 * parse_value("42")         // → 42 (integer)
 * parse_value("-17")        // → -17 (integer)
 * parse_value("3.14")       // → 3.14 (double)
 * parse_value("-2.5e10")    // → -2.5e10 (double)
 * parse_value("\"42\"")     // → "42" (string, unquoted)
 * parse_value("hello")      // → "hello" (string)
 * parse_value("true")       // → "true" (string; no boolean kind)
 * parse_value("")           // → "" (empty string)
 * ```
 */
Value parse_value(const std::string& str);

} // namespace stringly

#endif // STRINGLY_PARSE_HPP
