#ifndef STRINGLY_UTIL_HPP
#define STRINGLY_UTIL_HPP

#include "stringly/Value.hpp"
#include <string>
#include <utility>
#include <vector>

namespace stringly {

// Ordered (dotted key, value) assignments, applied first to last.
using Overrides = std::vector<std::pair<std::string, Value>>;

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);

// Parse an --overrides string: "k1:v1, k2:v2, ..."
// Each value goes through parse_value(). Keys and values are trimmed.
// Throws ParseError for an entry without ':' or with an empty key.
Overrides parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

} // namespace stringly

#endif // STRINGLY_UTIL_HPP
