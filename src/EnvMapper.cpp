/**
 * @file EnvMapper.cpp
 * @brief Environment variable mapping implementation
 */

#include "stringly/EnvMapper.hpp"
#include "stringly/Errors.hpp"
#include "stringly/Parse.hpp"

#include <algorithm>
#include <cctype>

namespace stringly {

namespace {

/**
 * @brief Check if string starts with prefix (case-insensitive).
 */
bool starts_with_icase(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), str.begin(),
                      [](char a, char b) {
                          return std::toupper(static_cast<unsigned char>(a)) ==
                                 std::toupper(static_cast<unsigned char>(b));
                      });
}

/**
 * @brief Replace all occurrences of a substring.
 */
std::string replace_all(const std::string& str,
                        const std::string& from,
                        const std::string& to) {
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

std::string normalize_prefix(const std::string& prefix) {
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    return normalized;
}

} // anonymous namespace

std::string transform_env_name(const std::string& name) {
    std::string result = to_lower(name);

    const std::string TEMP_MARKER = "\x1F_USCORE_\x1F";
    result = replace_all(result, "__", TEMP_MARKER);
    result = replace_all(result, "_", ".");
    result = replace_all(result, TEMP_MARKER, "_");

    return result;
}

std::string strip_prefix(const std::string& var_name, const std::string& prefix) {
    const std::string prefix_with_underscore = normalize_prefix(prefix) + "_";

    if (starts_with_icase(var_name, prefix_with_underscore)) {
        return var_name.substr(prefix_with_underscore.length());
    }

    return "";  // No match
}

std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix) {
    if (normalize_prefix(prefix).empty()) {
        throw Error("Environment prefix must not be empty");
    }

    std::vector<std::pair<std::string, std::string>> result;
    for (auto& [name, value] : enumerate_environment()) {
        if (!strip_prefix(name, prefix).empty()) {
            result.emplace_back(std::move(name), std::move(value));
        }
    }

    // environ order is unspecified; sort for deterministic application
    std::sort(result.begin(), result.end());
    return result;
}

Overrides env_overrides(const std::string& prefix) {
    Overrides out;
    for (const auto& [name, value] : collect_env_vars(prefix)) {
        out.emplace_back(transform_env_name(strip_prefix(name, prefix)), parse_value(value));
    }
    return out;
}

} // namespace stringly
