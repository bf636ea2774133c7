/**
 * @file Parse.cpp
 * @brief Implementation of text parsing
 */

#include "stringly/Parse.hpp"
#include <regex>
#include <stdexcept>

namespace stringly {

namespace {
    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& double_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return std::string();
    }

    // Integer
    if (std::regex_match(str, integer_pattern())) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<std::int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too wide for int64: fall through to raw string
        }
    }

    // Double
    if (std::regex_match(str, double_pattern())) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // Overflows double: fall through to raw string
        }
    }

    // Quoted String
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        try {
            nlohmann::json parsed = nlohmann::json::parse(str);
            if (parsed.is_string()) {
                return parsed.get<std::string>();
            }
        } catch (const nlohmann::json::parse_error&) {
            // Bad escape sequence: keep the text as written
        }
    }

    // Raw String
    return str;
}

} // namespace stringly
