/**
 * @file DotPath.cpp
 * @brief Implementation of dotted-key utilities
 */

#include "stringly/DotPath.hpp"
#include <sstream>

namespace stringly {

Path split_dot_path(const std::string& key) {
    Path segments;
    std::string current;

    for (char c : key) {
        if (c == '.') {
            segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }

    // Add final segment
    segments.push_back(current);

    return segments;
}

std::string join_dot_path(PathView segments) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : segments) {
        if (!first) oss << '.';
        oss << seg;
        first = false;
    }
    return oss.str();
}

std::string join_dot_path(const Path& segments) {
    return join_dot_path(PathView(segments));
}

} // namespace stringly
