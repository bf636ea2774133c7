/**
 * @file Document.cpp
 * @brief Flattening between nested documents and dotted leaves
 */

#include "stringly/Document.hpp"
#include "stringly/DotPath.hpp"
#include "stringly/Errors.hpp"

namespace stringly {

namespace {

void flatten_into(const nlohmann::json& node, const std::string& prefix, Overrides& out) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
            flatten_into(it.value(), key, out);
        }
        return;
    }

    try {
        out.emplace_back(prefix, value_from_json(node));
    } catch (const ParseError& e) {
        throw ParseError(prefix.empty() ? node.dump() : prefix, e.details());
    }
}

} // anonymous namespace

Overrides flatten_document(const nlohmann::json& doc) {
    Overrides out;
    flatten_into(doc, "", out);
    return out;
}

nlohmann::json unflatten(const FlatEntries& entries) {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [key, value] : entries) {
        // flatten() of a primitive root yields the empty key
        if (key.empty()) {
            doc = nlohmann::json(value);
            continue;
        }
        nlohmann::json* cur = &doc;
        for (const auto& seg : split_dot_path(key)) {
            cur = &(*cur)[seg];
        }
        *cur = nlohmann::json(value);
    }
    return doc;
}

} // namespace stringly
