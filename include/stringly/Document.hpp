/**
 * @file Document.hpp
 * @brief Bridge between typed aggregates and nested JSON documents
 *
 * - snapshot(): capture every leaf of an aggregate as a nested object
 * - apply_document(): assign every leaf found in a nested object
 * - apply_overrides(): assign an ordered list of (dotted key, value)
 *
 * Bulk assignments are all-or-nothing: they run against a copy of the
 * target and commit only when every assignment succeeded.
 */

#ifndef STRINGLY_DOCUMENT_HPP
#define STRINGLY_DOCUMENT_HPP

#include "stringly/Accessor.hpp"
#include "stringly/Util.hpp"

#include <nlohmann/json.hpp>
#include <utility>

namespace stringly {

/**
 * @brief Flatten a nested document into (dotted key, value) leaves
 *
 * Objects are descended; every other node must be convertible to a
 * Value. A scalar root yields a single entry with an empty key.
 * Empty objects contribute nothing.
 *
 * Example:
 *   {"inner": {"x": 3.14, "y": 42}} -> [("inner.x", 3.14), ("inner.y", 42)]
 *
 * @throws ParseError for arrays, booleans, nulls and out-of-range integers
 */
Overrides flatten_document(const nlohmann::json& doc);

/**
 * @brief Build a nested document from (dotted key, value) leaves
 *
 * An entry with an empty key replaces the whole document.
 */
nlohmann::json unflatten(const FlatEntries& entries);

/**
 * @brief Capture every leaf of target as a nested JSON object
 *
 * Example, for Outer{inner: Inner{x: 3.14, y: 42}}:
 *   {"inner": {"x": 3.14, "y": 42}}
 */
template <typename T>
nlohmann::json snapshot(const T& target) {
    return unflatten(flatten(target));
}

/**
 * @brief Apply ordered (dotted key, value) assignments
 *
 * @throws AccessError from the first assignment that fails; target is
 *         then left exactly as it was
 */
template <typename T>
void apply_overrides(T& target, const Overrides& overrides) {
    T staged = target;
    for (const auto& [key, value] : overrides) {
        set(staged, key, value);
    }
    target = std::move(staged);
}

/**
 * @brief Assign every leaf found in a nested document
 *
 * Keys absent from the document keep their current value.
 *
 * @throws ParseError if doc holds nodes that are not Values
 * @throws AccessError if a key is unknown, too deep, or of the wrong kind
 */
template <typename T>
void apply_document(T& target, const nlohmann::json& doc) {
    apply_overrides(target, flatten_document(doc));
}

} // namespace stringly

#endif // STRINGLY_DOCUMENT_HPP
