/**
 * @file Accessor.hpp
 * @brief Get/set by path contract and its primitive terminal cases
 *
 * Every type reachable by a path provides a specialization of
 * Accessor<T> with these static members:
 *
 * - `Value get(const T&, PathView)`: value reachable by consuming the
 *   whole path. Read-only.
 * - `void set(T&, PathView, Value)`: replaces the reachable leaf. The
 *   only mutation is the final leaf assignment, so a failure part way
 *   down leaves the target untouched.
 * - `std::string type_name()`: primitive type tag, or the aggregate's
 *   declared name.
 * - `void flatten(const T&, const std::string& prefix, FlatEntries&)`:
 *   appends every leaf below T as (dotted key, value).
 *
 * int64_t, double and std::string are specialized here. Aggregates get
 * their specialization from a Reflect<T> table (see Reflect.hpp).
 */

#ifndef STRINGLY_ACCESSOR_HPP
#define STRINGLY_ACCESSOR_HPP

#include "stringly/DotPath.hpp"
#include "stringly/Errors.hpp"
#include "stringly/Value.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace stringly {

/**
 * @brief Leaves below a value, as (dotted key, value) in declaration order
 */
using FlatEntries = std::vector<std::pair<std::string, Value>>;

/**
 * @brief Accessor capability
 *
 * Left undefined: a type with neither a primitive specialization nor a
 * Reflect<T> table cannot be used with the protocol.
 */
template <typename T, typename Enable = void>
struct Accessor;

namespace detail {

/**
 * @brief Terminal case shared by all primitive leaves
 *
 * @tparam T Native type stored in the leaf; must be a Value alternative
 * @tparam Tag Type tag of T
 */
template <typename T, const char* const& Tag>
struct PrimitiveAccessor {
    static std::string type_name() {
        return Tag;
    }

    static Value get(const T& self, PathView path) {
        if (!path.empty()) {
            throw TooManyKeys(path.size());
        }
        return Value(self);
    }

    static void set(T& self, PathView path, Value value) {
        if (!path.empty()) {
            throw TooManyKeys(path.size());
        }
        T* incoming = value.get_if<T>();
        if (incoming == nullptr) {
            throw TypeError(Tag, value.type_name());
        }
        self = std::move(*incoming);
    }

    static void flatten(const T& self, const std::string& prefix, FlatEntries& out) {
        out.emplace_back(prefix, Value(self));
    }
};

} // namespace detail

template <>
struct Accessor<std::int64_t> : detail::PrimitiveAccessor<std::int64_t, INTEGER_TYPE> {};

template <>
struct Accessor<double> : detail::PrimitiveAccessor<double, DOUBLE_TYPE> {};

template <>
struct Accessor<std::string> : detail::PrimitiveAccessor<std::string, STRING_TYPE> {};

// ============================================================================
// Entry points
// ============================================================================

/**
 * @brief Read the value at a pre-split path
 *
 * @param target Root to read from
 * @param path Segments to consume; empty addresses target itself
 * @return The leaf value
 * @throws TooManyKeys if the path continues past a leaf
 * @throws UnknownField if a segment names no field of its aggregate
 * @throws CantSerialize if the path ends at an aggregate
 */
template <typename T>
Value get_value(const T& target, const Path& path) {
    return Accessor<T>::get(target, PathView(path));
}

/**
 * @brief Replace the leaf at a pre-split path
 *
 * @param target Root to modify
 * @param path Segments to consume
 * @param value New value; its type tag must match the leaf's
 * @throws TooManyKeys if the path continues past a leaf
 * @throws UnknownField if a segment names no field of its aggregate
 * @throws TypeError if the value kind differs from the destination
 */
template <typename T>
void set_value(T& target, const Path& path, Value value) {
    Accessor<T>::set(target, PathView(path), std::move(value));
}

/**
 * @brief Read the value at a dotted key ("inner.y")
 */
template <typename T>
Value get(const T& target, const std::string& key) {
    return get_value(target, split_dot_path(key));
}

/**
 * @brief Replace the leaf at a dotted key ("inner.y")
 */
template <typename T>
void set(T& target, const std::string& key, Value value) {
    set_value(target, split_dot_path(key), std::move(value));
}

/**
 * @brief Static type name of T: the primitive tag or the aggregate name
 */
template <typename T>
std::string type_name() {
    return Accessor<T>::type_name();
}

template <typename T>
std::string type_name(const T&) {
    return Accessor<T>::type_name();
}

/**
 * @brief Read a dotted key, returning fallback on any access error
 */
template <typename T>
Value get_or(const T& target, const std::string& key, Value fallback) {
    try {
        return get(target, key);
    } catch (const AccessError&) {
        return fallback;
    }
}

/**
 * @brief Check whether a dotted key addresses a leaf or an aggregate
 *
 * @return true if the key resolves, false if a segment is unknown or
 *         the key continues past a leaf
 */
template <typename T>
bool contains(const T& target, const std::string& key) {
    try {
        (void)get(target, key);
        return true;
    } catch (const CantSerialize&) {
        // Resolved to an aggregate
        return true;
    } catch (const UnknownField&) {
        return false;
    } catch (const TooManyKeys&) {
        return false;
    }
}

/**
 * @brief Enumerate every leaf below target
 *
 * Example, for Outer{inner: Inner{x: 3.14, y: 42}}:
 * ```
 * [("inner.x", 3.14), ("inner.y", 42)]
 * ```
 * A primitive root yields a single entry with an empty key.
 */
template <typename T>
FlatEntries flatten(const T& target) {
    FlatEntries out;
    Accessor<T>::flatten(target, std::string(), out);
    return out;
}

} // namespace stringly

#endif // STRINGLY_ACCESSOR_HPP
