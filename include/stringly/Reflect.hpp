/**
 * @file Reflect.hpp
 * @brief Reflection tables and the aggregate delegation case
 *
 * An aggregate opts into the accessor protocol by specializing
 * Reflect<T> with its declared name and its ordered field list:
 *
 * ```cpp
 * struct Inner {
 *     double x = 0.0;
 *     std::int64_t y = 0;
 * };
 *
 * namespace stringly {
 * template <>
 * struct Reflect<Inner> {
 *     static constexpr const char* name = "Inner";
 *     static constexpr auto fields() {
 *         return std::make_tuple(field("x", &Inner::x),
 *                                field("y", &Inner::y));
 *     }
 * };
 * } // namespace stringly
 * ```
 *
 * The table is expanded at compile time into one comparison per field.
 * Each field's type must itself have an Accessor (a primitive or another
 * reflected aggregate), which is what makes nesting depth free.
 */

#ifndef STRINGLY_REFLECT_HPP
#define STRINGLY_REFLECT_HPP

#include "stringly/Accessor.hpp"

#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace stringly {

/**
 * @brief One declared field: its name and the member it designates
 */
template <typename Owner, typename Member>
struct FieldDescriptor {
    using owner_type = Owner;
    using member_type = Member;

    const char* name;
    Member Owner::*member;
};

/**
 * @brief Build a FieldDescriptor, deducing owner and member types
 */
template <typename Owner, typename Member>
constexpr FieldDescriptor<Owner, Member> field(const char* name, Member Owner::*member) noexcept {
    return FieldDescriptor<Owner, Member>{name, member};
}

/**
 * @brief Reflection table; specialize for each aggregate
 *
 * The primary template is empty, which is how is_reflected tells
 * aggregates from everything else.
 */
template <typename T>
struct Reflect {};

/**
 * @brief True if Reflect<T> is specialized with a name and fields()
 */
template <typename T, typename = void>
struct is_reflected : std::false_type {};

template <typename T>
struct is_reflected<T, std::void_t<decltype(Reflect<T>::name), decltype(Reflect<T>::fields())>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_reflected_v = is_reflected<T>::value;

namespace detail {

/**
 * @brief Recursive case: consume one segment and delegate to the field
 */
template <typename T>
struct AggregateAccessor {
    using Fields = decltype(Reflect<T>::fields());

    static_assert(std::tuple_size<Fields>::value > 0,
                  "an aggregate must declare at least one field");

    static std::string type_name() {
        return Reflect<T>::name;
    }

    static const std::vector<std::string>& field_names() {
        static const std::vector<std::string> names = std::apply(
            [](const auto&... f) { return std::vector<std::string>{f.name...}; },
            Reflect<T>::fields());
        return names;
    }

    static Value get(const T& self, PathView path) {
        if (path.empty()) {
            throw CantSerialize(type_name());
        }

        std::optional<Value> result;
        const bool matched = dispatch(path.front(), [&](const auto& f) {
            using Member = typename std::decay_t<decltype(f)>::member_type;
            result = Accessor<Member>::get(self.*(f.member), path.tail());
        });
        if (!matched) {
            throw UnknownField(path.front(), field_names());
        }
        return std::move(*result);
    }

    static void set(T& self, PathView path, Value value) {
        if (path.empty()) {
            // A scalar can never replace a whole record
            throw TypeError(type_name(), value.type_name());
        }

        const bool matched = dispatch(path.front(), [&](const auto& f) {
            using Member = typename std::decay_t<decltype(f)>::member_type;
            Accessor<Member>::set(self.*(f.member), path.tail(), std::move(value));
        });
        if (!matched) {
            throw UnknownField(path.front(), field_names());
        }
    }

    static void flatten(const T& self, const std::string& prefix, FlatEntries& out) {
        std::apply([&](const auto&... f) {
            (flatten_field(self, prefix, f, out), ...);
        }, Reflect<T>::fields());
    }

private:
    /**
     * @brief Invoke fn on the first field named key, in declaration order
     * @return false if no field is named key
     */
    template <typename Fn>
    static bool dispatch(const std::string& key, Fn&& fn) {
        return std::apply([&](const auto&... f) {
            return ((key == f.name ? (fn(f), true) : false) || ...);
        }, Reflect<T>::fields());
    }

    template <typename Field>
    static void flatten_field(const T& self, const std::string& prefix, const Field& f,
                              FlatEntries& out) {
        using Member = typename Field::member_type;
        Accessor<Member>::flatten(self.*(f.member),
                                  prefix.empty() ? std::string(f.name) : prefix + "." + f.name,
                                  out);
    }
};

} // namespace detail

template <typename T>
struct Accessor<T, std::enable_if_t<is_reflected_v<T>>> : detail::AggregateAccessor<T> {};

/**
 * @brief Declared field names of an aggregate, in declaration order
 */
template <typename T>
const std::vector<std::string>& field_names() {
    static_assert(is_reflected_v<T>, "field_names() requires a Reflect<T> specialization");
    return Accessor<T>::field_names();
}

} // namespace stringly

#endif // STRINGLY_REFLECT_HPP
