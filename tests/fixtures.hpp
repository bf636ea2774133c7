/**
 * @file fixtures.hpp
 * @brief Aggregates shared by the test suites
 */

#ifndef STRINGLY_TESTS_FIXTURES_HPP
#define STRINGLY_TESTS_FIXTURES_HPP

#include "stringly/Reflect.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>

namespace fixtures {

/**
 * @brief Run fn and return the exception of type E it throws
 *
 * Lets tests inspect error payloads. Throws std::logic_error (reported
 * by GoogleTest as a failure) if fn completes normally.
 */
template <typename E, typename Fn>
E catch_error(Fn&& fn) {
    try {
        fn();
    } catch (const E& e) {
        return e;
    }
    throw std::logic_error("expected exception was not thrown");
}

struct KeyValue {
    std::string key;
    std::string value;
};

struct Inner {
    double x = 0.0;
    std::int64_t y = 0;
    KeyValue key_value_pair;
};

struct Outer {
    Inner inner;
};

inline Outer make_outer() {
    Outer outer;
    outer.inner.x = 3.14;
    outer.inner.y = 42;
    outer.inner.key_value_pair.key = "Key";
    outer.inner.key_value_pair.value = "Value";
    return outer;
}

} // namespace fixtures

namespace stringly {

template <>
struct Reflect<fixtures::KeyValue> {
    static constexpr const char* name = "KeyValue";
    static constexpr auto fields() {
        return std::make_tuple(field("key", &fixtures::KeyValue::key),
                               field("value", &fixtures::KeyValue::value));
    }
};

template <>
struct Reflect<fixtures::Inner> {
    static constexpr const char* name = "Inner";
    static constexpr auto fields() {
        return std::make_tuple(field("x", &fixtures::Inner::x),
                               field("y", &fixtures::Inner::y),
                               field("key_value_pair", &fixtures::Inner::key_value_pair));
    }
};

template <>
struct Reflect<fixtures::Outer> {
    static constexpr const char* name = "Outer";
    static constexpr auto fields() {
        return std::make_tuple(field("inner", &fixtures::Outer::inner));
    }
};

} // namespace stringly

#endif // STRINGLY_TESTS_FIXTURES_HPP
