/**
 * @file Value.hpp
 * @brief Dynamic value crossing the static/dynamic boundary
 *
 * A closed tagged union over the primitive kinds a leaf field may hold:
 * - Integer (int64_t)
 * - Double (double)
 * - String (std::string, UTF-8)
 *
 * Values are created at call boundaries (read out of a field by get, or
 * moved into a field by set) and are never retained by the accessor
 * protocol itself.
 */

#ifndef STRINGLY_VALUE_HPP
#define STRINGLY_VALUE_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace stringly {

/// Type tag of an integer leaf / Value
inline constexpr const char* INTEGER_TYPE = "integer";
/// Type tag of a double leaf / Value
inline constexpr const char* DOUBLE_TYPE = "double";
/// Type tag of a string leaf / Value
inline constexpr const char* STRING_TYPE = "string";

/**
 * @brief Dynamically typed primitive value
 *
 * Exactly one alternative is active at a time. The tag returned by
 * type_name() is derived from the active alternative and is stable
 * across copies and moves.
 *
 * Conversions from every supported native primitive are implicit and
 * lossless:
 * ```cpp
 * Value a = 42;            // integer
 * Value b = 3.14;          // double
 * Value c = "text";        // string
 * ```
 */
class Value {
public:
    using Storage = std::variant<std::int64_t, double, std::string>;

    /**
     * @brief Construct an integer value from any signed integral type
     *
     * Unsigned types narrower than 64 bits are accepted too, since every
     * one of their values fits in int64_t. bool is excluded.
     */
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                          !std::is_same<T, bool>::value &&
                                          (std::is_signed<T>::value || sizeof(T) < sizeof(std::int64_t)),
                                      int>::type = 0>
    Value(T v) : data_(static_cast<std::int64_t>(v)) {}

    Value(bool) = delete;

    Value(double v) : data_(v) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(const char* v) : data_(std::string(v)) {}

    /**
     * @brief Get the type tag of the active alternative
     * @return One of INTEGER_TYPE, DOUBLE_TYPE, STRING_TYPE
     */
    const char* type_name() const noexcept;

    bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
    bool is_double() const noexcept { return std::holds_alternative<double>(data_); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }

    /**
     * @brief Typed access to the active alternative
     * @throws TypeError if the active alternative is not the requested one
     */
    std::int64_t as_integer() const;
    double as_double() const;
    const std::string& as_string() const;

    /**
     * @brief Pointer to the stored T, or nullptr if another alternative is active
     */
    template <typename T>
    T* get_if() noexcept { return std::get_if<T>(&data_); }

    template <typename T>
    const T* get_if() const noexcept { return std::get_if<T>(&data_); }

    const Storage& storage() const noexcept { return data_; }

    /// Render for messages: integers and doubles as numbers, strings quoted.
    std::string to_string() const;

    friend bool operator==(const Value& a, const Value& b) { return a.data_ == b.data_; }
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    Storage data_;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

/**
 * @brief nlohmann::json serializer hook (ADL)
 */
void to_json(nlohmann::json& j, const Value& value);

/**
 * @brief nlohmann::json deserializer hook (ADL)
 *
 * Accepts integer, float and string JSON values.
 *
 * @throws ParseError for null, boolean, array, object, and unsigned
 *         integers above INT64_MAX
 */
void from_json(const nlohmann::json& j, Value& value);

/**
 * @brief Convert a JSON scalar into a Value
 * @throws ParseError as from_json()
 */
Value value_from_json(const nlohmann::json& j);

} // namespace stringly

#endif // STRINGLY_VALUE_HPP
