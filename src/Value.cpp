/**
 * @file Value.cpp
 * @brief Implementation of the dynamic Value
 */

#include "stringly/Value.hpp"
#include "stringly/Errors.hpp"

#include <limits>
#include <sstream>

namespace stringly {

namespace {

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // anonymous namespace

const char* Value::type_name() const noexcept {
    return std::visit(overloaded{
        [](std::int64_t) { return INTEGER_TYPE; },
        [](double) { return DOUBLE_TYPE; },
        [](const std::string&) { return STRING_TYPE; },
    }, data_);
}

std::int64_t Value::as_integer() const {
    if (const auto* v = std::get_if<std::int64_t>(&data_)) {
        return *v;
    }
    throw TypeError(INTEGER_TYPE, type_name());
}

double Value::as_double() const {
    if (const auto* v = std::get_if<double>(&data_)) {
        return *v;
    }
    throw TypeError(DOUBLE_TYPE, type_name());
}

const std::string& Value::as_string() const {
    if (const auto* v = std::get_if<std::string>(&data_)) {
        return *v;
    }
    throw TypeError(STRING_TYPE, type_name());
}

std::string Value::to_string() const {
    // JSON rendering keeps doubles distinguishable from integers ("2.0").
    return nlohmann::json(*this).dump();
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.to_string();
}

void to_json(nlohmann::json& j, const Value& value) {
    std::visit(overloaded{
        [&j](std::int64_t v) { j = v; },
        [&j](double v) { j = v; },
        [&j](const std::string& v) { j = v; },
    }, value.storage());
}

void from_json(const nlohmann::json& j, Value& value) {
    if (j.is_number_unsigned()) {
        const auto u = j.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw ParseError(j.dump(), "integer out of range for int64");
        }
        value = static_cast<std::int64_t>(u);
    } else if (j.is_number_integer()) {
        value = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        value = j.get<double>();
    } else if (j.is_string()) {
        value = j.get<std::string>();
    } else {
        throw ParseError(j.dump(), std::string("unsupported JSON type '") + j.type_name() + "'");
    }
}

Value value_from_json(const nlohmann::json& j) {
    Value value = std::int64_t{0};
    from_json(j, value);
    return value;
}

} // namespace stringly
