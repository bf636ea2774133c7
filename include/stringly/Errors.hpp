/**
 * @file Errors.hpp
 * @brief Exception types for stringly
 *
 * Error taxonomy:
 * - Error: Base class
 * - AccessError: Base of the four path-access failures
 *   - TypeError: Leaf assigned a Value of another kind
 *   - TooManyKeys: Path continues past a leaf
 *   - UnknownField: Segment names no declared field
 *   - CantSerialize: Aggregate read with an empty path
 * - FileNotFoundError: Document file not found
 * - DocumentParseError: JSON/TOML syntax errors
 * - ParseError: Text or JSON that cannot become a Value
 *
 * Access errors are thrown at the level that detects them and pass
 * through every enclosing aggregate untouched.
 */

#ifndef STRINGLY_ERRORS_HPP
#define STRINGLY_ERRORS_HPP

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stringly {

/**
 * @brief Base class for all stringly exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Discriminator for the access error family
 */
enum class ErrorKind {
    TypeError,
    TooManyKeys,
    UnknownField,
    CantSerialize
};

/**
 * @brief Base class for errors raised while resolving a path
 */
class AccessError : public Error {
public:
    AccessError(ErrorKind kind, const std::string& message)
        : Error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const noexcept {
        return kind_;
    }

private:
    ErrorKind kind_;
};

/**
 * @brief Value kind does not match the destination
 *
 * Raised when a leaf is assigned a Value with a different type tag, or
 * when an aggregate is assigned a scalar Value directly.
 */
class TypeError : public AccessError {
public:
    /**
     * @brief Construct with expected and found type names
     * @param expected Type name of the destination (e.g., "integer")
     * @param found Type tag of the incoming value (e.g., "double")
     */
    TypeError(std::string expected, std::string found)
        : AccessError(ErrorKind::TypeError,
                      "Type error: expected " + expected + ", found " + found)
        , expected_(std::move(expected))
        , found_(std::move(found))
    {}

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& found() const noexcept {
        return found_;
    }

private:
    std::string expected_;
    std::string found_;
};

/**
 * @brief Path continues past a leaf
 */
class TooManyKeys : public AccessError {
public:
    /**
     * @param elements_remaining Unconsumed segments, counting the one
     *        that reached the leaf
     */
    explicit TooManyKeys(std::size_t elements_remaining)
        : AccessError(ErrorKind::TooManyKeys,
                      "Too many keys: " + std::to_string(elements_remaining) +
                      " segment(s) left after reaching a leaf")
        , elements_remaining_(elements_remaining)
    {}

    std::size_t elements_remaining() const noexcept {
        return elements_remaining_;
    }

private:
    std::size_t elements_remaining_;
};

/**
 * @brief Path segment names no declared field of the aggregate
 *
 * Carries the aggregate's complete field list so callers can present
 * alternatives.
 */
class UnknownField : public AccessError {
public:
    /**
     * @param field The segment that failed to match
     * @param valid_fields All declared field names, in declaration order
     */
    UnknownField(std::string field, std::vector<std::string> valid_fields)
        : AccessError(ErrorKind::UnknownField, format_message(field, valid_fields))
        , field_(std::move(field))
        , valid_fields_(std::move(valid_fields))
    {}

    const std::string& field() const noexcept {
        return field_;
    }

    const std::vector<std::string>& valid_fields() const noexcept {
        return valid_fields_;
    }

private:
    std::string field_;
    std::vector<std::string> valid_fields_;

    static std::string format_message(const std::string& field,
                                      const std::vector<std::string>& valid) {
        std::ostringstream oss;
        oss << "Unknown field '" << field << "', expected one of [";
        for (std::size_t i = 0; i < valid.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << valid[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Aggregate requested as a Value
 *
 * Value has no structured alternative, so reading an aggregate itself
 * (empty path) is not representable.
 */
class CantSerialize : public AccessError {
public:
    explicit CantSerialize(std::string type_name)
        : AccessError(ErrorKind::CantSerialize,
                      "Cannot represent aggregate '" + type_name + "' as a value")
        , type_name_(std::move(type_name))
    {}

    const std::string& type_name() const noexcept {
        return type_name_;
    }

private:
    std::string type_name_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public Error {
public:
    explicit FileNotFoundError(std::string path)
        : Error("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax)
 */
class DocumentParseError : public Error {
public:
    /**
     * @param file Path to the file with the parse error
     * @param details Error message from the parser
     */
    DocumentParseError(std::string file, std::string details)
        : Error("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Input that cannot be turned into a Value or override list
 */
class ParseError : public Error {
public:
    ParseError(std::string input, std::string details)
        : Error("Cannot parse '" + input + "': " + details)
        , input_(std::move(input))
        , details_(std::move(details))
    {}

    const std::string& input() const noexcept {
        return input_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string input_;
    std::string details_;
};

} // namespace stringly

#endif // STRINGLY_ERRORS_HPP
