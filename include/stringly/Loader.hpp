/**
 * @file Loader.hpp
 * @brief Document file loading and writing
 *
 * Reads and writes the nested documents that populate or capture an
 * aggregate:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * The format is chosen by file extension (.json / .toml, case-insensitive).
 */

#ifndef STRINGLY_LOADER_HPP
#define STRINGLY_LOADER_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace stringly {

/**
 * @brief Load a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed document
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
nlohmann::json load_json_file(const std::string& path);

/**
 * @brief Load a TOML file.
 *
 * Tables map to nested objects. Dates and times become strings.
 *
 * @param path Path to the TOML file
 * @return Parsed document
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
nlohmann::json load_toml_file(const std::string& path);

/**
 * @brief Load a document, detecting the format by extension.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if file has syntax errors
 * @throws Error if extension is not .json or .toml
 */
nlohmann::json load_document(const std::string& path);

/**
 * @brief Write a document, choosing the format by extension.
 *
 * JSON is written with 2-space indentation. TOML requires an object
 * at the root.
 *
 * @throws Error if the file cannot be opened, the extension is not
 *         supported, or a TOML document has a non-object root
 */
void write_document(const std::string& path, const nlohmann::json& doc);

/**
 * @brief Render a document as TOML text
 * @throws Error if doc is not an object
 */
std::string to_toml_string(const nlohmann::json& doc);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace stringly

#endif // STRINGLY_LOADER_HPP
