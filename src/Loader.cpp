/**
 * @file Loader.cpp
 * @brief Document file loading implementation
 */

#include "stringly/Loader.hpp"
#include "stringly/Errors.hpp"
#include "stringly/Util.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace stringly {

using nlohmann::json;

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert toml++ node to nlohmann::json.
 */
json toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return json(node.as_string()->get());

        case toml::node_type::integer:
            return json(node.as_integer()->get());

        case toml::node_type::floating_point:
            return json(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return json(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return json(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return json(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return json(ss.str());
        }

        case toml::node_type::array: {
            json arr = json::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            json obj = json::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return json(nullptr);
    }
}

// ---- JSON -> TOML (value-based construction) ------------------------------

// Only the kinds a snapshot can hold are written: objects, integers,
// doubles and strings.
toml::table make_table_from_json(const json& o) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const std::string& key = it.key();
        const json& v = it.value();
        if (v.is_object()) {
            tbl.insert(key, make_table_from_json(v));
        } else if (v.is_string()) {
            tbl.insert(key, v.get<std::string>());
        } else if (v.is_number_unsigned()) {
            const auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw Error("Cannot write '" + key + "' to TOML: " + v.dump() + " exceeds int64 range");
            }
            tbl.insert(key, static_cast<std::int64_t>(u));
        } else if (v.is_number_integer()) {
            tbl.insert(key, v.get<std::int64_t>());
        } else if (v.is_number_float()) {
            tbl.insert(key, v.get<double>());
        } else {
            throw Error("Cannot write '" + key + "' to TOML: unsupported " + std::string(v.type_name()) + " value");
        }
    }
    return tbl;
}

} // anonymous namespace

// ============================================================================
// JSON File Loading
// ============================================================================

json load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string content = read_file(path);

    try {
        return json::parse(content);
    } catch (const json::parse_error& e) {
        throw DocumentParseError(path, e.what());
    }
}

// ============================================================================
// TOML File Loading
// ============================================================================

json load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw DocumentParseError(path, details.str());
    }

    return toml_value_to_json(table);
}

// ============================================================================
// Auto-detect Loading / Writing
// ============================================================================

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

json load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw Error("Unsupported document type: '" + ext + "' (expected .json or .toml)");
}

std::string to_toml_string(const json& doc) {
    if (!doc.is_object()) {
        throw Error(std::string("TOML documents need an object root, got ") + doc.type_name());
    }
    std::ostringstream oss;
    oss << make_table_from_json(doc);
    return oss.str();
}

void write_document(const std::string& path, const json& doc) {
    const std::string ext = get_file_extension(path);
    std::string text;
    if (ext == ".json") {
        text = doc.dump(2) + "\n";
    } else if (ext == ".toml") {
        text = to_toml_string(doc) + "\n";
    } else {
        throw Error("Unsupported document type: '" + ext + "' (expected .json or .toml)");
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw Error("Failed to open for write: " + path);
    }
    ofs << text;
}

} // namespace stringly
