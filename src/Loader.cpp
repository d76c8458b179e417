/**
 * @file Loader.cpp
 * @brief File loading and serialization of configuration layers
 */

#include "strata/Loader.hpp"
#include "strata/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace strata {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
std::string stream_to_string(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

/**
 * @brief Convert toml++ node to a Value.
 */
Value toml_node_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(stream_to_string(node.as_date()->get()));

        case toml::node_type::time:
            return Value(stream_to_string(node.as_time()->get()));

        case toml::node_type::date_time:
            return Value(stream_to_string(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

// ---- Value -> TOML (value-based construction) ------------------------------

toml::array make_toml_array(const Value& arr);
toml::table make_toml_table(const Value& obj);

template <typename Insert>
void insert_value(const Value& v, Insert&& insert) {
    if (v.is_string()) {
        insert(v.get<std::string>());
    } else if (v.is_boolean()) {
        insert(v.get<bool>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            insert(static_cast<std::int64_t>(u));
        } else {
            // Oversize for TOML int; fall back to double
            insert(static_cast<double>(u));
        }
    } else if (v.is_number_integer()) {
        insert(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        insert(v.get<double>());
    } else if (v.is_object()) {
        insert(make_toml_table(v));
    } else if (v.is_array()) {
        insert(make_toml_array(v));
    } else {
        // No TOML null
        insert(std::string{});
    }
}

toml::array make_toml_array(const Value& arr) {
    toml::array out;
    for (const auto& elem : arr) {
        insert_value(elem, [&](auto&& x) {
            out.push_back(std::forward<decltype(x)>(x));
        });
    }
    return out;
}

toml::table make_toml_table(const Value& obj) {
    toml::table tbl;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const auto& key = it.key();
        insert_value(it.value(), [&](auto&& x) {
            tbl.insert(key, std::forward<decltype(x)>(x));
        });
    }
    return tbl;
}

} // anonymous namespace

// ============================================================================
// Loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string content = read_file(path);

    try {
        return Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(path, 0, 0, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_node_to_value(table);
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_config_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw UnsupportedFormatError(path, ext);
}

// ============================================================================
// Serialization
// ============================================================================

std::string to_json_string(const Value& value, int indent) {
    return value.dump(indent);
}

std::string to_toml_string(const Value& value) {
    toml::table root;
    if (value.is_object()) {
        root = make_toml_table(value);
    } else {
        insert_value(value, [&](auto&& x) {
            root.insert("value", std::forward<decltype(x)>(x));
        });
    }
    return stream_to_string(root);
}

void write_config_file(const std::string& path, const Value& value) {
    std::string ext = get_file_extension(path);
    std::string text;
    if (ext == ".json") {
        text = to_json_string(value) + "\n";
    } else if (ext == ".toml") {
        text = to_toml_string(value);
    } else {
        throw UnsupportedFormatError(path, ext);
    }

    std::ofstream ofs(path);
    if (!ofs) {
        throw std::runtime_error("Failed to open for write: " + path);
    }
    ofs << text;
}

} // namespace strata
