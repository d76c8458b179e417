/**
 * @file Loader.hpp
 * @brief Reading and writing configuration layers
 *
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * Format is chosen by the lowercase file extension.
 */

#ifndef STRATA_LOADER_HPP
#define STRATA_LOADER_HPP

#include "strata/Value.hpp"
#include <string>

namespace strata {

// ============================================================================
// Loading
// ============================================================================

/**
 * @brief Load a configuration layer from a JSON file
 *
 * @param path Path to the JSON file
 * @return Parsed Value, object keys in file order
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a configuration layer from a TOML file
 *
 * Tables become objects, arrays become arrays, dates and times become
 * their TOML text.
 *
 * @param path Path to the TOML file
 * @return Parsed Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a configuration layer, detecting format by extension
 *
 * @param path Path ending in .json or .toml (case-insensitive)
 * @return Parsed Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if file has syntax errors
 * @throws UnsupportedFormatError for any other extension
 */
Value load_config_file(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Serialization
// ============================================================================

/**
 * @brief Render a value as JSON text
 * @param indent Spaces per level; negative for compact output
 */
std::string to_json_string(const Value& value, int indent = 2);

/**
 * @brief Render a value as TOML text
 *
 * TOML needs a table at the root, so a non-object value is written under
 * the key "value". TOML has no null; nulls are written as "".
 */
std::string to_toml_string(const Value& value);

/**
 * @brief Write a value to a .json or .toml file
 *
 * @throws UnsupportedFormatError for any other extension
 * @throws std::runtime_error if the file cannot be opened
 */
void write_config_file(const std::string& path, const Value& value);

} // namespace strata

#endif // STRATA_LOADER_HPP
