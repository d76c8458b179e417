/**
 * @file Settings.hpp
 * @brief Process-level settings that feed MergeOptions
 *
 * The legacy array concatenation switch is a property of the running
 * process, not of a single merge. It is read from the environment here,
 * once, and then passed into MergeOptions by the caller.
 */

#ifndef STRATA_SETTINGS_HPP
#define STRATA_SETTINGS_HPP

#include <optional>
#include <string>

namespace strata {

/**
 * @brief Environment variable holding the legacy array concatenation flag
 */
inline constexpr const char* kArrayConcatEnvVar = "STRATA_DEEP_MERGE_ARRAY_CONCAT";

/**
 * @brief Get environment variable value
 *
 * @param name Variable name
 * @return Value if set (even if empty), nullopt otherwise
 */
std::optional<std::string> get_env_var(const std::string& name);

/**
 * @brief Interpret a textual flag
 *
 * Accepts JSON booleans and numbers (non-zero is true) and the words
 * true/false/yes/no/on/off in any case. Empty text is false.
 *
 * @throws InvalidConfiguration for anything else
 */
bool parse_flag(const std::string& name, const std::string& raw);

/**
 * @brief Read the legacy array concatenation flag from the environment
 *
 * @return false if STRATA_DEEP_MERGE_ARRAY_CONCAT is unset
 * @throws InvalidConfiguration if the variable holds an unrecognized value
 */
bool legacy_array_concat_from_env();

} // namespace strata

#endif // STRATA_SETTINGS_HPP
