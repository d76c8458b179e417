/**
 * @file Knockout.hpp
 * @brief Knockout directives and overwrite resolution for unmergeable pairs
 *
 * With a knockout prefix of "!merge":
 * - "!merge" or "!merge:" as a sequence element clears the destination
 * - "!merge:value" inside a sequence removes "value" from the destination
 * - "!merge" as a scalar erases the destination (result is "")
 * - "!merge:text" as a scalar replaces the destination with "text"
 */

#ifndef STRATA_KNOCKOUT_HPP
#define STRATA_KNOCKOUT_HPP

#include "strata/MergeOptions.hpp"
#include "strata/Value.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace strata {

/**
 * @brief Marker that introduces a targeted knockout ("<prefix>:")
 */
std::string knockout_marker(const std::string& prefix);

/**
 * @brief Check for a bare knockout element ("<prefix>" or "<prefix>:")
 */
bool is_bare_knockout(const Value& item, const std::string& prefix);

/**
 * @brief Extract the target of a targeted knockout directive
 *
 * @return The text after "<prefix>:" if item is a string starting with
 *         the marker, std::nullopt otherwise
 *
 * Examples:
 * ```cpp
 * knockout_target("!merge:1", "!merge")   // "1"
 * knockout_target("!merge:", "!merge")    // ""
 * knockout_target("1", "!merge")          // nullopt
 * knockout_target(1, "!merge")            // nullopt
 * ```
 */
std::optional<std::string> knockout_target(const Value& item, const std::string& prefix);

/**
 * @brief Remove every bare knockout element from a sequence
 * @return true if at least one element was removed
 */
bool remove_bare_knockouts(Value& sequence, const std::string& prefix);

/**
 * @brief Empty a value in place
 *
 * Objects, arrays and strings become empty values of the same kind;
 * every other value becomes null.
 */
void clear_or_null(Value& value);

/**
 * @brief Apply targeted knockout directives from source to destination
 *
 * For every "<prefix>:x" string in source, all elements equal to "x" and
 * all elements equal to "<prefix>:x" are removed from destination, and the
 * directive is dropped from source. Both values must be sequences.
 *
 * @return Number of directives applied
 */
std::size_t apply_knockouts(Value& source, Value& destination, const std::string& prefix);

/**
 * @brief Resolve a source/destination pair that cannot be merged structurally
 *
 * - preserve_unmergeables: destination is left as is
 * - no knockout prefix: destination becomes source
 * - knockout prefix:
 *   - string equal to the prefix: destination becomes ""
 *   - string starting with "<prefix>:": destination becomes the remainder
 *   - sequence holding "<prefix>:" strings: destination becomes ""
 *   - anything else: destination becomes source
 *
 * Source may be moved from.
 */
void resolve_unmergeable(Value& source, Value& destination, const MergeOptions& options);

} // namespace strata

#endif // STRATA_KNOCKOUT_HPP
