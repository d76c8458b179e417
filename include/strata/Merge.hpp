/**
 * @file Merge.hpp
 * @brief Deep merge of layered configuration values
 *
 * The source (higher precedence) is merged into the destination (lower
 * precedence):
 * - Both objects: recursive merge, keys from both are combined
 * - Both arrays: set union, or concatenation/replacement in legacy mode,
 *   after unpacking and knockout processing
 * - Anything else: source overwrites destination, unless
 *   preserve_unmergeables is set; knockout directives are honored
 * - Null source never overwrites; null destination adopts the source
 * - A key holding null in the destination is merged like a missing key
 */

#ifndef STRATA_MERGE_HPP
#define STRATA_MERGE_HPP

#include "strata/MergeOptions.hpp"
#include "strata/Value.hpp"
#include <vector>

namespace strata {

/**
 * @brief Deep merge source into a copy of destination
 *
 * Neither argument is modified.
 *
 * @param source Higher precedence value
 * @param destination Lower precedence value
 * @param options Merge policy
 * @return Merged result
 * @throws InvalidConfiguration if options fail validate_options()
 * @throws MergeDepthExceeded if nesting passes options.max_depth
 *
 * Examples:
 * ```cpp
 * Value dest = {{"x", {"1", "3"}}};
 * Value src  = {{"x", {"!merge:1", "2"}}};
 * MergeOptions opts;
 * opts.knockout_prefix = "!merge";
 * auto result = deep_merge(src, dest, opts);
 * // Result: {"x": ["3", "2"]}
 *
 * Value dest2 = {{"x", {1, 2, 3}}};
 * Value src2  = {{"x", "!merge"}};
 * auto result2 = deep_merge(src2, dest2, opts);
 * // Result: {"x": ""}
 * ```
 */
Value deep_merge(const Value& source, const Value& destination,
                 const MergeOptions& options = MergeOptions{});

/**
 * @brief Deep merge source into destination, in place
 *
 * destination holds the merged result afterwards; this also covers the
 * case where the result is a scalar that replaced it. source is left in
 * an unspecified state.
 *
 * @return Reference to destination
 * @throws InvalidConfiguration if options fail validate_options()
 * @throws MergeDepthExceeded if nesting passes options.max_depth; both
 *         arguments are checked before either is modified
 */
Value& deep_merge_in_place(Value& source, Value& destination,
                           const MergeOptions& options = MergeOptions{});

/**
 * @brief Merge overlay over base across precedence levels
 *
 * Overwrite enabled, no knockout, not horizontal.
 */
Value merge(const Value& overlay, const Value& base, bool legacy_array_concat = false);

/**
 * @brief Merge overlay with base at the same precedence level
 *
 * Like merge(), but in legacy array mode sequences are concatenated
 * instead of replaced.
 */
Value horizontal_merge(const Value& overlay, const Value& base, bool legacy_array_concat = false);

/**
 * @brief Merge for role inheritance chains
 *
 * Like horizontal_merge(), with "!merge" as knockout prefix.
 *
 * Example:
 * ```cpp
 * Value base    = {{"recipes", {"base", "ntp", "apache"}}};
 * Value overlay = {{"recipes", {"!merge:apache", "nginx"}}};
 * auto result = role_merge(overlay, base);
 * // Result: {"recipes": ["base", "ntp", "nginx"]}
 * ```
 */
Value role_merge(const Value& overlay, const Value& base, bool legacy_array_concat = false);

/**
 * @brief Deep merge several layers in precedence order
 *
 * Layers go from lowest to highest precedence; each one is merged over the
 * accumulated result with the given options.
 *
 * Example:
 * ```cpp
 * Value defaults = {{"a", 1}, {"b", 2}};
 * Value file_config = {{"b", 3}, {"c", 4}};
 * Value env_overrides = {{"c", 5}};
 *
 * auto result = deep_merge_all({defaults, file_config, env_overrides});
 * // Result: {"a": 1, "b": 3, "c": 5}
 * ```
 *
 * @return Merged result, or an empty object when layers is empty
 */
Value deep_merge_all(const std::vector<Value>& layers,
                     const MergeOptions& options = MergeOptions{});

} // namespace strata

#endif // STRATA_MERGE_HPP
