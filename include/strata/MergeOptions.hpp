/**
 * @file MergeOptions.hpp
 * @brief Policy knobs for a single deep merge invocation
 *
 * A MergeOptions value is built once by the caller (or by one of the
 * preset entry points in Merge.hpp) and passed by const reference through
 * the whole recursion. Only the recursion depth varies per level, and that
 * is tracked by the engine, not stored here.
 */

#ifndef STRATA_MERGE_OPTIONS_HPP
#define STRATA_MERGE_OPTIONS_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace strata {

/**
 * @brief Diagnostic sink for merge tracing
 *
 * Receives the recursion depth and a one-line description of the step
 * being taken. Must not influence the merge.
 */
using MergeTrace = std::function<void(std::size_t depth, const std::string& message)>;

/**
 * @brief Knockout marker used by role_merge()
 */
inline constexpr const char* kRoleKnockoutPrefix = "!merge";

/**
 * @brief Default recursion limit for MergeOptions::max_depth
 */
inline constexpr std::size_t kDefaultMaxDepth = 512;

/**
 * @brief Configuration for one merge invocation
 *
 * Example:
 * ```cpp
 * MergeOptions opts;
 * opts.knockout_prefix = "!merge";
 * opts.sort_merged_arrays = true;
 * Value merged = deep_merge(source, dest, opts);
 * ```
 */
struct MergeOptions {
    /// Keep the destination when source and destination cannot be merged
    /// (scalar vs. anything, or collections of different kinds).
    bool preserve_unmergeables = false;

    /// Sentinel that marks deletion directives inside source data.
    /// "<prefix>" or "<prefix>:" alone in a sequence clears the destination;
    /// "<prefix>:value" removes "value". Must not be empty and requires
    /// preserve_unmergeables == false.
    std::optional<std::string> knockout_prefix;

    /// Under legacy array mode, concatenate sequences (true) or let the
    /// source replace the destination (false).
    bool horizontal_precedence = false;

    /// Sort every sequence produced by an array merge.
    bool sort_merged_arrays = false;

    /// Delimiter used to join and re-split both sequences before merging.
    /// Must not be empty.
    std::optional<std::string> unpack_arrays;

    /// false: sequences merge by set union. true: horizontal_precedence
    /// decides between concatenation and replacement.
    bool legacy_array_concat = false;

    /// Maximum nesting depth the engine will descend into; 0 disables the check.
    std::size_t max_depth = kDefaultMaxDepth;

    /// Optional diagnostic sink.
    MergeTrace trace;
};

/**
 * @brief Check the entry preconditions of a merge
 *
 * @throws InvalidConfiguration if knockout_prefix is empty, if
 *         knockout_prefix is combined with preserve_unmergeables, or if
 *         unpack_arrays is empty
 */
void validate_options(const MergeOptions& options);

/**
 * @brief Options used by merge(): overwrite enabled, nothing else
 */
MergeOptions plain_merge_options(bool legacy_array_concat = false);

/**
 * @brief Options used by horizontal_merge(): plain plus horizontal precedence
 */
MergeOptions horizontal_merge_options(bool legacy_array_concat = false);

/**
 * @brief Options used by role_merge(): horizontal plus the "!merge" knockout
 */
MergeOptions role_merge_options(bool legacy_array_concat = false);

} // namespace strata

#endif // STRATA_MERGE_OPTIONS_HPP
