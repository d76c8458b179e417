/**
 * @file ArrayOps.hpp
 * @brief Sequence helpers used by the merge engine
 *
 * - join/split normalization for MergeOptions::unpack_arrays
 * - set union used when legacy array concatenation is off
 * - stable sort for MergeOptions::sort_merged_arrays
 */

#ifndef STRATA_ARRAY_OPS_HPP
#define STRATA_ARRAY_OPS_HPP

#include "strata/Value.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Render every element of a sequence and join with a delimiter
 *
 * Strings are used as-is, null renders as "", nested sequences are joined
 * recursively with the same delimiter, everything else uses its JSON text.
 *
 * Examples:
 * ```cpp
 * join_values({"1,2", 3, true}, ",")      // "1,2,3,true"
 * join_values({"a", {"b", "c"}}, "|")     // "a|b|c"
 * ```
 */
std::string join_values(const Value& sequence, const std::string& delimiter);

/**
 * @brief Split text on every occurrence of delimiter
 *
 * Trailing empty fields are dropped; leading and inner empty fields are
 * kept. An empty text yields no fields.
 *
 * Examples:
 * ```cpp
 * split_string("a,,b,,", ",")   // ["a", "", "b"]
 * split_string(",a", ",")       // ["", "a"]
 * split_string("", ",")         // []
 * ```
 */
std::vector<std::string> split_string(const std::string& text, const std::string& delimiter);

/**
 * @brief Join a sequence and split it again into discrete string elements
 *
 * Example:
 * ```cpp
 * unpack_array({"1,2,3", "4"}, ",")   // ["1", "2", "3", "4"]
 * ```
 */
Value unpack_array(const Value& sequence, const std::string& delimiter);

/**
 * @brief Set union of two sequences
 *
 * Elements of first then second, each kept only at its first occurrence
 * (duplicates inside first are dropped too).
 */
Value array_union(const Value& first, const Value& second);

/**
 * @brief Remove every element equal to item
 * @return Number of elements removed
 */
std::size_t erase_all(Value& sequence, const Value& item);

/**
 * @brief Stable sort of a sequence using Value's operator<
 *
 * Elements of different kinds order by kind: null, boolean, number,
 * object, array, string. Elements of one kind order by value.
 */
void sort_array(Value& sequence);

} // namespace strata

#endif // STRATA_ARRAY_OPS_HPP
