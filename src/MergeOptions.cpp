/**
 * @file MergeOptions.cpp
 * @brief Option validation and the preset option sets
 */

#include "strata/MergeOptions.hpp"
#include "strata/Errors.hpp"

namespace strata {

void validate_options(const MergeOptions& options) {
    if (options.knockout_prefix.has_value()) {
        if (options.knockout_prefix->empty()) {
            throw InvalidConfiguration("knockout_prefix cannot be an empty string");
        }
        if (options.preserve_unmergeables) {
            throw InvalidConfiguration(
                "preserve_unmergeables must be false if knockout_prefix is specified");
        }
    }

    if (options.unpack_arrays.has_value() && options.unpack_arrays->empty()) {
        throw InvalidConfiguration("unpack_arrays cannot be an empty string");
    }
}

MergeOptions plain_merge_options(bool legacy_array_concat) {
    MergeOptions options;
    options.preserve_unmergeables = false;
    options.legacy_array_concat = legacy_array_concat;
    return options;
}

MergeOptions horizontal_merge_options(bool legacy_array_concat) {
    MergeOptions options = plain_merge_options(legacy_array_concat);
    options.horizontal_precedence = true;
    return options;
}

MergeOptions role_merge_options(bool legacy_array_concat) {
    MergeOptions options = horizontal_merge_options(legacy_array_concat);
    options.knockout_prefix = kRoleKnockoutPrefix;
    return options;
}

} // namespace strata
