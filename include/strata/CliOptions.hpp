/**
 * @file CliOptions.hpp
 * @brief Command line surface of strata-merge
 *
 * Option declarations and the mapping from parsed flags to MergeOptions
 * live here so they can be exercised without running the binary.
 */

#ifndef STRATA_CLI_OPTIONS_HPP
#define STRATA_CLI_OPTIONS_HPP

#include "strata/MergeOptions.hpp"
#include <cxxopts.hpp>

namespace strata {

/**
 * @brief Declare every strata-merge option, including positional files
 */
cxxopts::Options make_cli_options();

/**
 * @brief Assemble merge options from a parsed command line
 *
 * --mode picks the preset (merge, horizontal, role) or a fully manual
 * "deep" merge. --knockout-prefix, --preserve-unmergeables and
 * --horizontal only apply to the deep mode. --array-concat forces legacy
 * array mode; without it the value of STRATA_DEEP_MERGE_ARRAY_CONCAT is
 * used.
 *
 * @throws InvalidConfiguration for an unknown mode, for manual flags given
 *         with a preset, or for options rejected by validate_options()
 */
MergeOptions build_merge_options(const cxxopts::ParseResult& result);

} // namespace strata

#endif // STRATA_CLI_OPTIONS_HPP
