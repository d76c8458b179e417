/**
 * @file CliOptions.cpp
 * @brief strata-merge option declarations and MergeOptions assembly
 */

#include "strata/CliOptions.hpp"
#include "strata/Errors.hpp"
#include "strata/Settings.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace strata {

cxxopts::Options make_cli_options() {
    cxxopts::Options options("strata-merge",
                             "Deep merge JSON/TOML configuration layers (lowest precedence first)");
    options.positional_help("FILE...");

    options.add_options()
        ("m,mode", "Preset: merge | horizontal | role | deep",
         cxxopts::value<std::string>()->default_value("deep"))
        ("k,knockout-prefix", "Prefix marking knockout directives (deep mode)",
         cxxopts::value<std::string>())
        ("preserve-unmergeables", "Keep destination values that cannot be merged (deep mode)")
        ("horizontal", "Concatenate arrays under legacy array mode (deep mode)")
        ("sort", "Sort merged arrays")
        ("u,unpack", "Join and re-split arrays on this delimiter", cxxopts::value<std::string>())
        ("array-concat", "Enable legacy array mode (default from " +
                         std::string(kArrayConcatEnvVar) + ")")
        ("max-depth", "Recursion limit, 0 for none",
         cxxopts::value<std::size_t>()->default_value(std::to_string(kDefaultMaxDepth)))
        ("debug", "Trace the merge on stderr")
        ("t,to", "Output format: json | toml", cxxopts::value<std::string>()->default_value("json"))
        ("o,out", "Write result to FILE instead of stdout", cxxopts::value<std::string>())
        ("h,help", "Show help");

    options.add_options()
        ("files", "Layer files", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"files"});
    return options;
}

MergeOptions build_merge_options(const cxxopts::ParseResult& result) {
    // Process-wide array mode: read once, then carried by the options
    const bool array_concat = result.count("array-concat") ? true : legacy_array_concat_from_env();
    const bool manual_flags = result.count("knockout-prefix") || result.count("preserve-unmergeables") ||
                              result.count("horizontal");

    const std::string mode = result["mode"].as<std::string>();
    MergeOptions merge_opts;
    if (mode == "deep") {
        merge_opts.legacy_array_concat = array_concat;
        merge_opts.preserve_unmergeables = result.count("preserve-unmergeables") > 0;
        merge_opts.horizontal_precedence = result.count("horizontal") > 0;
        if (result.count("knockout-prefix")) {
            merge_opts.knockout_prefix = result["knockout-prefix"].as<std::string>();
        }
    } else if (mode != "merge" && mode != "horizontal" && mode != "role") {
        throw InvalidConfiguration("unknown mode '" + mode + "'");
    } else if (manual_flags) {
        throw InvalidConfiguration(
            "--knockout-prefix, --preserve-unmergeables and --horizontal require --mode deep");
    } else if (mode == "merge") {
        merge_opts = plain_merge_options(array_concat);
    } else if (mode == "horizontal") {
        merge_opts = horizontal_merge_options(array_concat);
    } else {
        merge_opts = role_merge_options(array_concat);
    }

    merge_opts.sort_merged_arrays = result.count("sort") > 0;
    if (result.count("unpack")) {
        merge_opts.unpack_arrays = result["unpack"].as<std::string>();
    }
    merge_opts.max_depth = result["max-depth"].as<std::size_t>();
    if (result.count("debug")) {
        merge_opts.trace = [](std::size_t, const std::string& message) {
            std::cerr << message << "\n";
        };
    }

    validate_options(merge_opts);
    return merge_opts;
}

} // namespace strata
