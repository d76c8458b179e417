/**
 * @file test_cli.cpp
 * @brief Unit tests for strata-merge option handling (GoogleTest)
 *
 * Tests cover:
 * - mode to preset mapping
 * - manual flags in deep mode, and their rejection with a preset
 * - --array-concat versus STRATA_DEEP_MERGE_ARRAY_CONCAT
 * - --sort, --unpack, --max-depth and --debug
 *
 * Note: These tests parse real argument lists with the same option set the
 * binary uses, then check the MergeOptions it would merge with.
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "strata/CliOptions.hpp"
#include "strata/Errors.hpp"
#include "strata/Merge.hpp"
#include "strata/Settings.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

using namespace strata;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/**
 * @brief RAII wrapper for an environment variable
 */
class EnvGuard {
public:
    EnvGuard(const std::string& name, const std::optional<std::string>& value)
        : name_(name), had_value_(false) {
        const char* old = std::getenv(name.c_str());
        if (old) {
            old_value_ = old;
            had_value_ = true;
        }
#ifdef _WIN32
        _putenv_s(name.c_str(), value ? value->c_str() : "");
#else
        if (value) {
            setenv(name.c_str(), value->c_str(), 1);
        } else {
            unsetenv(name.c_str());
        }
#endif
    }

    ~EnvGuard() {
#ifdef _WIN32
        _putenv_s(name_.c_str(), had_value_ ? old_value_.c_str() : "");
#else
        if (had_value_) {
            setenv(name_.c_str(), old_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
#endif
    }

private:
    std::string name_;
    std::string old_value_;
    bool had_value_;
};

/**
 * @brief Parse args as strata-merge would and build its merge options
 */
MergeOptions options_for(const std::vector<std::string>& args) {
    auto options = make_cli_options();

    std::vector<const char*> argv;
    argv.push_back("strata-merge");
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }

    auto result = options.parse(static_cast<int>(argv.size()), argv.data());
    return build_merge_options(result);
}

} // namespace

// ============================================================================
// Modes
// ============================================================================

TEST(CliOptions, DefaultModeIsDeep) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    auto opts = options_for({"a.json"});

    EXPECT_FALSE(opts.preserve_unmergeables);
    EXPECT_FALSE(opts.horizontal_precedence);
    EXPECT_FALSE(opts.knockout_prefix.has_value());
    EXPECT_FALSE(opts.legacy_array_concat);
    EXPECT_FALSE(opts.sort_merged_arrays);
    EXPECT_FALSE(opts.unpack_arrays.has_value());
    EXPECT_EQ(opts.max_depth, kDefaultMaxDepth);
    EXPECT_FALSE(static_cast<bool>(opts.trace));
}

TEST(CliOptions, MergeMode) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    auto opts = options_for({"--mode", "merge", "a.json"});

    EXPECT_FALSE(opts.horizontal_precedence);
    EXPECT_FALSE(opts.knockout_prefix.has_value());
}

TEST(CliOptions, HorizontalMode) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    auto opts = options_for({"--mode", "horizontal", "a.json"});

    EXPECT_TRUE(opts.horizontal_precedence);
    EXPECT_FALSE(opts.knockout_prefix.has_value());
}

TEST(CliOptions, RoleMode) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    auto opts = options_for({"-m", "role", "a.json"});

    EXPECT_TRUE(opts.horizontal_precedence);
    ASSERT_TRUE(opts.knockout_prefix.has_value());
    EXPECT_EQ(*opts.knockout_prefix, kRoleKnockoutPrefix);
}

TEST(CliOptions, UnknownModeThrows) {
    EXPECT_THROW(options_for({"--mode", "sideways", "a.json"}), InvalidConfiguration);
}

// ============================================================================
// Manual flags
// ============================================================================

TEST(CliOptions, DeepModeTakesManualFlags) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    auto opts = options_for({"--horizontal", "-k", "%%", "a.json"});

    EXPECT_TRUE(opts.horizontal_precedence);
    ASSERT_TRUE(opts.knockout_prefix.has_value());
    EXPECT_EQ(*opts.knockout_prefix, "%%");
}

TEST(CliOptions, DeepModePreserveUnmergeables) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    auto opts = options_for({"--preserve-unmergeables", "a.json"});
    EXPECT_TRUE(opts.preserve_unmergeables);
}

TEST(CliOptions, PresetRejectsManualFlags) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    EXPECT_THROW(options_for({"--mode", "role", "--knockout-prefix", "!x", "a.json"}),
                 InvalidConfiguration);
    EXPECT_THROW(options_for({"--mode", "merge", "--preserve-unmergeables", "a.json"}),
                 InvalidConfiguration);
    EXPECT_THROW(options_for({"--mode", "horizontal", "--horizontal", "a.json"}),
                 InvalidConfiguration);
}

TEST(CliOptions, InvalidCombinationIsRejected) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    EXPECT_THROW(options_for({"-k", "!merge", "--preserve-unmergeables", "a.json"}),
                 InvalidConfiguration);
}

// ============================================================================
// Legacy array mode
// ============================================================================

TEST(CliOptions, ArrayConcatFromEnvironment) {
    EnvGuard guard(kArrayConcatEnvVar, std::string("true"));
    EXPECT_TRUE(options_for({"a.json"}).legacy_array_concat);
    EXPECT_TRUE(options_for({"--mode", "role", "a.json"}).legacy_array_concat);
}

TEST(CliOptions, ArrayConcatFlagOverridesEnvironment) {
    EnvGuard guard(kArrayConcatEnvVar, std::string("false"));
    EXPECT_FALSE(options_for({"a.json"}).legacy_array_concat);
    EXPECT_TRUE(options_for({"--array-concat", "a.json"}).legacy_array_concat);
    EXPECT_TRUE(options_for({"--mode", "horizontal", "--array-concat", "a.json"}).legacy_array_concat);
}

TEST(CliOptions, ArrayConcatFlagSkipsBadEnvironment) {
    EnvGuard guard(kArrayConcatEnvVar, std::string("sometimes"));
    EXPECT_THROW(options_for({"a.json"}), InvalidConfiguration);
    EXPECT_NO_THROW(options_for({"--array-concat", "a.json"}));
}

// ============================================================================
// Array handling and limits
// ============================================================================

TEST(CliOptions, SortUnpackAndDepth) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    auto opts = options_for({"--sort", "-u", ",", "--max-depth", "7", "--mode", "role", "a.json"});

    EXPECT_TRUE(opts.sort_merged_arrays);
    ASSERT_TRUE(opts.unpack_arrays.has_value());
    EXPECT_EQ(*opts.unpack_arrays, ",");
    EXPECT_EQ(opts.max_depth, 7u);
}

TEST(CliOptions, DebugInstallsTrace) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    auto opts = options_for({"--debug", "a.json"});
    EXPECT_TRUE(static_cast<bool>(opts.trace));
}

TEST(CliOptions, BuiltOptionsDriveTheMerge) {
    EnvGuard guard(kArrayConcatEnvVar, std::nullopt);
    auto opts = options_for({"--mode", "role", "--sort", "a.json", "b.json"});

    Value base = {{"run_list", {"ntp", "apache", "base"}}};
    Value role = {{"run_list", {"!merge:apache", "nginx"}}};

    auto result = deep_merge_all({base, role}, opts);
    EXPECT_EQ(result["run_list"], (Value{"base", "nginx", "ntp"}));
}
