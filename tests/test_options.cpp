/**
 * @file test_options.cpp
 * @brief Tests for merge option validation and presets (GoogleTest)
 */

#include <gtest/gtest.h>
#include "strata/Errors.hpp"
#include "strata/MergeOptions.hpp"

using namespace strata;

TEST(ValidateOptions, DefaultsAreValid) {
    EXPECT_NO_THROW(validate_options(MergeOptions{}));
}

TEST(ValidateOptions, EmptyKnockoutPrefix) {
    MergeOptions opts;
    opts.knockout_prefix = "";
    try {
        validate_options(opts);
        FAIL() << "Expected InvalidConfiguration";
    } catch (const InvalidConfiguration& e) {
        EXPECT_EQ(e.reason(), "knockout_prefix cannot be an empty string");
    }
}

TEST(ValidateOptions, KnockoutRequiresOverwrite) {
    MergeOptions opts;
    opts.knockout_prefix = "!merge";
    opts.preserve_unmergeables = true;
    EXPECT_THROW(validate_options(opts), InvalidConfiguration);

    opts.preserve_unmergeables = false;
    EXPECT_NO_THROW(validate_options(opts));
}

TEST(ValidateOptions, EmptyUnpackDelimiter) {
    MergeOptions opts;
    opts.unpack_arrays = "";
    EXPECT_THROW(validate_options(opts), InvalidConfiguration);
}

TEST(ValidateOptions, InvalidConfigurationIsConfigError) {
    MergeOptions opts;
    opts.knockout_prefix = "";
    EXPECT_THROW(validate_options(opts), ConfigError);
}

TEST(MergePresets, Plain) {
    auto opts = plain_merge_options();
    EXPECT_FALSE(opts.preserve_unmergeables);
    EXPECT_FALSE(opts.horizontal_precedence);
    EXPECT_FALSE(opts.knockout_prefix.has_value());
    EXPECT_FALSE(opts.legacy_array_concat);
    EXPECT_FALSE(opts.sort_merged_arrays);
    EXPECT_FALSE(opts.unpack_arrays.has_value());
}

TEST(MergePresets, Horizontal) {
    auto opts = horizontal_merge_options(true);
    EXPECT_TRUE(opts.horizontal_precedence);
    EXPECT_TRUE(opts.legacy_array_concat);
    EXPECT_FALSE(opts.knockout_prefix.has_value());
}

TEST(MergePresets, Role) {
    auto opts = role_merge_options();
    EXPECT_TRUE(opts.horizontal_precedence);
    ASSERT_TRUE(opts.knockout_prefix.has_value());
    EXPECT_EQ(*opts.knockout_prefix, "!merge");
    EXPECT_NO_THROW(validate_options(opts));
}
