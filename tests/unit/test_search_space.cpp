/**
 * @file test_search_space.cpp
 * @brief Unit tests for SearchSpace validation, sampling and grid values.
 */

#include "tuner/search_space.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <variant>

using namespace autotune;

// ─── Validation ──────────────────────────────

TEST(SearchSpaceTest, ValidSpace) {
    SearchSpace space;
    space.add_uniform("lr", 0.001, 0.1)
         .add_integer("depth", 2, 8)
         .add_choice("booster", {"gbtree", "dart"});
    EXPECT_EQ(space.size(), 3u);
    EXPECT_TRUE(space.validate().has_value());
}

TEST(SearchSpaceTest, EmptySpaceIsValid) {
    SearchSpace space;
    EXPECT_TRUE(space.empty());
    EXPECT_TRUE(space.validate().has_value());
}

TEST(SearchSpaceTest, DuplicateNameRejected) {
    SearchSpace space;
    space.add_uniform("x", 0, 1).add_integer("x", 0, 3);
    auto valid = space.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::InvalidArgument);
}

TEST(SearchSpaceTest, EmptyNameRejected) {
    SearchSpace space;
    space.add_uniform("", 0, 1);
    EXPECT_FALSE(space.validate().has_value());
}

TEST(SearchSpaceTest, InvertedRangeRejected) {
    SearchSpace space;
    space.add_uniform("x", 1.0, 0.0);
    EXPECT_FALSE(space.validate().has_value());
}

TEST(SearchSpaceTest, NonFiniteRangeRejected) {
    SearchSpace space;
    space.add_uniform("x", 0.0, std::numeric_limits<double>::infinity());
    EXPECT_FALSE(space.validate().has_value());
}

TEST(SearchSpaceTest, EmptyIntegerRangeRejected) {
    SearchSpace space(std::vector<ParameterSpec>{
        ParameterSpec{.name = "n", .kind = ParameterKind::Integer,
                      .min = 0.2, .max = 0.8, .choices = {}}});
    EXPECT_FALSE(space.validate().has_value());
}

TEST(SearchSpaceTest, IntegerBoundBeyondInt64Rejected) {
    SearchSpace at_max;
    at_max.add_integer("n", 0, std::numeric_limits<int64_t>::max());
    auto valid = at_max.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::InvalidArgument);

    SearchSpace huge(std::vector<ParameterSpec>{
        ParameterSpec{.name = "n", .kind = ParameterKind::Integer,
                      .min = -1e19, .max = 0.0, .choices = {}}});
    EXPECT_FALSE(huge.validate().has_value());
}

TEST(SearchSpaceTest, EmptyChoicesRejected) {
    SearchSpace space;
    space.add_choice("booster", {});
    EXPECT_FALSE(space.validate().has_value());
}

TEST(SearchSpaceTest, ParseParameterKind) {
    EXPECT_EQ(*parse_parameter_kind("uniform"), ParameterKind::Uniform);
    EXPECT_EQ(*parse_parameter_kind("integer"), ParameterKind::Integer);
    EXPECT_EQ(*parse_parameter_kind("choice"), ParameterKind::Choice);
    EXPECT_FALSE(parse_parameter_kind("normal").has_value());
}

// ─── Sampling ────────────────────────────────

TEST(SearchSpaceTest, SamplesStayInRange) {
    SearchSpace space;
    space.add_uniform("lr", 0.25, 0.75)
         .add_integer("depth", 2, 4)
         .add_choice("booster", {"gbtree", "dart"});

    std::mt19937_64 rng(7);
    for (int i = 0; i < 200; ++i) {
        auto params = space.sample(rng);
        ASSERT_EQ(params.size(), 3u);

        auto lr = std::get<double>(params.at("lr"));
        EXPECT_GE(lr, 0.25);
        EXPECT_LE(lr, 0.75);

        auto depth = std::get<int64_t>(params.at("depth"));
        EXPECT_GE(depth, 2);
        EXPECT_LE(depth, 4);

        auto booster = std::get<std::string>(params.at("booster"));
        EXPECT_TRUE(booster == "gbtree" || booster == "dart");
    }
}

TEST(SearchSpaceTest, SamplingIsDeterministicPerSeed) {
    SearchSpace space;
    space.add_uniform("x", 0, 1).add_integer("n", 0, 100);

    std::mt19937_64 a(42);
    std::mt19937_64 b(42);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(space.sample(a), space.sample(b));
    }
}

TEST(SearchSpaceTest, DegenerateUniformRange) {
    SearchSpace space;
    space.add_uniform("x", 0.3, 0.3);
    std::mt19937_64 rng(1);
    EXPECT_DOUBLE_EQ(std::get<double>(space.sample(rng).at("x")), 0.3);
}

// ─── Grid values ─────────────────────────────

TEST(SearchSpaceTest, UniformGridIncludesBothEnds) {
    SearchSpace space;
    space.add_uniform("x", 0.0, 1.0);
    auto values = space.grid_values(space.parameters()[0], 5);
    ASSERT_EQ(values.size(), 5u);
    EXPECT_DOUBLE_EQ(std::get<double>(values.front()), 0.0);
    EXPECT_DOUBLE_EQ(std::get<double>(values[2]), 0.5);
    EXPECT_DOUBLE_EQ(std::get<double>(values.back()), 1.0);
}

TEST(SearchSpaceTest, UniformGridSingleStepIsMin) {
    SearchSpace space;
    space.add_uniform("x", 0.2, 0.9);
    auto values = space.grid_values(space.parameters()[0], 1);
    ASSERT_EQ(values.size(), 1u);
    EXPECT_DOUBLE_EQ(std::get<double>(values[0]), 0.2);
}

TEST(SearchSpaceTest, SmallIntegerRangeEnumeratesAll) {
    SearchSpace space;
    space.add_integer("n", 0, 4);
    auto values = space.grid_values(space.parameters()[0], 10);
    ASSERT_EQ(values.size(), 5u);
    for (int64_t i = 0; i < 5; ++i) {
        EXPECT_EQ(std::get<int64_t>(values[static_cast<size_t>(i)]), i);
    }
}

TEST(SearchSpaceTest, WideIntegerRangeIsStrided) {
    SearchSpace space;
    space.add_integer("n", 0, 100);
    auto values = space.grid_values(space.parameters()[0], 3);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(values[0]), 0);
    EXPECT_EQ(std::get<int64_t>(values[1]), 50);
    EXPECT_EQ(std::get<int64_t>(values[2]), 100);
}

TEST(SearchSpaceTest, WideSignedIntegerRangeStaysInBounds) {
    SearchSpace space;
    space.add_integer("n", -5'000'000'000'000'000'000, 5'000'000'000'000'000'000);
    ASSERT_TRUE(space.validate().has_value());

    auto values = space.grid_values(space.parameters()[0], 3);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(values[0]), -5'000'000'000'000'000'000);
    EXPECT_EQ(std::get<int64_t>(values[1]), 0);
    EXPECT_EQ(std::get<int64_t>(values[2]), 5'000'000'000'000'000'000);
}

TEST(SearchSpaceTest, FullInt64RangeGridAndSample) {
    constexpr int64_t lo = std::numeric_limits<int64_t>::min();
    constexpr int64_t hi = std::numeric_limits<int64_t>::max() - 1023;  // largest below 2^63 as double
    SearchSpace space;
    space.add_integer("n", lo, hi);
    ASSERT_TRUE(space.validate().has_value());

    auto values = space.grid_values(space.parameters()[0], 5);
    ASSERT_EQ(values.size(), 5u);
    int64_t previous = lo;
    for (size_t i = 0; i < values.size(); ++i) {
        auto v = std::get<int64_t>(values[i]);
        EXPECT_GE(v, lo);
        if (i > 0) EXPECT_GT(v, previous);
        previous = v;
    }
    EXPECT_EQ(std::get<int64_t>(values.front()), lo);

    std::mt19937_64 rng(5);
    auto sampled = std::get<int64_t>(space.sample(rng).at("n"));
    EXPECT_GE(sampled, lo);
}

TEST(SearchSpaceTest, IntegerGridSingleStep) {
    SearchSpace space;
    space.add_integer("n", 3, 9);
    auto values = space.grid_values(space.parameters()[0], 1);
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(values[0]), 3);
}

TEST(SearchSpaceTest, ChoiceGridYieldsEveryChoice) {
    SearchSpace space;
    space.add_choice("booster", {"gbtree", "dart", "linear"});
    auto values = space.grid_values(space.parameters()[0], 2);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(std::get<std::string>(values[2]), "linear");
}
