// =============================================================================
// Interval Arithmetic Tests
// =============================================================================

#include <gtest/gtest.h>
#include "remap/interval.hpp"

using namespace remap;

TEST(IntervalTest, OverlapIsStrictAtSharedBoundary) {
    EXPECT_TRUE(overlaps({10, 20}, {15, 25}));
    EXPECT_TRUE(overlaps({15, 25}, {10, 20}));
    EXPECT_TRUE(overlaps({10, 20}, {12, 13}));
    EXPECT_FALSE(overlaps({10, 20}, {20, 30}));
    EXPECT_FALSE(overlaps({20, 30}, {10, 20}));
    EXPECT_FALSE(overlaps({10, 20}, {30, 40}));
}

TEST(IntervalTest, EmptyIntervalOverlapsNothing) {
    EXPECT_FALSE(overlaps({15, 15}, {10, 20}));
    EXPECT_FALSE(overlaps({10, 20}, {10, 10}));
    EXPECT_FALSE(overlaps({5, 5}, {5, 5}));
    EXPECT_FALSE(overlaps({10, 20}, {15, 15}));
    EXPECT_FALSE(intersect({15, 15}, {10, 20}).has_value());
}

TEST(IntervalTest, Intersect) {
    auto common = intersect({100, 200}, {120, 300});
    ASSERT_TRUE(common.has_value());
    EXPECT_EQ(*common, Interval(120, 200));

    auto inner = intersect({0, 100}, {40, 60});
    ASSERT_TRUE(inner.has_value());
    EXPECT_EQ(*inner, Interval(40, 60));

    EXPECT_FALSE(intersect({0, 10}, {10, 20}).has_value());
}

TEST(IntervalTest, SubrangeMapShiftsByRuleOffset) {
    RangeRule rule{{100, 200}, {50, 150}};

    auto mapped = subrange_map(rule, {120, 200});
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(*mapped, Interval(70, 150));

    auto whole = subrange_map(rule, rule.source);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(*whole, rule.target);
}

TEST(IntervalTest, SubrangeMapRejectsUncontainedRange) {
    RangeRule rule{{100, 200}, {50, 150}};
    EXPECT_FALSE(subrange_map(rule, {90, 150}).has_value());
    EXPECT_FALSE(subrange_map(rule, {150, 201}).has_value());
    EXPECT_FALSE(subrange_map(rule, {0, 10}).has_value());
}

TEST(IntervalTest, SubrangeMapCanShiftDownward) {
    RangeRule rule = RangeRule::from_triple(0, 1000, 10);
    auto mapped = subrange_map(rule, {1003, 1005});
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(*mapped, Interval(3, 5));
}

TEST(IntervalTest, MinStartSkipsEmptyIntervals) {
    auto lowest = min_start({{40, 50}, {2, 2}, {12, 13}});
    ASSERT_TRUE(lowest.has_value());
    EXPECT_EQ(*lowest, 12u);
    EXPECT_FALSE(min_start({}).has_value());
    EXPECT_FALSE(min_start({{7, 7}}).has_value());
}

TEST(IntervalTest, TotalLength) {
    EXPECT_EQ(total_length({{0, 10}, {20, 25}, {3, 3}}), 15u);
    EXPECT_EQ(total_length({}), 0u);
}

TEST(IntervalTest, RuleFromTriple) {
    RangeRule rule = RangeRule::from_triple(52, 50, 48);
    EXPECT_EQ(rule.source, Interval(50, 98));
    EXPECT_EQ(rule.target, Interval(52, 100));
    EXPECT_EQ(rule.apply(79), 81u);
}
