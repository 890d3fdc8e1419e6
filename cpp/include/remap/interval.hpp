#pragma once

#include "remap/types.hpp"

#include <optional>
#include <vector>

namespace remap {

/**
 * Half-open interval arithmetic.
 *
 * Overlap is strict: [a, b) and [b, c) share no value and do not overlap,
 * and an empty interval overlaps nothing.
 */

bool overlaps(const Interval& a, const Interval& b) noexcept;

// Common part of a and b, or nullopt when they do not overlap
std::optional<Interval> intersect(const Interval& a, const Interval& b) noexcept;

/**
 * Translate a sub-range of rule.source into rule.target space.
 * @return nullopt when sub is not fully contained in rule.source
 */
std::optional<Interval> subrange_map(const RangeRule& rule, const Interval& sub) noexcept;

// Smallest start over all non-empty intervals
std::optional<uint64_t> min_start(const std::vector<Interval>& intervals) noexcept;

// Sum of lengths
uint64_t total_length(const std::vector<Interval>& intervals) noexcept;

} // namespace remap
