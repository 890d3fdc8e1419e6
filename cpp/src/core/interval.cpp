#include "remap/interval.hpp"

#include <algorithm>

namespace remap {

bool overlaps(const Interval& a, const Interval& b) noexcept {
    return !a.empty() && !b.empty() && a.start < b.end && b.start < a.end;
}

std::optional<Interval> intersect(const Interval& a, const Interval& b) noexcept {
    if (!overlaps(a, b)) {
        return std::nullopt;
    }
    return Interval(std::max(a.start, b.start), std::min(a.end, b.end));
}

std::optional<Interval> subrange_map(const RangeRule& rule, const Interval& sub) noexcept {
    if (rule.source.start > sub.start || rule.source.end < sub.end || sub.start > sub.end) {
        return std::nullopt;
    }
    uint64_t target_start = rule.apply(sub.start);
    return Interval(target_start, target_start + sub.length());
}

std::optional<uint64_t> min_start(const std::vector<Interval>& intervals) noexcept {
    std::optional<uint64_t> lowest;
    for (const auto& interval : intervals) {
        if (interval.empty()) continue;
        if (!lowest || interval.start < *lowest) {
            lowest = interval.start;
        }
    }
    return lowest;
}

uint64_t total_length(const std::vector<Interval>& intervals) noexcept {
    uint64_t total = 0;
    for (const auto& interval : intervals) {
        total += interval.length();
    }
    return total;
}

} // namespace remap
