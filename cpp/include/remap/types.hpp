#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace remap {

// Named stage in a translation chain ("seed", "soil", ...)
using Category = std::string;

// Half-open numeric span [start, end)
struct Interval {
    uint64_t start;
    uint64_t end;

    constexpr Interval() noexcept : start(0), end(0) {}
    constexpr Interval(uint64_t start_, uint64_t end_) noexcept
        : start(start_), end(end_) {}

    constexpr uint64_t length() const noexcept { return end - start; }
    constexpr bool empty() const noexcept { return end <= start; }
    constexpr bool contains(uint64_t n) const noexcept { return start <= n && n < end; }
};

constexpr bool operator==(const Interval& lhs, const Interval& rhs) noexcept {
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

constexpr bool operator!=(const Interval& lhs, const Interval& rhs) noexcept {
    return !(lhs == rhs);
}

inline std::ostream& operator<<(std::ostream& os, const Interval& i) {
    return os << "[" << i.start << ".." << i.end << ")";
}

/**
 * One line of a translation table: every value in source is shifted by the
 * constant (target.start - source.start). Both sides have the same length.
 */
struct RangeRule {
    Interval source;
    Interval target;

    // Image of n under this rule; n must lie in source
    constexpr uint64_t apply(uint64_t n) const noexcept {
        return target.start + (n - source.start);
    }

    // Builds a rule from the "target-start source-start length" triple
    static constexpr RangeRule from_triple(uint64_t target_start, uint64_t source_start,
                                           uint64_t length) noexcept {
        return RangeRule{Interval(source_start, source_start + length),
                         Interval(target_start, target_start + length)};
    }
};

constexpr bool operator==(const RangeRule& lhs, const RangeRule& rhs) noexcept {
    return lhs.source == rhs.source && lhs.target == rhs.target;
}

inline std::ostream& operator<<(std::ostream& os, const RangeRule& r) {
    return os << r.source << " -> " << r.target;
}

// A number tagged with the category it currently belongs to
struct Value {
    Category category;
    uint64_t number = 0;
};

inline bool operator==(const Value& lhs, const Value& rhs) {
    return lhs.category == rhs.category && lhs.number == rhs.number;
}

inline bool operator!=(const Value& lhs, const Value& rhs) {
    return !(lhs == rhs);
}

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    return os << v.category << "=" << v.number;
}

} // namespace remap
