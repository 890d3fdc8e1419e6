#pragma once

#include "remap/interval_index.hpp"
#include "remap/types.hpp"

#include <optional>
#include <vector>

namespace remap {

/**
 * Translation table for one source -> target category edge.
 *
 * Keeps the rules in input order for scalar lookups and an IntervalIndex
 * built from the same rules for range queries. Immutable once built.
 */
class CategoryMap {
public:
    /**
     * @throws InvalidArgumentError if a rule's source and target differ in
     *         length or a rule interval is inverted
     */
    CategoryMap(Category source, Category target, std::vector<RangeRule> rules);

    CategoryMap(CategoryMap&&) noexcept = default;
    CategoryMap& operator=(CategoryMap&&) noexcept = default;

    /**
     * Translate one value. A number no rule covers passes through unchanged.
     * @return nullopt if value is not in this map's source category
     */
    std::optional<Value> value_for(const Value& value) const;

    /**
     * Translate a source-space interval into target-space pieces.
     *
     * Pieces appear in ascending source order and cover the query exactly:
     * matched parts are shifted by their rule, gaps pass through unchanged.
     * The lengths of the pieces sum to query.length().
     */
    std::vector<Interval> ranges_for(const Interval& query) const;

    const Category& source() const noexcept { return source_; }
    const Category& target() const noexcept { return target_; }
    const std::vector<RangeRule>& rules() const noexcept { return rules_; }
    const IntervalIndex& index() const noexcept { return index_; }

private:
    Category source_;
    Category target_;
    std::vector<RangeRule> rules_;
    IntervalIndex index_;
};

} // namespace remap
