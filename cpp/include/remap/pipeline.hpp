#pragma once

#include "remap/category_map.hpp"
#include "remap/types.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace remap {

/**
 * Chain of category maps keyed by source category.
 *
 * A walk starts at one category and follows each map's target until the
 * requested category is reached. Walks fail (nullopt) when the chain ends
 * before the target or loops back to a category already visited.
 * Assembled once, then read-only; concurrent queries need no locking.
 */
class Pipeline {
public:
    Pipeline() = default;

    /**
     * Register the outgoing map for category_map.source().
     * @throws InvalidArgumentError if that category already has a map
     */
    void insert(CategoryMap category_map);

    // Outgoing map for category, or nullptr
    const CategoryMap* find(const Category& category) const;

    size_t size() const noexcept { return maps_.size(); }

    // Categories visited walking from `from` to `to`, both ends included
    std::optional<std::vector<Category>> chain(const Category& from, const Category& to) const;

    std::optional<Value> map(const Value& value, const Category& target) const;

    /**
     * Walk an interval hop by hop, splitting it at every map.
     * @return the target-space pieces; their lengths sum to interval.length()
     */
    std::optional<std::vector<Interval>> map_range(const Interval& interval,
                                                   const Category& source,
                                                   const Category& target) const;

    // Scalar walk of a batch; values whose walk fails are left out
    std::vector<Value> map_all(const std::vector<Value>& values, const Category& target) const;

    // Smallest scalar result over numbers starting in `from`
    std::optional<uint64_t> lowest(const std::vector<uint64_t>& numbers,
                                   const Category& from, const Category& to) const;

    // Smallest value reachable from any of the intervals starting in `from`
    std::optional<uint64_t> lowest_in_ranges(const std::vector<Interval>& intervals,
                                             const Category& from, const Category& to) const;

private:
    std::unordered_map<Category, CategoryMap> maps_;
};

} // namespace remap
