#pragma once

#include "remap/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace remap {

// A piece of a query matched by one rule, in both coordinate spaces
struct IndexMatch {
    Interval source;
    Interval target;
};

/**
 * Augmented binary search tree over translation rules.
 *
 * Nodes are ordered by source.start (equal starts go right) and each node
 * records the largest source.end found in its subtree, which lets queries
 * skip subtrees that end before the query begins. The shape follows
 * insertion order: the first rule becomes the root and nothing is ever
 * rebalanced.
 *
 * Queries, height() and destruction recurse once per level, so rules
 * inserted in source order nest as deep as the rule count. Tables hold
 * tens of rules.
 */
class IntervalIndex {
public:
    using Visitor = std::function<void(const RangeRule& rule, uint64_t max_end, size_t depth)>;

    IntervalIndex();
    explicit IntervalIndex(const std::vector<RangeRule>& rules);
    ~IntervalIndex();

    IntervalIndex(IntervalIndex&&) noexcept;
    IntervalIndex& operator=(IntervalIndex&&) noexcept;
    IntervalIndex(const IntervalIndex&) = delete;
    IntervalIndex& operator=(const IntervalIndex&) = delete;

    void insert(const RangeRule& rule);

    /**
     * Every rule overlapping query, clipped to the query.
     * @return matches in tree order (not sorted by source start)
     */
    std::vector<IndexMatch> find_intersections(const Interval& query) const;

    /**
     * First rule found overlapping query by a single maxEnd-guided descent.
     * @return pointer into the index, or nullptr when nothing overlaps
     */
    const RangeRule* find_overlapping(const Interval& query) const;

    // In-order traversal (ascending source.start)
    void for_each_in_order(const Visitor& visit) const;

    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }
    uint64_t max_end() const noexcept;
    size_t height() const noexcept;

private:
    struct Node;

    static void collect_intersections(const Node* node, const Interval& query,
                                      std::vector<IndexMatch>& out);
    static void visit_in_order(const Node* node, size_t depth, const Visitor& visit);
    static size_t height_of(const Node* node) noexcept;

    std::unique_ptr<Node> root_;
    size_t size_ = 0;
};

} // namespace remap
