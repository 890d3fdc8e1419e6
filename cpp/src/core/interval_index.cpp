#include "remap/interval_index.hpp"
#include "remap/interval.hpp"

#include <algorithm>

namespace remap {

struct IntervalIndex::Node {
    RangeRule rule;
    uint64_t max_end;
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;

    explicit Node(const RangeRule& r) : rule(r), max_end(r.source.end) {}
};

IntervalIndex::IntervalIndex() = default;

IntervalIndex::IntervalIndex(const std::vector<RangeRule>& rules) {
    for (const auto& rule : rules) {
        insert(rule);
    }
}

IntervalIndex::~IntervalIndex() = default;
IntervalIndex::IntervalIndex(IntervalIndex&&) noexcept = default;
IntervalIndex& IntervalIndex::operator=(IntervalIndex&&) noexcept = default;

void IntervalIndex::insert(const RangeRule& rule) {
    ++size_;
    if (!root_) {
        root_ = std::make_unique<Node>(rule);
        return;
    }

    Node* node = root_.get();
    for (;;) {
        node->max_end = std::max(node->max_end, rule.source.end);

        std::unique_ptr<Node>& child =
            rule.source.start < node->rule.source.start ? node->left : node->right;
        if (!child) {
            child = std::make_unique<Node>(rule);
            return;
        }
        node = child.get();
    }
}

// Recursion depth equals tree height (up to the rule count for sorted input)
void IntervalIndex::collect_intersections(const Node* node, const Interval& query,
                                         std::vector<IndexMatch>& out) {
    // Nothing in this subtree reaches the query
    if (!node || node->max_end <= query.start) {
        return;
    }

    collect_intersections(node->left.get(), query, out);

    if (auto clipped = intersect(node->rule.source, query)) {
        if (auto mapped = subrange_map(node->rule, *clipped)) {
            out.push_back(IndexMatch{*clipped, *mapped});
        }
    }

    // Right descendants all start at or after this node
    if (query.end > node->rule.source.start) {
        collect_intersections(node->right.get(), query, out);
    }
}

std::vector<IndexMatch> IntervalIndex::find_intersections(const Interval& query) const {
    std::vector<IndexMatch> matches;
    if (query.empty()) {
        return matches;
    }
    collect_intersections(root_.get(), query, matches);
    return matches;
}

const RangeRule* IntervalIndex::find_overlapping(const Interval& query) const {
    const Node* node = root_.get();
    while (node) {
        if (overlaps(node->rule.source, query)) {
            return &node->rule;
        }
        if (node->left && node->left->max_end > query.start) {
            node = node->left.get();
        } else {
            node = node->right.get();
        }
    }
    return nullptr;
}

void IntervalIndex::visit_in_order(const Node* node, size_t depth, const Visitor& visit) {
    if (!node) return;
    visit_in_order(node->left.get(), depth + 1, visit);
    visit(node->rule, node->max_end, depth);
    visit_in_order(node->right.get(), depth + 1, visit);
}

void IntervalIndex::for_each_in_order(const Visitor& visit) const {
    visit_in_order(root_.get(), 0, visit);
}

uint64_t IntervalIndex::max_end() const noexcept {
    return root_ ? root_->max_end : 0;
}

size_t IntervalIndex::height_of(const Node* node) noexcept {
    if (!node) return 0;
    return 1 + std::max(height_of(node->left.get()), height_of(node->right.get()));
}

size_t IntervalIndex::height() const noexcept {
    return height_of(root_.get());
}

} // namespace remap
