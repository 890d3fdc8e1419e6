#include "remap/pipeline.hpp"
#include "remap/error.hpp"
#include "remap/interval.hpp"
#include "remap/logging.hpp"

#include <unordered_set>

namespace remap {

void Pipeline::insert(CategoryMap category_map) {
    Category source = category_map.source();
    auto [it, inserted] = maps_.emplace(source, std::move(category_map));
    if (!inserted) {
        throw InvalidArgumentError("Duplicate map for category '" + source + "'",
                                   "Pipeline::insert",
                                   "Each category may have only one outgoing map");
    }
    LOG_DEBUG("Registered ", source, " -> ", it->second.target());
}

const CategoryMap* Pipeline::find(const Category& category) const {
    auto it = maps_.find(category);
    return it != maps_.end() ? &it->second : nullptr;
}

std::optional<std::vector<Category>> Pipeline::chain(const Category& from, const Category& to) const {
    std::vector<Category> path{from};
    std::unordered_set<Category> visited{from};

    Category current = from;
    while (current != to) {
        const CategoryMap* next = find(current);
        if (!next) {
            LOG_WARN("No map out of '", current, "' before reaching '", to, "'");
            return std::nullopt;
        }
        current = next->target();
        if (!visited.insert(current).second) {
            LOG_WARN("Category cycle at '", current, "' walking ", from, " -> ", to);
            return std::nullopt;
        }
        path.push_back(current);
    }
    return path;
}

std::optional<Value> Pipeline::map(const Value& value, const Category& target) const {
    auto path = chain(value.category, target);
    if (!path) {
        return std::nullopt;
    }

    Value current = value;
    for (size_t hop = 0; hop + 1 < path->size(); ++hop) {
        auto next = find(current.category)->value_for(current);
        if (!next) {
            return std::nullopt;
        }
        LOG_DEBUG(current, " -> ", *next);
        current = std::move(*next);
    }
    return current;
}

std::optional<std::vector<Interval>> Pipeline::map_range(const Interval& interval,
                                                         const Category& source,
                                                         const Category& target) const {
    auto path = chain(source, target);
    if (!path) {
        return std::nullopt;
    }

    std::vector<Interval> working{interval};
    for (size_t hop = 0; hop + 1 < path->size() && !working.empty(); ++hop) {
        const CategoryMap* edge = find((*path)[hop]);

        std::vector<Interval> next;
        for (const auto& piece : working) {
            auto pieces = edge->ranges_for(piece);
            next.insert(next.end(), pieces.begin(), pieces.end());
        }
        LOG_DEBUG(edge->source(), " -> ", edge->target(), ": ", working.size(),
                  " intervals became ", next.size());
        working = std::move(next);
    }
    return working;
}

std::vector<Value> Pipeline::map_all(const std::vector<Value>& values, const Category& target) const {
    std::vector<Value> results;
    results.reserve(values.size());
    for (const auto& value : values) {
        if (auto mapped = map(value, target)) {
            results.push_back(std::move(*mapped));
        }
    }
    return results;
}

std::optional<uint64_t> Pipeline::lowest(const std::vector<uint64_t>& numbers,
                                         const Category& from, const Category& to) const {
    std::optional<uint64_t> best;
    for (uint64_t n : numbers) {
        auto mapped = map(Value{from, n}, to);
        if (mapped && (!best || mapped->number < *best)) {
            best = mapped->number;
        }
    }
    return best;
}

std::optional<uint64_t> Pipeline::lowest_in_ranges(const std::vector<Interval>& intervals,
                                                   const Category& from, const Category& to) const {
    std::optional<uint64_t> best;
    for (const auto& interval : intervals) {
        auto mapped = map_range(interval, from, to);
        if (!mapped) continue;
        auto low = min_start(*mapped);
        if (low && (!best || *low < *best)) {
            best = low;
        }
    }
    return best;
}

} // namespace remap
