#include "remap/category_map.hpp"
#include "remap/error.hpp"
#include "remap/logging.hpp"

#include <algorithm>
#include <sstream>

namespace remap {

static void validate_rule(const RangeRule& rule, const Category& source, size_t position) {
    auto describe = [&]() {
        std::ostringstream os;
        os << source << " rule #" << position << " " << rule;
        return os.str();
    };

    if (rule.source.start > rule.source.end || rule.target.start > rule.target.end) {
        throw InvalidArgumentError("Inverted rule interval", describe());
    }
    if (rule.source.length() != rule.target.length()) {
        throw InvalidArgumentError("Rule source and target lengths differ", describe(),
                                   "Each rule must shift a range without resizing it");
    }
}

CategoryMap::CategoryMap(Category source, Category target, std::vector<RangeRule> rules)
    : source_(std::move(source))
    , target_(std::move(target))
    , rules_(std::move(rules)) {
    REMAP_CHECK_ARGUMENT(!source_.empty() && !target_.empty(), "Category names must not be empty");

    for (size_t i = 0; i < rules_.size(); ++i) {
        validate_rule(rules_[i], source_, i);
        index_.insert(rules_[i]);
    }

    LOG_DEBUG("Built ", source_, " -> ", target_, " map: ", rules_.size(),
              " rules, index height ", index_.height());
}

std::optional<Value> CategoryMap::value_for(const Value& value) const {
    if (value.category != source_) {
        return std::nullopt;
    }

    auto it = std::find_if(rules_.begin(), rules_.end(), [&](const RangeRule& rule) {
        return rule.source.contains(value.number);
    });
    if (it != rules_.end()) {
        return Value{target_, it->apply(value.number)};
    }
    return Value{target_, value.number};
}

std::vector<Interval> CategoryMap::ranges_for(const Interval& query) const {
    std::vector<Interval> pieces;
    if (query.empty()) {
        return pieces;
    }

    std::vector<IndexMatch> matches = index_.find_intersections(query);
    std::sort(matches.begin(), matches.end(), [](const IndexMatch& a, const IndexMatch& b) {
        return a.source.start < b.source.start;
    });

    // Walk the query left to right; `cursor` is the first source value not yet emitted
    uint64_t cursor = query.start;
    for (const auto& match : matches) {
        if (match.source.end <= cursor) {
            // Fully shadowed by an earlier overlapping rule
            continue;
        }
        if (match.source.start > cursor) {
            pieces.emplace_back(cursor, match.source.start);
            cursor = match.source.start;
        }
        // Trim the part an earlier rule already covered
        uint64_t skip = cursor - match.source.start;
        pieces.emplace_back(match.target.start + skip, match.target.end);
        cursor = match.source.end;
    }

    if (cursor < query.end) {
        pieces.emplace_back(cursor, query.end);
    }
    return pieces;
}

} // namespace remap
