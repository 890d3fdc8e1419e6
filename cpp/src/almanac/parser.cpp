#include "remap/almanac.hpp"
#include "remap/error.hpp"
#include "remap/logging.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace remap::almanac {

namespace {

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Almanac run() {
        Almanac almanac;
        bool seen_seeds = false;

        while (!done()) {
            const Token& token = peek();
            switch (token.kind) {
                case TokenKind::Seeds:
                    if (seen_seeds) {
                        throw ParseError("Seeds declared twice", token.line);
                    }
                    seen_seeds = true;
                    almanac.seeds_line = token.line;
                    almanac.seeds = parse_seeds();
                    break;
                case TokenKind::Map:
                    almanac.blocks.push_back(parse_block());
                    break;
                case TokenKind::Number:
                    throw ParseError("Number outside of a seeds line or map block", token.line);
                case TokenKind::Newline:
                    advance();
                    break;
            }
        }

        if (!seen_seeds) {
            throw ParseError("Missing seeds declaration", last_line(),
                             "Start the document with a 'seeds:' line");
        }
        if (almanac.blocks.empty()) {
            throw ParseError("No map blocks found", last_line());
        }
        return almanac;
    }

private:
    bool done() const { return pos_ >= tokens_.size(); }
    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_++]; }

    size_t last_line() const {
        return tokens_.empty() ? 1 : tokens_.back().line;
    }

    // Numbers after "seeds:" up to the end of the line
    std::vector<uint64_t> parse_seeds() {
        advance();
        std::vector<uint64_t> seeds;
        while (!done() && peek().kind == TokenKind::Number) {
            seeds.push_back(advance().number);
        }
        return seeds;
    }

    RuleBlock parse_block() {
        const Token& header = advance();
        RuleBlock block{header.source, header.target, {}};

        while (!done()) {
            const Token& token = peek();
            if (token.kind == TokenKind::Newline) {
                advance();
                continue;
            }
            if (token.kind != TokenKind::Number) {
                break;
            }
            block.triples.push_back(parse_triple());
        }

        LOG_DEBUG("Parsed ", block.source, "-to-", block.target, " map with ",
                  block.triples.size(), " rules");
        return block;
    }

    RuleTriple parse_triple() {
        size_t line = peek().line;
        uint64_t values[3];
        for (uint64_t& value : values) {
            if (done() || peek().kind != TokenKind::Number || peek().line != line) {
                throw ParseError("Rule line needs three numbers", line,
                                 "Expected 'target-start source-start length'");
            }
            value = advance().number;
        }
        if (!done() && peek().kind == TokenKind::Number && peek().line == line) {
            throw ParseError("Rule line has more than three numbers", line);
        }
        return RuleTriple{values[0], values[1], values[2]};
    }

    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

bool fits(uint64_t start, uint64_t length) {
    return start <= std::numeric_limits<uint64_t>::max() - length;
}

} // namespace

std::vector<RangeRule> RuleBlock::rules() const {
    std::vector<RangeRule> out;
    out.reserve(triples.size());
    for (const auto& t : triples) {
        if (!fits(t.source_start, t.length) || !fits(t.target_start, t.length)) {
            throw InvalidArgumentError("Rule range overflows 64 bits",
                                       source + "-to-" + target + " map");
        }
        out.push_back(RangeRule::from_triple(t.target_start, t.source_start, t.length));
    }
    return out;
}

std::vector<Interval> Almanac::seed_ranges() const {
    if (seeds.size() % 2 != 0) {
        throw ParseError("Seed ranges need (start, length) pairs, got an odd count",
                         seeds_line);
    }

    std::vector<Interval> ranges;
    ranges.reserve(seeds.size() / 2);
    for (size_t i = 0; i < seeds.size(); i += 2) {
        if (!fits(seeds[i], seeds[i + 1])) {
            throw ParseError("Seed range overflows 64 bits", seeds_line);
        }
        ranges.emplace_back(seeds[i], seeds[i] + seeds[i + 1]);
    }
    return ranges;
}

Almanac parse(std::string_view text) {
    return Parser(lex(text)).run();
}

Almanac load_almanac(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Could not read input file", path.string(),
                      "Check that the path exists and is readable");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    LOG_INFO("Loaded ", path.string());
    return parse(buffer.str());
}

Pipeline build_pipeline(const Almanac& almanac) {
    Pipeline pipeline;
    for (const auto& block : almanac.blocks) {
        pipeline.insert(CategoryMap(block.source, block.target, block.rules()));
    }
    LOG_INFO("Built pipeline with ", pipeline.size(), " maps");
    return pipeline;
}

} // namespace remap::almanac
