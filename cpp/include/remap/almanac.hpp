// =============================================================================
// almanac.hpp - Text format for rule tables and seed declarations
// =============================================================================
// Turns documents of the form
//
//   seeds: 79 14 55 13
//
//   seed-to-soil map:
//   50 98 2
//   52 50 48
//
// into structured rule blocks and builds a Pipeline from them. Each rule line
// is "target-start source-start length". Sits outside the core: nothing in
// the pipeline depends on this header.
// =============================================================================

#pragma once

#include "remap/pipeline.hpp"
#include "remap/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace remap::almanac {

enum class TokenKind {
    Seeds,
    Number,
    Map,
    Newline
};

struct Token {
    TokenKind kind = TokenKind::Newline;
    size_t line = 1;
    uint64_t number = 0;  // Number
    Category source;      // Map
    Category target;      // Map

    static Token at(TokenKind kind, size_t line) {
        Token token;
        token.kind = kind;
        token.line = line;
        return token;
    }
};

/**
 * Split text into tokens. Words other than "seeds" and "X-to-Y map"
 * headers are dropped, as is punctuation.
 * @throws ParseError on a number that does not fit in 64 bits
 */
std::vector<Token> lex(std::string_view text);

struct RuleTriple {
    uint64_t target_start;
    uint64_t source_start;
    uint64_t length;
};

struct RuleBlock {
    Category source;
    Category target;
    std::vector<RuleTriple> triples;

    // @throws InvalidArgumentError if a triple overflows 64 bits
    std::vector<RangeRule> rules() const;
};

struct Almanac {
    std::vector<uint64_t> seeds;
    size_t seeds_line = 1;
    std::vector<RuleBlock> blocks;

    // Seeds read as (start, length) pairs; @throws ParseError on an odd count
    std::vector<Interval> seed_ranges() const;
};

/**
 * @throws ParseError when the seeds line is missing or repeated, there are
 *         no map blocks, or a rule line does not hold exactly three numbers
 */
Almanac parse(std::string_view text);

// @throws IOError if the file cannot be read, ParseError on bad content
Almanac load_almanac(const std::filesystem::path& path);

// @throws InvalidArgumentError on bad rules or two blocks with the same source
Pipeline build_pipeline(const Almanac& almanac);

} // namespace remap::almanac
