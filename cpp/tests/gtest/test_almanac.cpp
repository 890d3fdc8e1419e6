// =============================================================================
// Almanac Parsing Tests
// =============================================================================

#include <gtest/gtest.h>
#include "remap/almanac.hpp"
#include "remap/error.hpp"

#include <string>

using namespace remap;
using namespace remap::almanac;

#ifndef REMAP_TEST_DATA_DIR
#define REMAP_TEST_DATA_DIR "tests/data"
#endif

class AlmanacTest : public ::testing::Test {
protected:
    void SetUp() override {
        doc_ = load_almanac(std::string(REMAP_TEST_DATA_DIR) + "/sample_almanac.txt");
    }

    Almanac doc_;
};

TEST(LexerTest, Tokens) {
    auto tokens = lex("seeds: 1 22\n\nseed-to-soil map:\n3 4 5\n");
    ASSERT_EQ(tokens.size(), 11u);

    EXPECT_EQ(tokens[0].kind, TokenKind::Seeds);
    EXPECT_EQ(tokens[1].kind, TokenKind::Number);
    EXPECT_EQ(tokens[1].number, 1u);
    EXPECT_EQ(tokens[2].number, 22u);
    EXPECT_EQ(tokens[3].kind, TokenKind::Newline);
    EXPECT_EQ(tokens[4].kind, TokenKind::Newline);

    EXPECT_EQ(tokens[5].kind, TokenKind::Map);
    EXPECT_EQ(tokens[5].source, "seed");
    EXPECT_EQ(tokens[5].target, "soil");
    EXPECT_EQ(tokens[5].line, 3u);

    EXPECT_EQ(tokens[9].number, 5u);
    EXPECT_EQ(tokens[9].line, 4u);
}

TEST(LexerTest, IgnoresUnknownWordsAndPunctuation) {
    auto tokens = lex("hello, world! 7;");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].number, 7u);
}

TEST(LexerTest, NumberOverflow) {
    EXPECT_NO_THROW(lex("18446744073709551615"));
    EXPECT_THROW(lex("18446744073709551616"), ParseError);
}

TEST_F(AlmanacTest, ParsesSeedsAndBlocks) {
    EXPECT_EQ(doc_.seeds, (std::vector<uint64_t>{79, 14, 55, 13}));
    ASSERT_EQ(doc_.blocks.size(), 7u);

    EXPECT_EQ(doc_.blocks[0].source, "seed");
    EXPECT_EQ(doc_.blocks[0].target, "soil");
    ASSERT_EQ(doc_.blocks[0].triples.size(), 2u);
    EXPECT_EQ(doc_.blocks[0].triples[1].target_start, 52u);
    EXPECT_EQ(doc_.blocks[0].triples[1].source_start, 50u);
    EXPECT_EQ(doc_.blocks[0].triples[1].length, 48u);

    EXPECT_EQ(doc_.blocks[6].source, "humidity");
    EXPECT_EQ(doc_.blocks[6].target, "location");
}

TEST_F(AlmanacTest, SeedRanges) {
    auto ranges = doc_.seed_ranges();
    std::vector<Interval> expected = {{79, 93}, {55, 68}};
    EXPECT_EQ(ranges, expected);
}

TEST_F(AlmanacTest, TraceSingleSeed) {
    Pipeline pipeline = build_pipeline(doc_);
    EXPECT_EQ(pipeline.size(), 7u);

    auto path = pipeline.chain("seed", "location");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 8u);

    const std::vector<uint64_t> expected = {79, 81, 81, 81, 74, 78, 78, 82};
    for (size_t i = 0; i < path->size(); ++i) {
        auto mapped = pipeline.map({"seed", 79}, (*path)[i]);
        ASSERT_TRUE(mapped.has_value());
        EXPECT_EQ(mapped->number, expected[i]) << "at " << (*path)[i];
    }
}

TEST_F(AlmanacTest, LowestLocationFromSeeds) {
    Pipeline pipeline = build_pipeline(doc_);

    std::vector<uint64_t> locations;
    for (uint64_t seed : doc_.seeds) {
        locations.push_back(pipeline.map({"seed", seed}, "location")->number);
    }
    EXPECT_EQ(locations, (std::vector<uint64_t>{82, 43, 86, 35}));

    auto lowest = pipeline.lowest(doc_.seeds, "seed", "location");
    ASSERT_TRUE(lowest.has_value());
    EXPECT_EQ(*lowest, 35u);
}

TEST_F(AlmanacTest, LowestLocationFromSeedRanges) {
    Pipeline pipeline = build_pipeline(doc_);
    auto lowest = pipeline.lowest_in_ranges(doc_.seed_ranges(), "seed", "location");
    ASSERT_TRUE(lowest.has_value());
    EXPECT_EQ(*lowest, 46u);
}

TEST_F(AlmanacTest, RangeWalkConservesSeedCount) {
    Pipeline pipeline = build_pipeline(doc_);
    for (const auto& range : doc_.seed_ranges()) {
        auto pieces = pipeline.map_range(range, "seed", "location");
        ASSERT_TRUE(pieces.has_value());
        uint64_t total = 0;
        for (const auto& piece : *pieces) total += piece.length();
        EXPECT_EQ(total, range.length());
    }
}

TEST(AlmanacParseTest, ShortRuleLine) {
    const char* text = "seeds: 1\n\na-to-b map:\n1 2\n3 4 5\n";
    try {
        parse(text);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 4u);
    }
}

TEST(AlmanacParseTest, LongRuleLine) {
    EXPECT_THROW(parse("seeds: 1\na-to-b map:\n1 2 3 4\n"), ParseError);
}

TEST(AlmanacParseTest, MissingSeeds) {
    EXPECT_THROW(parse("a-to-b map:\n1 2 3\n"), ParseError);
}

TEST(AlmanacParseTest, RepeatedSeeds) {
    EXPECT_THROW(parse("seeds: 1\nseeds: 2\na-to-b map:\n1 2 3\n"), ParseError);
}

TEST(AlmanacParseTest, MissingMaps) {
    EXPECT_THROW(parse("seeds: 1 2 3\n"), ParseError);
}

TEST(AlmanacParseTest, OddSeedCountHasNoRanges) {
    Almanac doc = parse("seeds: 1 2 3\na-to-b map:\n1 2 3\n");
    EXPECT_EQ(doc.seeds.size(), 3u);
    EXPECT_THROW(doc.seed_ranges(), ParseError);
}

TEST(AlmanacParseTest, EmptyBlockBuildsIdentityMap) {
    Almanac doc = parse("seeds: 4\na-to-b map:\n\nb-to-c map:\n10 0 10\n");
    ASSERT_EQ(doc.blocks.size(), 2u);
    EXPECT_TRUE(doc.blocks[0].triples.empty());

    Pipeline pipeline = build_pipeline(doc);
    auto mapped = pipeline.map({"a", 4}, "c");
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped->number, 14u);
}

TEST(AlmanacParseTest, DuplicateBlockRejected) {
    Almanac doc = parse("seeds: 1\na-to-b map:\n1 2 3\na-to-c map:\n4 5 6\n");
    EXPECT_THROW(build_pipeline(doc), InvalidArgumentError);
}

TEST(AlmanacParseTest, OverflowingRuleRejected) {
    Almanac doc = parse("seeds: 1\na-to-b map:\n0 18446744073709551615 2\n");
    EXPECT_THROW(build_pipeline(doc), InvalidArgumentError);
}

TEST(AlmanacLoadTest, MissingFile) {
    EXPECT_THROW(load_almanac("/nonexistent/almanac.txt"), IOError);
}
