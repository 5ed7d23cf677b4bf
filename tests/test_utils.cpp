#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <util/ring_buffer.hpp>

TEST(Utils, SplitKeepsEmptyFields) {
    auto parts = split("a||b|", '|');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
}

TEST(Utils, SplitLinesDropsCarriageReturns) {
    auto lines = split_lines("one\r\n\ntwo\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
}

TEST(Utils, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(shell_quote("abc"), "'abc'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote("x; rm -rf /"), "'x; rm -rf /'");
}

TEST(Utils, RandomIdIsHex) {
    auto id = random_id(6);
    EXPECT_EQ(id.size(), 12u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(random_id(), random_id());
}

TEST(Utils, SafeParsesFallBack) {
    EXPECT_EQ(safe_stoi("42", 0), 42);
    EXPECT_EQ(safe_stoi("x", 7), 7);
    EXPECT_DOUBLE_EQ(safe_stod("1.5", 0.0), 1.5);
    EXPECT_DOUBLE_EQ(safe_stod("", -1.0), -1.0);
}

TEST(Utils, IsoRoundTrip) {
    std::time_t t = parse_iso_time("2025-03-01T12:34:56");
    ASSERT_NE(t, 0);
    EXPECT_EQ(format_iso(t), "2025-03-01T12:34:56");
}

TEST(Utils, Trimmed) {
    EXPECT_EQ(trimmed("  a b \r\n"), "a b");
    EXPECT_EQ(trimmed(" \t "), "");
}

// ── RingBuffer ──

TEST(RingBuffer, OverwritesOldest) {
    RingBuffer<int> ring(3);
    for (int i = 1; i <= 5; i++) ring.push(i);
    EXPECT_EQ(ring.size(), 3u);
    EXPECT_EQ(ring.items(), (std::vector<int>{3, 4, 5}));
    EXPECT_EQ(ring.last(2), (std::vector<int>{4, 5}));
}

TEST(RingBuffer, LastMoreThanSize) {
    RingBuffer<int> ring(4);
    ring.push(1);
    EXPECT_EQ(ring.last(10), (std::vector<int>{1}));
    ring.clear();
    EXPECT_TRUE(ring.empty());
}
