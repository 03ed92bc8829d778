//! # Common Definitions Tests
//!
//! Source span merging and the Result helpers.

#include "common.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace irt;

// ============================================================================
// SourceSpan
// ============================================================================

TEST(SourceSpanTest, MergeCoversBothSpans) {
    SourceSpan a{"main.src", {1, 0}, {1, 5}};
    SourceSpan b{"main.src", {2, 0}, {2, 3}};

    SourceSpan merged = SourceSpan::merge(a, b);

    EXPECT_EQ(merged.start, (SourcePos{1, 0}));
    EXPECT_EQ(merged.end, (SourcePos{2, 3}));
    EXPECT_EQ(merged.file, "main.src");
}

TEST(SourceSpanTest, MergeIsOrderIndependentForPositions) {
    SourceSpan a{"main.src", {4, 2}, {6, 1}};
    SourceSpan b{"main.src", {3, 9}, {4, 0}};

    SourceSpan ab = SourceSpan::merge(a, b);
    SourceSpan ba = SourceSpan::merge(b, a);

    EXPECT_EQ(ab.start, (SourcePos{3, 9}));
    EXPECT_EQ(ab.end, (SourcePos{6, 1}));
    EXPECT_EQ(ab.start, ba.start);
    EXPECT_EQ(ab.end, ba.end);
}

TEST(SourceSpanTest, MergeComparesColumnsWithinARow) {
    SourceSpan a{"f", {7, 10}, {7, 12}};
    SourceSpan b{"f", {7, 3}, {7, 20}};

    SourceSpan merged = SourceSpan::merge(a, b);

    EXPECT_EQ(merged.start, (SourcePos{7, 3}));
    EXPECT_EQ(merged.end, (SourcePos{7, 20}));
}

TEST(SourceSpanTest, MergeKeepsFirstFileName) {
    SourceSpan a{"first.src", {1, 0}, {1, 1}};
    SourceSpan b{"second.src", {0, 0}, {9, 9}};

    SourceSpan merged = SourceSpan::merge(a, b);

    EXPECT_EQ(merged.file, "first.src");
    EXPECT_EQ(merged.start, (SourcePos{0, 0}));
    EXPECT_EQ(merged.end, (SourcePos{9, 9}));
}

TEST(SourceSpanTest, UnknownLocation) {
    EXPECT_TRUE(SourceSpan::unknown().is_unknown());
    EXPECT_TRUE(SourceSpan{}.is_unknown());

    SourceSpan known{"x", {1, 1}, {1, 2}};
    EXPECT_FALSE(known.is_unknown());
}

TEST(SourcePosTest, Ordering) {
    EXPECT_TRUE((SourcePos{1, 9}) < (SourcePos{2, 0}));
    EXPECT_TRUE((SourcePos{2, 0}) < (SourcePos{2, 1}));
    EXPECT_FALSE((SourcePos{2, 1}) < (SourcePos{2, 1}));
}

// ============================================================================
// Result
// ============================================================================

static auto parse_positive(int n) -> Result<int> {
    if (n <= 0) {
        return std::string("not positive");
    }
    return n;
}

TEST(ResultTest, OkAndErr) {
    auto ok = parse_positive(3);
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok), 3);

    auto err = parse_positive(-1);
    ASSERT_TRUE(is_err(err));
    EXPECT_EQ(unwrap_err(err), "not positive");
}
