/*
 * Replace tests - TPipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <tpipe/op/replace.hpp>

using namespace tpipe;

TEST(ReplaceBasic, AllOccurrences) {
    Replacer r("ab", "X", std::nullopt, false);
    EXPECT_EQ(r.apply("ab-ab-ab"), "X-X-X");
    EXPECT_EQ(r.apply("none"), "none");
}

TEST(ReplaceBasic, NonOverlappingLeftToRight) {
    Replacer r("aa", "b", std::nullopt, false);
    EXPECT_EQ(r.apply("aaa"), "ba");
}

TEST(ReplaceCount, StopsAfterCount) {
    Replacer r("a", "_", 2, false);
    EXPECT_EQ(r.apply("banana"), "b_n_na");
}

TEST(ReplaceCount, ZeroLeavesItemUnchanged) {
    EXPECT_EQ(Replacer("a", "_", 0, false).apply("banana"), "banana");
    EXPECT_EQ(Replacer("", "_", 0, false).apply("ab"), "ab");
}

TEST(ReplaceNocase, FoldsAscii) {
    Replacer r("AB", "x", std::nullopt, true);
    EXPECT_EQ(r.apply("ab Ab aB"), "x x x");
    Replacer strict("AB", "x", std::nullopt, false);
    EXPECT_EQ(strict.apply("ab AB"), "ab x");
}

TEST(ReplaceEmpty, InsertsAtEveryBoundary) {
    Replacer r("", "-", std::nullopt, false);
    EXPECT_EQ(r.apply("abc"), "-a-b-c-");
    EXPECT_EQ(r.apply(""), "-");
    EXPECT_EQ(r.apply("\xC3\xA9"), "-\xC3\xA9-");
    Replacer two("", "-", 2, false);
    EXPECT_EQ(two.apply("abc"), "-a-bc");
}
