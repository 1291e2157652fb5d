/*
 * Format template tests - TPipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <tpipe/fmt/format.hpp>
#include <tpipe/parse/literal.hpp>
#include <tpipe/error.hpp>

using namespace tpipe;

TEST(FormatValue, NamedAndAlignment) {
    EXPECT_EQ(format_value("n={v}", 7), "n=7");
    EXPECT_EQ(format_value("{v:>4}|", 42), "  42|");
    EXPECT_EQ(format_value("{v:05}", -12), "-0012");
    EXPECT_EQ(format_value("{v:+}", 3), "+3");
}

TEST(FormatValue, Radix) {
    EXPECT_EQ(format_value("{v:b}", 5), "101");
    EXPECT_EQ(format_value("{v:#x}", 255), "0xff");
    EXPECT_EQ(format_value("{v:X}", 255), "FF");
    EXPECT_EQ(format_value("{v:o}", 8), "10");
}

TEST(FormatValue, RejectsBadTemplates) {
    for (const char* bad : {"{w}", "{v", "{v:q}"}) {
        try {
            validate_format(bad);
            FAIL() << "accepted: " << bad;
        } catch (const Error& e) {
            EXPECT_EQ(e.code(), ErrorCode::FormatString);
        }
    }
    EXPECT_NO_THROW(validate_format("plain"));
}

TEST(NumLiteral, ParseAndCompare) {
    EXPECT_EQ(parse_integer("-12"), Integer{-12});
    EXPECT_EQ(parse_integer("+5"), Integer{5});
    EXPECT_FALSE(parse_integer("1.0"));
    EXPECT_FALSE(parse_integer("99999999999999999999"));
    EXPECT_FALSE(parse_float("nan"));
    EXPECT_FALSE(parse_float(""));
    EXPECT_FALSE(parse_count("-1"));
    EXPECT_EQ(compare_num(Num{Integer{2}}, Num{Float{2.0}}), 0);
    EXPECT_LT(compare_num(Num{Integer{1}}, Num{Float{1.5}}), 0);
    EXPECT_GT(compare_num(Num{Integer{3}}, Num{Integer{-3}}), 0);
    EXPECT_EQ(num_to_string(Num{Float{1.5}}), "1.5");
}
