/*
 * Condition tests - TPipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <tpipe/cond/condition.hpp>
#include <tpipe/lex/lexer.hpp>
#include <tpipe/parse/parser.hpp>
#include <tpipe/error.hpp>
#include <tpipe/util/text.hpp>

using namespace tpipe;

static Condition cond(const std::string& text) { return parse_condition(Lexer(text).run()); }

TEST(ConditionLen, RangeAndExact) {
    auto c = cond("len 2,3");
    EXPECT_FALSE(c.test("a"));
    EXPECT_TRUE(c.test("ab"));
    EXPECT_TRUE(c.test("abc"));
    EXPECT_FALSE(c.test("abcd"));
    EXPECT_TRUE(cond("len 3").test("abc"));
    EXPECT_TRUE(cond("len =3").test("abc"));
    EXPECT_TRUE(cond("len ,1").test(""));
    EXPECT_TRUE(cond("len 2,").test("abcdef"));
}

TEST(ConditionLen, CountsCharactersNotBytes) {
    EXPECT_TRUE(cond("len =3").test("\xC3\xA0\xC3\xA8\xC3\xAC")); // àèì
}

TEST(ConditionNum, Range) {
    auto c = cond("num 1,5");
    EXPECT_TRUE(c.test("1"));
    EXPECT_TRUE(c.test("4.5"));
    EXPECT_TRUE(c.test("5"));
    EXPECT_FALSE(c.test("5.01"));
    EXPECT_FALSE(c.test("abc"));
    EXPECT_TRUE(cond("num -1.5,0").test("-1"));
    EXPECT_TRUE(cond("num =2").test("2.0"));
    EXPECT_TRUE(cond("num 7").test("+7"));
}

TEST(ConditionNum, Classes) {
    EXPECT_TRUE(cond("num").test("12"));
    EXPECT_TRUE(cond("num").test("1e3"));
    EXPECT_FALSE(cond("num").test("nan"));
    EXPECT_FALSE(cond("num").test("inf"));
    EXPECT_TRUE(cond("num integer").test("-3"));
    EXPECT_FALSE(cond("num integer").test("3.5"));
    EXPECT_TRUE(cond("num float").test("3.5"));
    EXPECT_FALSE(cond("num float").test("3"));
}

TEST(ConditionNot, InvertsUnparsable) {
    EXPECT_TRUE(cond("not num 1,5").test("abc"));
    EXPECT_FALSE(cond("not num 1,5").test("3"));
}

TEST(ConditionNot, DoubleNegationIsIdentity) {
    Condition p = cond("len 1,3");
    Condition np(p.select(), true);
    Condition nnp(np.select(), !np.negated());
    for (const char* s : {"", "a", "abcd", "12"}) EXPECT_EQ(nnp.test(s), p.test(s)) << s;
}

TEST(ConditionText, CaseAsciiBlank) {
    EXPECT_TRUE(cond("upper").test("ABC 1"));
    EXPECT_FALSE(cond("upper").test("AbC"));
    EXPECT_TRUE(cond("lower").test("abc-1"));
    EXPECT_TRUE(cond("ascii").test("plain"));
    EXPECT_FALSE(cond("ascii").test("caf\xC3\xA9"));
    EXPECT_TRUE(cond("nonascii").test("\xC3\xA9\xC3\xA8"));
    EXPECT_FALSE(cond("nonascii").test("caf\xC3\xA9"));
    EXPECT_TRUE(cond("empty").test(""));
    EXPECT_FALSE(cond("empty").test(" "));
    EXPECT_TRUE(cond("blank").test(""));
    EXPECT_TRUE(cond("blank").test(" \t\xE3\x80\x80")); // ideographic space
    EXPECT_FALSE(cond("blank").test(" x "));
}

TEST(ConditionText, CaseCoversNonAsciiLetters) {
    EXPECT_FALSE(cond("lower").test("abc-\xC3\x80"));  // À
    EXPECT_FALSE(cond("upper").test("\xC3\xA9"));       // é
    EXPECT_TRUE(cond("upper").test("\xC3\x89T\xC3\x89")); // ÉTÉ
    EXPECT_TRUE(cond("lower").test("\xCF\x80\xD0\xB6")); // πж
    EXPECT_FALSE(cond("lower").test("\xD0\x96"));       // Ж
    EXPECT_TRUE(cond("upper").test("\xE6\x97\xA5"));   // uncased CJK
    EXPECT_TRUE(text::is_lowercase(U'\u0101'));
    EXPECT_FALSE(text::is_lowercase(U'\u0100'));
    EXPECT_TRUE(text::is_uppercase(U'\u0100'));
}

TEST(ConditionRegex, WholeMatchAndFlags) {
    EXPECT_TRUE(cond("reg a+b").test("aaab"));
    EXPECT_FALSE(cond("reg a+b").test("xaaab"));
    EXPECT_TRUE(cond("reg (?i)abc").test("ABC"));
    EXPECT_FALSE(cond("reg a.b").test("a\nb"));
    EXPECT_TRUE(cond("reg (?s)a.b").test("a\nb"));
    EXPECT_TRUE(cond("reg (?is)A.B").test("a\nb"));
    EXPECT_TRUE(cond("reg [.]x").test(".x"));
}

TEST(ConditionRegex, LongItemDoesNotOverflow) {
    std::string item(200000, 'a');
    EXPECT_TRUE(cond("reg a*").test(item));
    EXPECT_FALSE(cond("reg b*").test(item));
    EXPECT_TRUE(cond("reg (a|b)+").test(item));
}

TEST(ConditionRegex, InvalidPattern) {
    try {
        make_regex_match("a[");
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::ParseRegex);
    }
}

TEST(ConditionDescribe, Text) {
    EXPECT_EQ(cond("num 1,").describe(), "num 1,");
    EXPECT_EQ(cond("not blank").describe(), "not blank");
    EXPECT_EQ(cond("reg x+").describe(), "reg x+");
}
