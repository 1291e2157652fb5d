/*
 * Parser tests - TPipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <tpipe/lex/lexer.hpp>
#include <tpipe/parse/parser.hpp>
#include <tpipe/parse/ast.hpp>
#include <tpipe/error.hpp>

using namespace tpipe;

static PipelineNode parse(const std::string& line) {
    Lexer lx(line);
    return parse_tokens(lx.run());
}

static ErrorCode parse_error(const std::string& line) {
    try {
        parse(line);
    } catch (const Error& e) {
        return e.code();
    }
    ADD_FAILURE() << "no error for: " << line;
    return ErrorCode::ParseToken;
}

TEST(ParserBasic, EmptyMeansStdinToStdout) {
    auto p = parse("");
    EXPECT_TRUE(std::holds_alternative<StdInInput>(p.input));
    EXPECT_TRUE(p.ops.empty());
    EXPECT_TRUE(std::holds_alternative<StdOutOutput>(p.output));
}

TEST(ParserBasic, FullPipeline) {
    auto p = parse(":of a b c :upper :join - :to file out.txt append crlf");
    auto* of = std::get_if<OfInput>(&p.input);
    ASSERT_TRUE(of);
    EXPECT_EQ(of->values, (std::vector<std::string>{"a", "b", "c"}));
    ASSERT_EQ(p.ops.size(), 2u);
    EXPECT_EQ(std::get<CaseOp>(p.ops[0]).mode, CaseMode::Upper);
    EXPECT_EQ(std::get<JoinOp>(p.ops[1]).delim, "-");
    auto* f = std::get_if<FileOutput>(&p.output);
    ASSERT_TRUE(f);
    EXPECT_EQ(f->target.path, "out.txt");
    EXPECT_TRUE(f->target.append);
    EXPECT_EQ(f->target.ending, LineEnding::Crlf);
}

TEST(ParserBasic, CommandNamesIgnoreCase) {
    auto p = parse(":OF x :Upper");
    EXPECT_TRUE(std::holds_alternative<OfInput>(p.input));
    ASSERT_EQ(p.ops.size(), 1u);
}

TEST(ParserInput, BracketList) {
    auto p = parse(":of [ :x a ] :lower");
    auto& of = std::get<OfInput>(p.input);
    EXPECT_EQ(of.values, (std::vector<std::string>{":x", "a"}));
    EXPECT_EQ(p.ops.size(), 1u);
}

TEST(ParserInput, Gen) {
    auto p = parse(":gen 0,=10,-5 {v:03}");
    auto& g = std::get<GenInput>(p.input);
    EXPECT_EQ(g.range.start, 0);
    EXPECT_EQ(g.range.end, 10);
    EXPECT_TRUE(g.range.included);
    EXPECT_EQ(g.range.step, -5);
    ASSERT_TRUE(g.fmt);
    EXPECT_EQ(*g.fmt, "{v:03}");
}

TEST(ParserInput, RepeatCount) {
    auto r = std::get<RepeatInput>(parse(":repeat x 3").input);
    EXPECT_EQ(r.value, "x");
    ASSERT_TRUE(r.count);
    EXPECT_EQ(*r.count, 3u);
    EXPECT_FALSE(std::get<RepeatInput>(parse(":repeat x").input).count);
}

TEST(ParserOp, ReplaceZeroCount) {
    auto p = parse(":replace a b 0");
    auto& r = std::get<ReplaceOp>(p.ops[0]);
    ASSERT_TRUE(r.count);
    EXPECT_EQ(*r.count, 0u);
}

TEST(ParserOp, ReplaceAndTrim) {
    auto p = parse(":replace a b 2 nocase :trimc xy :ltrim");
    auto& r = std::get<ReplaceOp>(p.ops[0]);
    EXPECT_EQ(r.from, "a");
    EXPECT_EQ(r.to, "b");
    ASSERT_TRUE(r.count);
    EXPECT_EQ(*r.count, 2u);
    EXPECT_TRUE(r.nocase);
    auto& t = std::get<TrimOp>(p.ops[1]);
    EXPECT_TRUE(t.char_mode);
    EXPECT_EQ(t.pos, TrimPos::Both);
    EXPECT_EQ(*t.pattern, "xy");
    auto& l = std::get<TrimOp>(p.ops[2]);
    EXPECT_EQ(l.pos, TrimPos::Start);
    EXPECT_FALSE(l.pattern);
}

TEST(ParserOp, LimitAndSkipBecomeSlices) {
    auto p = parse(":limit 3 :skip 2 :limit 0");
    auto& lim = std::get<SliceOp>(p.ops[0]);
    ASSERT_EQ(lim.ranges.size(), 1u);
    EXPECT_FALSE(lim.ranges[0].min);
    EXPECT_EQ(*lim.ranges[0].max, 2u);
    auto& skip = std::get<SliceOp>(p.ops[1]);
    EXPECT_EQ(*skip.ranges[0].min, 2u);
    EXPECT_FALSE(skip.ranges[0].max);
    EXPECT_TRUE(std::get<SliceOp>(p.ops[2]).ranges.empty());
}

TEST(ParserOp, SliceRanges) {
    auto s = std::get<SliceOp>(parse(":slice 0,5 7, ,2 4").ops[0]);
    ASSERT_EQ(s.ranges.size(), 4u);
    EXPECT_EQ(*s.ranges[3].min, 4u);
    EXPECT_EQ(*s.ranges[3].max, 4u);
    EXPECT_FALSE(s.ranges[1].max);
    EXPECT_FALSE(s.ranges[2].min);
}

TEST(ParserOp, TakeWhileCondition) {
    auto p = parse(":take while not num 1,5 :drop blank");
    auto& t = std::get<TakeDropOp>(p.ops[0]);
    EXPECT_EQ(t.mode, TakeDropMode::TakeWhile);
    EXPECT_TRUE(t.cond.negated());
    EXPECT_TRUE(std::holds_alternative<NumRange>(t.cond.select()));
    EXPECT_EQ(std::get<TakeDropOp>(p.ops[1]).mode, TakeDropMode::Drop);
}

TEST(ParserOp, NumConditionLeavesForeignWord) {
    // `x` is not a number spec, so it is left over and rejected
    EXPECT_EQ(parse_error(":take num x"), ErrorCode::UnexpectedRemaining);
    auto p = parse(":take num :count");
    EXPECT_EQ(p.ops.size(), 2u);
}

TEST(ParserOp, Sort) {
    auto p = parse(":sort num 10 desc :sort random :sort nocase");
    auto& a = std::get<SortOp>(p.ops[0]);
    EXPECT_EQ(a.by, SortBy::Num);
    EXPECT_EQ(*a.int_default, 10);
    EXPECT_TRUE(a.desc);
    EXPECT_EQ(std::get<SortOp>(p.ops[1]).by, SortBy::Random);
    EXPECT_TRUE(std::get<SortOp>(p.ops[2]).nocase);
}

TEST(ParserOp, JoinBatch) {
    auto j = std::get<JoinOp>(parse(":join , < > 3").ops[0]);
    EXPECT_EQ(j.delim, ",");
    EXPECT_EQ(j.prefix, "<");
    EXPECT_EQ(j.postfix, ">");
    EXPECT_EQ(*j.batch, 3u);
}

TEST(ParserOutput, ClipCrlf) {
    auto p = parse(":of a :to clip crlf");
    EXPECT_EQ(std::get<ClipOutput>(p.output).ending, LineEnding::Crlf);
}

TEST(ParserCondition, LoneCondition) {
    auto c = parse_condition(Lexer("not len =3").run());
    EXPECT_TRUE(c.negated());
    EXPECT_EQ(c.describe(), "not len =3");
    EXPECT_THROW(parse_condition(Lexer("not not len =3").run()), Error);
    EXPECT_THROW(parse_condition(Lexer("len 3 extra").run()), Error);
}

TEST(ParserError, Codes) {
    EXPECT_EQ(parse_error(":of"), ErrorCode::MissingArg);
    EXPECT_EQ(parse_error(":of [ a"), ErrorCode::ArgParse);
    EXPECT_EQ(parse_error(":gen x"), ErrorCode::ArgParse);
    EXPECT_EQ(parse_error(":gen 0,5,0"), ErrorCode::ArgParse);
    EXPECT_EQ(parse_error(":gen 0,5 {x}"), ErrorCode::FormatString);
    EXPECT_EQ(parse_error(":limit -1"), ErrorCode::InvalidNonNegativeIntArg);
    EXPECT_EQ(parse_error(":limit abc"), ErrorCode::ParseNum);
    EXPECT_EQ(parse_error(":join , a b 0"), ErrorCode::InvalidPositiveIntArg);
    EXPECT_EQ(parse_error(":replace a b -1"), ErrorCode::InvalidNonNegativeIntArg);
    EXPECT_EQ(parse_error(":take reg ("), ErrorCode::ParseRegex);
    EXPECT_EQ(parse_error(":take bogus"), ErrorCode::ArgParse);
    EXPECT_EQ(parse_error(":to nowhere"), ErrorCode::ArgParse);
    EXPECT_EQ(parse_error(":to file"), ErrorCode::MissingArg);
    EXPECT_EQ(parse_error(":upper :gen 1,2"), ErrorCode::UnexpectedRemaining);
    EXPECT_EQ(parse_error(":nosuch"), ErrorCode::UnexpectedRemaining);
    EXPECT_EQ(parse_error(":to out extra"), ErrorCode::UnexpectedRemaining);
}
