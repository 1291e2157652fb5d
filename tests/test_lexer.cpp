/*
 * Lexer tests - TPipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <tpipe/lex/lexer.hpp>
#include <tpipe/parse/tokens.hpp>
#include <tpipe/error.hpp>

using namespace tpipe;

TEST(LexerBasic, CommandsAndWords) {
    Lexer lx(":gen 1,5 :join , [ ]");
    auto ts = lx.run();
    std::vector<TokenKind> kinds;
    for (auto &t : ts) kinds.push_back(t.kind);
    ASSERT_EQ(kinds.size(), 7u);
    EXPECT_EQ(kinds[0], TokenKind::Command);
    EXPECT_EQ(kinds[1], TokenKind::Word);
    EXPECT_EQ(kinds[2], TokenKind::Command);
    EXPECT_EQ(kinds[3], TokenKind::Word);
    EXPECT_EQ(kinds[4], TokenKind::Word);
    EXPECT_EQ(kinds[5], TokenKind::Word);
    EXPECT_EQ(kinds.back(), TokenKind::Eof);
    EXPECT_EQ(ts[0].lexeme, ":gen");
    EXPECT_EQ(ts[1].lexeme, "1,5");
    EXPECT_EQ(ts[2].pos, 9u);
}

TEST(LexerBasic, EmptyInputIsEof) {
    auto ts = Lexer("   ").run();
    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0].kind, TokenKind::Eof);
}

TEST(LexerQuote, QuotedColonIsWord) {
    auto ts = Lexer("':of' \":to\" plain").run();
    ASSERT_EQ(ts.size(), 4u);
    EXPECT_EQ(ts[0].kind, TokenKind::Word);
    EXPECT_EQ(ts[0].lexeme, ":of");
    EXPECT_TRUE(ts[0].quoted);
    EXPECT_EQ(ts[1].kind, TokenKind::Word);
    EXPECT_EQ(ts[1].lexeme, ":to");
    EXPECT_FALSE(ts[2].quoted);
}

TEST(LexerQuote, AdjacentPartsConcatenate) {
    auto ts = Lexer("a'b c'\"d\"").run();
    ASSERT_EQ(ts.size(), 2u);
    EXPECT_EQ(ts[0].lexeme, "ab cd");
}

TEST(LexerQuote, SingleQuotesAreLiteral) {
    auto ts = Lexer(R"('a\nb')").run();
    EXPECT_EQ(ts[0].lexeme, "a\\nb");
}

TEST(LexerEscape, KnownEscapes) {
    auto ts = Lexer(R"("a\tb\"c" x\ y)").run();
    ASSERT_EQ(ts.size(), 3u);
    EXPECT_EQ(ts[0].lexeme, "a\tb\"c");
    EXPECT_EQ(ts[1].lexeme, "x y");
    EXPECT_TRUE(ts[1].quoted);
}

TEST(LexerEscape, UnknownEscapeKeptVerbatim) {
    auto ts = Lexer(R"(\d+ tail\)").run();
    ASSERT_EQ(ts.size(), 3u);
    EXPECT_EQ(ts[0].lexeme, "\\d+");
    EXPECT_EQ(ts[1].lexeme, "tail\\");
}

TEST(LexerEscape, LiteralColonAndBrackets) {
    auto ts = Lexer(R"(::of \:to \[ \])").run();
    ASSERT_EQ(ts.size(), 5u);
    EXPECT_EQ(ts[0].kind, TokenKind::Word);
    EXPECT_EQ(ts[0].lexeme, ":of");
    EXPECT_EQ(ts[1].lexeme, ":to");
    EXPECT_EQ(ts[2].lexeme, "[");
    EXPECT_TRUE(ts[2].quoted);
    EXPECT_EQ(ts[3].lexeme, "]");
}

TEST(LexerError, UnterminatedQuote) {
    try {
        Lexer("a \"open").run();
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::ParseToken);
        EXPECT_NE(std::string(e.what()).find("position 2"), std::string::npos);
    }
    EXPECT_THROW(Lexer("'x").run(), Error);
}

TEST(LexerArgs, ClassifyArgv) {
    auto ts = classify_args({":of", "a b", "::x", ":", "\\]"});
    ASSERT_EQ(ts.size(), 6u);
    EXPECT_EQ(ts[0].kind, TokenKind::Command);
    EXPECT_EQ(ts[1].kind, TokenKind::Word);
    EXPECT_EQ(ts[1].lexeme, "a b");
    EXPECT_EQ(ts[2].lexeme, ":x");
    EXPECT_EQ(ts[2].kind, TokenKind::Word);
    EXPECT_EQ(ts[3].kind, TokenKind::Word); // a lone colon is not a command
    EXPECT_EQ(ts[4].lexeme, "]");
    EXPECT_EQ(ts[5].kind, TokenKind::Eof);
}

TEST(LexerArgs, CommandText) {
    EXPECT_TRUE(is_command_text(":sort"));
    EXPECT_TRUE(is_command_text(":a.b-c_1"));
    EXPECT_FALSE(is_command_text(":"));
    EXPECT_FALSE(is_command_text("sort"));
    EXPECT_FALSE(is_command_text(":a b"));
}
