/*
 * TPipe Token Reader
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Splits a pipeline written as one string (the --eval form) into words
 *   following POSIX-shell-like quoting: unquoted runs end at whitespace,
 *   "..." honors backslash escapes, '...' is literal. Words are classified
 *   as command tokens or argument words. classify_args applies the same
 *   classification to words that already arrive split (process argv).
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include "tpipe/parse/tokens.hpp"

namespace tpipe {

// ':' followed by one or more of [A-Za-z0-9_.-]
bool is_command_text(std::string_view s);

class Lexer {
public:
    explicit Lexer(std::string input);
    // Throws Error(ParseToken) on an unterminated quote.
    TokenStream run();
private:
    Token next();
    char peek() const;
    char get();
    bool eof() const;
    void skip_space();
    Token lex_word();
    void lex_escape(std::string& out);

    std::string m_input;
    std::size_t m_pos = 0; // current index
};

// Classify already-split words (argv): "::x" and "\:x" become the literal ":x",
// "\[" and "\]" literal brackets.
TokenStream classify_args(const std::vector<std::string>& args);

} // namespace tpipe
