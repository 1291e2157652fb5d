/*
 * TPipe Token Reader Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Converts a pipeline string into a TokenStream (commands and
 *              argument words). See header for details.
 */
#include <cctype>
#include <tpipe/lex/lexer.hpp>
#include <tpipe/error.hpp>

namespace tpipe {

static bool is_command_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

bool is_command_text(std::string_view s) {
    if (s.size() < 2 || s[0] != ':') return false;
    for (std::size_t i = 1; i < s.size(); ++i) if (!is_command_char(s[i])) return false;
    return true;
}

// Shared by both modes: `text` is the word after quote removal.
static Token classify_word(std::string text, bool quoted, std::size_t pos) {
    if (quoted) return {TokenKind::Word, std::move(text), pos, true};
    if (text == "\\[" || text == "\\]") return {TokenKind::Word, text.substr(1), pos, true};
    if (text.rfind("\\:", 0) == 0 || text.rfind("::", 0) == 0) return {TokenKind::Word, ":" + text.substr(2), pos, true};
    if (is_command_text(text)) return {TokenKind::Command, std::move(text), pos, false};
    return {TokenKind::Word, std::move(text), pos, false};
}

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

char Lexer::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Lexer::eof() const { return m_pos >= m_input.size(); }

void Lexer::skip_space() { while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) get(); }

// Called after a backslash. Returns true if a known escape was translated,
// false if the backslash (and the next char) were kept verbatim.
static bool translate_escape(char n, std::string& out) {
    switch (n) {
        case 'n': out.push_back('\n'); return true;
        case 't': out.push_back('\t'); return true;
        case 'r': out.push_back('\r'); return true;
        case '\\': out.push_back('\\'); return true;
        case '"': out.push_back('"'); return true;
        case ' ': out.push_back(' '); return true;
        default: return false;
    }
}

void Lexer::lex_escape(std::string& out) {
    if (eof()) { out.push_back('\\'); return; } // trailing backslash stays
    char n = get();
    if (!translate_escape(n, out)) { out.push_back('\\'); out.push_back(n); }
}

Token Lexer::lex_word() {
    std::size_t start = m_pos; std::string out; bool quoted = false;
    while (!eof()) {
        char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) break;
        if (c == '\'') {
            std::size_t open = m_pos; get(); quoted = true;
            while (!eof() && peek() != '\'') out.push_back(get());
            if (eof()) throw Error(ErrorCode::ParseToken, "Unterminated single quote starting at position " + std::to_string(open));
            get();
            continue;
        }
        if (c == '"') {
            std::size_t open = m_pos; get(); quoted = true;
            while (!eof() && peek() != '"') {
                char d = get();
                if (d == '\\') lex_escape(out); else out.push_back(d);
            }
            if (eof()) throw Error(ErrorCode::ParseToken, "Unterminated double quote starting at position " + std::to_string(open));
            get();
            continue;
        }
        if (c == '\\') {
            get();
            // a translated escape makes the word a literal, an unknown one is left for classify_word
            if (!eof() && translate_escape(peek(), out)) { get(); quoted = true; }
            else lex_escape(out);
            continue;
        }
        out.push_back(get());
    }
    return classify_word(std::move(out), quoted, start);
}

Token Lexer::next() {
    skip_space(); if (eof()) return {TokenKind::Eof, "", m_pos};
    return lex_word();
}

TokenStream Lexer::run() {
    TokenStream ts; while (true) { Token t = next(); ts.push_back(t); if (t.kind == TokenKind::Eof) break; }
    return ts;
}

TokenStream classify_args(const std::vector<std::string>& args) {
    TokenStream ts;
    for (std::size_t i = 0; i < args.size(); ++i) ts.push_back(classify_word(args[i], false, i));
    ts.push_back({TokenKind::Eof, "", args.size()});
    return ts;
}

} // namespace tpipe
