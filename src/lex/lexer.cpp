/*
 * argforge Lexer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Converts a typed option line into a TokenStream of words.
 *              See header for the quoting rules.
 */
#include <cctype>
#include <argforge/lex/lexer.hpp>

namespace argforge {

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

char Lexer::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Lexer::eof() const { return m_pos >= m_input.size(); }

void Lexer::skip_space() { while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) get(); }

Token Lexer::lex_word() {
    std::size_t start = m_pos; std::string out; bool in_single=false, in_double=false;
    while (!eof()) {
        char c = peek();
        if (!in_single && !in_double) {
            if (std::isspace(static_cast<unsigned char>(c))) break;
            if (c=='\'') { in_single=true; get(); continue; }
            if (c=='"') { in_double=true; get(); continue; }
            if (c=='\\') {
                get();
                if (eof()) { m_error = "No escaped character"; return {TokenKind::Invalid, out, start}; }
                out.push_back(get()); continue;
            }
            out.push_back(get());
        } else if (in_single) {
            get(); if (c=='\'') { in_single=false; continue; } out.push_back(c);
        } else {
            get(); if (c=='"') { in_double=false; continue; }
            if (c=='\\' && !eof()) { char n=peek(); if (n=='"'||n=='\\') { out.push_back(n); get(); continue; }}
            out.push_back(c);
        }
    }
    if (in_single || in_double) { m_error = "No closing quotation"; return {TokenKind::Invalid, out, start}; }
    return {TokenKind::Word, out, start};
}

Token Lexer::next() {
    skip_space(); if (eof()) return {TokenKind::Eof, "", m_pos};
    return lex_word();
}

TokenStream Lexer::run() {
    TokenStream ts;
    while (true) {
        Token t = next(); ts.push_back(t);
        if (t.kind==TokenKind::Eof || t.kind==TokenKind::Invalid) break;
    }
    return ts;
}

SplitResult split_command_line(const std::string& line) {
    Lexer lx(line);
    SplitResult res;
    for (auto &t : lx.run()) {
        if (t.kind == TokenKind::Word) res.words.push_back(t.lexeme);
        else if (t.kind == TokenKind::Invalid) { res.error = lx.error(); res.words.clear(); }
    }
    return res;
}

} // namespace argforge
