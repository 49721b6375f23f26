/*
 * argforge Lexer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Splits a command line typed at the interactive prompt into words using
 *   POSIX shell quoting: single quotes are literal, double quotes honour \" and
 *   \\ escapes, a backslash outside quotes escapes the next character. Quotes
 *   are consumed, never kept in the word. An unterminated quote or a trailing
 *   backslash stops the run with an Invalid token and an error message.
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
#include <vector>
#include <cstddef>
#include "argforge/lex/tokens.hpp"

namespace argforge {

class Lexer {
public:
    explicit Lexer(std::string input);
    TokenStream run();
    const std::string& error() const { return m_error; }
private:
    Token next();
    char peek() const;
    char get();
    bool eof() const;
    void skip_space();
    Token lex_word();

    std::string m_input;
    std::string m_error;
    std::size_t m_pos = 0; // current index
};

struct SplitResult {
    std::vector<std::string> words;
    std::string error;            // empty on success
    bool ok() const { return error.empty(); }
};

// Convenience wrapper: run the lexer and collect the words.
SplitResult split_command_line(const std::string& line);

} // namespace argforge
