/*
 * argforge Token Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines token kinds and the Token structure produced when a line typed at
 *   the interactive prompt is split into words. Operators carry no meaning in
 *   an option line, so every token is a word, the end marker, or an error.
 *
 * License (MIT): (see full text in lexer.hpp header)
 */
#pragma once
#include <string>
#include <cstddef>
#include <vector>

namespace argforge {

enum class TokenKind {
    Word,
    Eof,
    Invalid
};

struct Token {
    TokenKind kind;
    std::string lexeme;
    std::size_t pos;
};

using TokenStream = std::vector<Token>;

} // namespace argforge
