/*
 * Lexical sanitizer implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/normalize/sanitizer.hpp>
#include <argforge/util/utf8.hpp>
#include <algorithm>

namespace argforge {

static constexpr char32_t kDashes[] = {
    0x2010, 0x2013, 0x2212, 0x2014, 0x4E00, 0x1680, 0xFE63, 0xFF0D,
};

static constexpr char32_t kQuotes[] = {
    0x00AB, 0x2039, 0x00BB, 0x203A, 0x201E, 0x201C, 0x201F, 0x201D, 0x2019, 0x275D, 0x275E,
    0x276E, 0x276F, 0x2E42, 0x301D, 0x301E, 0x301F, 0xFF02, 0x201A, 0x2018, 0x201B, 0x275B,
    0x275C,
};

static constexpr char32_t kFullWidthComma = 0xFF0C;

template <std::size_t N>
static bool one_of(const char32_t (&set)[N], char32_t c) {
    return std::find(std::begin(set), std::end(set), c) != std::end(set);
}

static bool rich_quote(char32_t c) { return c >= 0x2018 && c < 0x2020; }

static bool is_space(char32_t c) { return c == ' ' || (c >= '\t' && c <= '\r'); }

std::string normalize_dashes(const std::string& token) {
    auto u = utf8_decode(token);
    std::size_t n = 0;
    while (n < u.size() && one_of(kDashes, u[n])) ++n;
    if (n == 0) return token;
    return std::string(n, '-') + utf8_encode(u.substr(n));
}

std::string strip_quotes(const std::string& token) {
    auto u = utf8_decode(token);
    std::size_t a = 0, b = u.size();
    while (a < b && one_of(kQuotes, u[a])) ++a;
    while (b > a && one_of(kQuotes, u[b - 1])) --b;
    if (a == 0 && b == u.size()) return token;
    return utf8_encode(u.substr(a, b - a));
}

std::string sanitize_token(const std::string& token) {
    return strip_quotes(normalize_dashes(token));
}

std::optional<Failure> check_illegal_characters(const std::string& token) {
    auto u = utf8_decode(token);
    if (u.size() <= 1) return std::nullopt;

    auto eq = u.find(U'=');
    std::u32string value = eq == std::u32string::npos ? u : u.substr(eq + 1);
    std::size_t a = 0, b = value.size();
    while (a < b && is_space(value[a])) ++a;
    while (b > a && is_space(value[b - 1])) --b;
    char32_t first = a < b ? value[a] : U' ';

    if (rich_quote(first) && rich_quote(u.back()))
        return Failure{ErrorKind::Lexical,
                       "copy-pasting illegal (non-console) quote characters from Internet is illegal (" + token + ")", {}};
    if (value.find(kFullWidthComma) != std::u32string::npos)
        return Failure{ErrorKind::Lexical,
                       "copy-pasting illegal (non-console) comma characters from Internet is illegal (" + token + ")", {}};
    return std::nullopt;
}

} // namespace argforge
