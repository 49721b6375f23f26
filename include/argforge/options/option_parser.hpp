/*
 * Option parser - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Consumes an already normalized argument list against the catalogue.
 *   Long options accept "--name=value" and "--name value" and may be
 *   abbreviated to a unique prefix. Short options accept "-xVALUE",
 *   "-x VALUE" and clusters of boolean switches. "--" ends option
 *   processing. Every destination not given receives its default.
 */
#pragma once
#include <string>
#include <vector>
#include "argforge/options/catalogue.hpp"
#include "argforge/outcome.hpp"

namespace argforge {

struct ParsedOptions {
    OptionValues values;
    std::vector<std::string> extras;  // positional tokens, in order
    bool help_requested = false;      // -h/--help seen; parsing stopped there
};

class OptionParser {
public:
    explicit OptionParser(const Catalogue& catalogue) : m_catalogue(catalogue) {}

    // args excludes the program name.
    Result<ParsedOptions> parse(const std::vector<std::string>& args) const;
private:
    struct Cursor {
        const std::vector<std::string>& args;
        std::size_t i;
    };

    std::optional<Failure> parse_long(Cursor& cur, ParsedOptions& out) const;
    std::optional<Failure> parse_short(Cursor& cur, ParsedOptions& out) const;
    std::optional<Failure> store(const OptionSpec& spec, const std::string& shown,
                                 const std::string& raw, ParsedOptions& out) const;
    // Resolves an exact or unambiguous abbreviated long name.
    Result<const OptionSpec*> match_long(const std::string& name) const;

    const Catalogue& m_catalogue;
};

} // namespace argforge
