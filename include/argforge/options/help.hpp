/*
 * Help formatter - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include "argforge/options/catalogue.hpp"

namespace argforge {

enum class HelpMode { Basic, Advanced };

class HelpFormatter {
public:
    // An empty usage suppresses the banner (shell mode).
    HelpFormatter(const Catalogue& catalogue, std::string prog, std::string usage);

    const std::string& usage() const { return m_usage; }
    std::string format_help(HelpMode mode) const;
    // "<usage>\n\n<prog>: error: <message>\n"
    std::string format_error(const std::string& message) const;

    // "-u URL, --url=URL", cut to fit the invocation column
    static std::string format_invocation(const OptionSpec& spec);
private:
    std::string format_option(const OptionSpec& spec, std::size_t indent) const;

    const Catalogue& m_catalogue;
    std::string m_prog;
    std::string m_usage;
};

// "Usage: <prog> [options]"
std::string default_usage(const std::string& prog);

} // namespace argforge
