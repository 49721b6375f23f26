/*
 * Help formatter implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/options/help.hpp>
#include <argforge/options/schema.hpp>
#include <cctype>
#include <sstream>
#include <vector>

namespace argforge {

static constexpr std::size_t kWidth = 80;
static constexpr std::size_t kHelpColumn = 24;
static constexpr std::size_t kIndentIncrement = 2;

static std::vector<std::string> wrap(const std::string& text, std::size_t width) {
    std::vector<std::string> lines; std::istringstream in(text); std::string word, cur;
    while (in >> word) {
        if (!cur.empty() && cur.size() + 1 + word.size() > width) { lines.push_back(cur); cur.clear(); }
        cur += (cur.empty() ? "" : " ") + word;
    }
    if (!cur.empty()) lines.push_back(cur);
    return lines;
}

static std::string metavar(const std::string& dest) {
    std::string m = dest;
    for (auto &c : m) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return m;
}

std::string default_usage(const std::string& prog) { return "Usage: " + prog + " [options]"; }

HelpFormatter::HelpFormatter(const Catalogue& catalogue, std::string prog, std::string usage)
    : m_catalogue(catalogue), m_prog(std::move(prog)), m_usage(std::move(usage)) {}

std::string HelpFormatter::format_invocation(const OptionSpec& spec) {
    std::string out;
    for (auto &n : spec.names) {
        if (!out.empty()) out += ", ";
        out += n;
        if (spec.takes_value()) out += (n.rfind("--", 0) == 0 ? "=" : " ") + metavar(spec.dest);
    }
    if (out.size() > schema::kMaxHelpOptionLength)
        out = out.substr(0, schema::kMaxHelpOptionLength - kIndentIncrement) + "..";
    return out;
}

std::string HelpFormatter::format_option(const OptionSpec& spec, std::size_t indent) const {
    std::string line = std::string(indent, ' ') + format_invocation(spec);
    auto help = wrap(spec.help, kWidth - kHelpColumn);
    std::string out;
    if (line.size() + 2 > kHelpColumn) { out = line + "\n"; line = std::string(kHelpColumn, ' '); }
    else line += std::string(kHelpColumn - line.size(), ' ');
    if (help.empty()) return out + line.substr(0, line.find_last_not_of(' ') + 1) + "\n";
    out += line + help[0] + "\n";
    for (std::size_t k = 1; k < help.size(); ++k) out += std::string(kHelpColumn, ' ') + help[k] + "\n";
    return out;
}

std::string HelpFormatter::format_help(HelpMode mode) const {
    const auto& basic = schema::basic_help_items();
    std::ostringstream os;
    if (!m_usage.empty()) os << m_usage << "\n\n";
    os << "Options:\n";
    for (auto &g : m_catalogue.groups()) {
        if (!g.title.empty()) continue;
        for (auto &opt : g.options) if (!opt.hidden) os << format_option(opt, kIndentIncrement);
    }
    for (auto &g : m_catalogue.groups()) {
        if (g.title.empty()) continue;
        std::string body;
        for (auto &opt : g.options) {
            if (opt.hidden) continue;
            if (mode == HelpMode::Basic && basic.count(opt.dest) == 0) continue;
            body += format_option(opt, 2 * kIndentIncrement);
        }
        if (body.empty()) continue;
        os << "\n  " << g.title << ":\n";
        if (!g.description.empty()) {
            for (auto &l : wrap(g.description, kWidth - 2 * kIndentIncrement)) os << "    " << l << "\n";
            os << "\n";
        }
        os << body;
    }
    return os.str();
}

std::string HelpFormatter::format_error(const std::string& message) const {
    std::string out;
    if (!m_usage.empty()) out = m_usage + "\n\n";
    return out + m_prog + ": error: " + message + "\n";
}

} // namespace argforge
