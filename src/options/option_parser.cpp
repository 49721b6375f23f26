/*
 * Option parser implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/options/option_parser.hpp>

namespace argforge {

static Failure usage_error(std::string msg) { return Failure{ErrorKind::Usage, std::move(msg), {}}; }

static bool is_help_dest(const std::string& dest) { return dest == "help" || dest == "advancedHelp"; }

Result<ParsedOptions> OptionParser::parse(const std::vector<std::string>& args) const {
    ParsedOptions out;
    for (auto* spec : m_catalogue.all()) {
        if (!out.values.has(spec->dest)) out.values.set(spec->dest, spec->default_value);
    }
    Cursor cur{args, 0};
    while (cur.i < args.size()) {
        const std::string& a = args[cur.i];
        if (a == "--") {
            for (++cur.i; cur.i < args.size(); ++cur.i) out.extras.push_back(args[cur.i]);
            break;
        }
        std::optional<Failure> err;
        if (a.rfind("--", 0) == 0) err = parse_long(cur, out);
        else if (a.size() > 1 && a[0] == '-') err = parse_short(cur, out);
        else { out.extras.push_back(a); ++cur.i; }
        if (err) return *err;
        if (out.help_requested) break;
    }
    return out;
}

Result<const OptionSpec*> OptionParser::match_long(const std::string& name) const {
    if (auto* spec = m_catalogue.find(name)) return spec;
    auto candidates = m_catalogue.long_names_with_prefix(name);
    if (candidates.size() == 1) return m_catalogue.find(candidates.front());
    if (candidates.empty()) return usage_error("no such option: " + name);
    std::string list;
    for (auto &c : candidates) { if (!list.empty()) list += ", "; list += c; }
    return usage_error("ambiguous option: " + name + " (" + list + "?)");
}

std::optional<Failure> OptionParser::parse_long(Cursor& cur, ParsedOptions& out) const {
    const std::string& a = cur.args[cur.i++];
    std::string name = a;
    std::optional<std::string> inline_value;
    auto eq = a.find('=');
    if (eq != std::string::npos) { name = a.substr(0, eq); inline_value = a.substr(eq + 1); }

    auto matched = match_long(name);
    if (auto* f = std::get_if<Failure>(&matched)) return *f;
    const OptionSpec& spec = *std::get<const OptionSpec*>(matched);
    // messages name the full option, not the abbreviation typed
    std::string shown = name;
    for (auto &n : spec.names) if (n.rfind(name, 0) == 0 && n.rfind("--", 0) == 0) { shown = n; break; }

    if (!spec.takes_value()) {
        if (inline_value) return usage_error(shown + " option does not take a value");
        if (is_help_dest(spec.dest)) { out.help_requested = true; return std::nullopt; }
        out.values.set(spec.dest, true);
        return std::nullopt;
    }
    if (inline_value) return store(spec, shown, *inline_value, out);
    if (cur.i >= cur.args.size()) return usage_error(shown + " option requires an argument");
    return store(spec, shown, cur.args[cur.i++], out);
}

std::optional<Failure> OptionParser::parse_short(Cursor& cur, ParsedOptions& out) const {
    const std::string& a = cur.args[cur.i++];
    // registered multi-character short names ("-hh") match whole
    if (auto* exact = m_catalogue.find(a); exact && !exact->takes_value() && a.size() > 2) {
        if (is_help_dest(exact->dest)) out.help_requested = true;
        else out.values.set(exact->dest, true);
        return std::nullopt;
    }
    for (std::size_t k = 1; k < a.size(); ++k) {
        std::string opt = std::string("-") + a[k];
        const OptionSpec* spec = m_catalogue.find(opt);
        if (!spec) return usage_error("no such option: " + opt);
        if (spec->takes_value()) {
            if (k + 1 < a.size()) return store(*spec, opt, a.substr(k + 1), out);
            if (cur.i >= cur.args.size()) return usage_error(opt + " option requires an argument");
            return store(*spec, opt, cur.args[cur.i++], out);
        }
        if (is_help_dest(spec->dest)) { out.help_requested = true; return std::nullopt; }
        out.values.set(spec->dest, true);
    }
    return std::nullopt;
}

std::optional<Failure> OptionParser::store(const OptionSpec& spec, const std::string& shown,
                                           const std::string& raw, ParsedOptions& out) const {
    auto value = convert_value(spec.type, raw);
    if (!value) {
        const char* what = spec.type == ValueType::Integer ? "integer" : "floating-point";
        return usage_error("option " + shown + ": invalid " + what + " value: '" + raw + "'");
    }
    out.values.set(spec.dest, std::move(*value));
    return std::nullopt;
}

} // namespace argforge
