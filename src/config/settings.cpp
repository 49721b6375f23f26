/*
 * Runtime settings implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/config/settings.hpp>
#include <argforge/util/console.hpp>
#include <cctype>
#include <charconv>
#include <fstream>

namespace argforge {

static std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b = s.size(); while (b > a && std::isspace((unsigned char)s[b - 1])) --b;
    return s.substr(a, b - a);
}

static bool truthy(const std::string& v) { return v == "1" || v == "true" || v == "on" || v == "yes"; }

std::string default_home_dir() {
    std::string env = getenv_or("ARGFORGE_HOME");
    if (!env.empty()) return env;
#ifdef _WIN32
    std::string base = getenv_or("LOCALAPPDATA", getenv_or("USERPROFILE", "."));
    return base + "\\argforge";
#else
    std::string base = getenv_or("XDG_DATA_HOME");
    if (!base.empty()) return base + "/argforge";
    return getenv_or("HOME", ".") + "/.local/share/argforge";
#endif
}

Settings parse_settings(std::istream& in, Settings base) {
    Settings cfg = std::move(base);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq + 1));
        if (key == "color") cfg.color = truthy(val);
        else if (key == "prompt") cfg.prompt = val.empty() ? cfg.prompt : val + " ";
        else if (key == "home_dir") cfg.home_dir = val;
        else if (key == "non_interactive") cfg.non_interactive = truthy(val);
        else if (key == "history_length") {
            std::size_t n = 0;
            auto [p, ec] = std::from_chars(val.data(), val.data() + val.size(), n);
            if (ec == std::errc() && p == val.data() + val.size() && n > 0) cfg.history_length = n;
            else log_warning("ignoring invalid history_length '" + val + "' in configuration");
        }
    }
    return cfg;
}

Settings load_settings() {
    Settings cfg;
    std::string home = getenv_or("HOME");
    if (!home.empty()) {
        std::ifstream in(home + "/.argforgerc");
        if (in) cfg = parse_settings(in, cfg);
    }
    std::string env = getenv_or("ARGFORGE_HOME");
    if (!env.empty()) cfg.home_dir = env;
    if (cfg.home_dir.empty()) cfg.home_dir = default_home_dir();
    return cfg;
}

} // namespace argforge
