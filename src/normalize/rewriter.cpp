/*
 * Argv rewriter implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/normalize/rewriter.hpp>
#include <argforge/normalize/sanitizer.hpp>
#include <argforge/options/schema.hpp>
#include <argforge/util/console.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <regex>

namespace argforge {

static const std::regex kUrlShorthand(R"(^(http|www\.|\w[\w.-]+\.\w{2,}))");
static const std::regex kShortWithEquals(R"(^-\w=.+)");
static const std::regex kSingleDashLong(R"(^-\w{3,})");
static const std::regex kTamperTypo(R"(^--tamper[^=\s])");
static const std::regex kAggregated(R"(^(--(tamper|ignore-code|skip))(?!-))");
static const std::regex kAggregationKey(R"(-?-(\w+)\b)");
static const std::regex kThreadsValue(R"(^\d+!$)");
static const std::regex kThreadsInline(R"(^--threads.+\d+!$)");
static const std::regex kOptionLike(R"(^-{1,2}\w)");
static const std::regex kVerbosity(R"(^-v+$)");

static bool starts_with(const std::string& s, const std::string& prefix) { return s.rfind(prefix, 0) == 0; }

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

static std::string strip_hyphens(const std::string& s) {
    auto a = s.find_first_not_of('-');
    auto b = s.find_last_not_of('-');
    return a == std::string::npos ? std::string() : s.substr(a, b - a + 1);
}

static std::string before_equals(const std::string& s) { return s.substr(0, s.find('=')); }

static Failure lexical(std::string msg) { return Failure{ErrorKind::Lexical, std::move(msg), {}}; }

static bool file_on_disk(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

bool looks_like_url(const std::string& token) {
    return std::regex_search(token, kUrlShorthand);
}

std::optional<std::string> target_host(const std::string& token) {
    CURLU* url = curl_url();
    if (!url) return std::nullopt;
    std::optional<std::string> host;
    if (curl_url_set(url, CURLUPART_URL, token.c_str(),
                     CURLU_GUESS_SCHEME | CURLU_NON_SUPPORT_SCHEME | CURLU_ALLOW_SPACE) == CURLUE_OK) {
        char* part = nullptr;
        if (curl_url_get(url, CURLUPART_HOST, &part, 0) == CURLUE_OK && part) {
            if (part[0] != '\0') host = std::string(part);
            curl_free(part);
        }
    }
    curl_url_cleanup(url);
    return host;
}

std::optional<Failure> check_old_options(const std::vector<std::string>& argv) {
    const auto& obsolete = schema::obsolete_options();
    const auto& deprecated = schema::deprecated_options();
    for (auto &arg : argv) {
        std::string name = before_equals(arg);
        auto a = name.find_first_not_of(" \t"); auto b = name.find_last_not_of(" \t");
        name = a == std::string::npos ? std::string() : name.substr(a, b - a + 1);
        if (auto it = obsolete.find(name); it != obsolete.end()) {
            std::string msg = "switch/option '" + name + "' is obsolete";
            if (!it->second.empty()) msg += " (hint: " + it->second + ")";
            return Failure{ErrorKind::Obsolete, msg, {}};
        }
        if (auto it = deprecated.find(name); it != deprecated.end()) {
            std::string msg = "switch/option '" + name + "' is deprecated";
            if (!it->second.empty()) msg += " (hint: " + it->second + ")";
            log_warning(msg);
        }
    }
    return std::nullopt;
}

ArgvRewriter::ArgvRewriter(const Catalogue& catalogue, RewriteOptions options)
    : m_catalogue(catalogue), m_options(std::move(options)) {
    if (!m_options.is_file) m_options.is_file = file_on_disk;
}

RewriteResult ArgvRewriter::rewrite(std::vector<std::string> argv) const {
    Rewritten out;
    std::map<std::string, std::optional<std::size_t>> anchors;
    const auto& ignored = schema::ignored_options();
    const auto& deprecated = schema::deprecated_options();
    const std::size_t n = argv.size();

    for (std::size_t i = 1; i < n; ++i) {
        if (argv[i].empty()) continue;
        argv[i] = sanitize_token(argv[i]);
        std::string& tok = argv[i];
        if (tok.empty()) continue;
        const bool has_next = i + 1 < n;

        if (tok == "-hh") {
            tok = "-h";
        } else if (i == 1 && looks_like_url(tok)) {
            if (auto host = target_host(tok)) log_debug("positional target on host '" + *host + "'");
            else log_debug("positional target '" + tok + "' has no parsable host");
            tok = "--url=" + tok;
        } else if (auto bad = check_illegal_characters(tok)) {
            return *bad;
        } else if (std::regex_search(tok, kShortWithEquals)) {
            return lexical("potentially miswritten (illegal '=') short option detected ('" + tok + "')");
        } else if (std::regex_search(tok, kSingleDashLong)) {
            if (m_catalogue.is_known_long(before_equals(strip_hyphens(tok)))) tok = "-" + tok;
        } else if (ignored.count(tok) || deprecated.count(tok)) {
            tok.clear();
        } else if (tok == "-s" || tok == "--silent") {
            if (!has_next || starts_with(argv[i + 1], "-")) { tok.clear(); out.verbose = 0; }
        } else if (starts_with(tok, "--data-raw")) {
            tok.replace(0, 10, "--data");
        } else if (starts_with(tok, "--auth-creds")) {
            tok.replace(0, 12, "--auth-cred");
        } else if (starts_with(tok, "--drop-cookie")) {
            tok.replace(0, 13, "--drop-set-cookie");
        } else if (std::regex_search(tok, kTamperTypo)) {
            tok.clear();
        } else if (std::regex_search(tok, kAggregated)) {
            std::smatch m; std::regex_search(tok, m, kAggregationKey);
            std::string key = m[1].str();
            bool detached = has_next && !starts_with(argv[i + 1], "-");
            auto it = anchors.find(key);
            if (it == anchors.end() || !it->second) {
                std::optional<std::size_t> anchor;
                if (tok.find('=') != std::string::npos) anchor = i;
                else if (detached) anchor = i + 1;
                anchors[key] = anchor;
            } else {
                std::string value;
                auto eq = tok.find('=');
                if (eq != std::string::npos) value = tok.substr(eq + 1);
                else if (detached) { value = sanitize_token(argv[i + 1]); argv[i + 1].clear(); }
                argv[*it->second] += "," + value;
                tok.clear();
            }
        } else if (tok == "-H" || tok == "--header" || starts_with(tok, "-H=") || starts_with(tok, "--header=")) {
            auto eq = tok.find('=');
            if (eq != std::string::npos) out.extra_headers.push_back(tok.substr(eq + 1));
            else if (has_next) out.extra_headers.push_back(sanitize_token(argv[i + 1]));
        } else if (tok == "--deps") {
            tok = "--dependencies";
        } else if (tok == "--disable-colouring") {
            tok = "--disable-coloring";
        } else if (tok == "-r") {
            for (std::size_t j = i + 2; j < n; ++j) {
                std::string path = sanitize_token(argv[j]);
                if (path.empty() || !m_options.is_file(path)) break;
                argv[i + 1] += "," + path;
                argv[j].clear();
            }
        } else if ((std::regex_search(tok, kThreadsValue) && argv[i - 1] == "--threads") ||
                   std::regex_search(tok, kThreadsInline)) {
            tok.pop_back();
            out.skip_thread_check = true;
        } else if (tok == "--version") {
            std::string version = schema::kVersionString;
            data_to_stdout(version.substr(version.rfind('/') + 1) + "\n");
            return EarlyExit{0};
        } else if (tok == "-h" || tok == "--help") {
            out.help_filtered = true;
        } else if (tok.find('=') != std::string::npos && !starts_with(tok, "-") &&
                   m_catalogue.is_known_valued_long(before_equals(tok)) &&
                   !std::regex_search(argv[i - 1], kOptionLike)) {
            return lexical("detected usage of long-option without a starting hyphen ('" + tok + "')");
        }
    }

    for (std::size_t k = 0; k < n; ++k)
        if (k == 0 || !argv[k].empty()) out.argv.push_back(std::move(argv[k]));

    // -v, -vv, ... as a shorthand for the verbosity level
    for (std::size_t k = 1; k < out.argv.size();) {
        const std::string& t = out.argv[k];
        bool last = k + 1 == out.argv.size();
        if (std::regex_search(t, kVerbosity) && (last || !all_digits(out.argv[k + 1]))) {
            out.verbose = static_cast<int>(t.size() - 1);
            out.argv.erase(out.argv.begin() + static_cast<std::ptrdiff_t>(k));
            continue;
        }
        ++k;
    }
    return out;
}

} // namespace argforge
