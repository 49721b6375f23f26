/*
 * Argv rewriter - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   One left-to-right pass over the argument vector. Every token is
 *   sanitized and then the first matching rule of an ordered list is
 *   applied: short/long spelling fixes, a bare URL in first position,
 *   legacy names, aggregation of repeated --tamper/--skip/--ignore-code,
 *   header capture, the multi-file request loader, the thread-limit
 *   override, version printing and basic help selection. Deleted tokens
 *   become empty strings and are dropped once the pass ends, so positions
 *   stay stable while rules look ahead and behind.
 */
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "argforge/options/catalogue.hpp"
#include "argforge/outcome.hpp"

namespace argforge {

struct RewriteOptions {
    // Used by the -r loader; defaults to a regular-file check on disk.
    std::function<bool(const std::string&)> is_file;
};

struct Rewritten {
    std::vector<std::string> argv;            // normalized, program name at 0
    std::vector<std::string> extra_headers;   // -H/--header values, in order
    std::optional<int> verbose;               // set by -s/--silent or -vvv
    bool skip_thread_check = false;
    bool help_filtered = false;               // -h/--help: show basic help
};

using RewriteResult = std::variant<Rewritten, Failure, EarlyExit>;

class ArgvRewriter {
public:
    explicit ArgvRewriter(const Catalogue& catalogue, RewriteOptions options = {});

    RewriteResult rewrite(std::vector<std::string> argv) const;
private:
    const Catalogue& m_catalogue;
    RewriteOptions m_options;
};

// Fails on an obsolete switch, warns about a deprecated one.
std::optional<Failure> check_old_options(const std::vector<std::string>& argv);

// Shorthand target check for the first positional token (pattern only).
bool looks_like_url(const std::string& token);

// Host part as libcurl reads it, spaces allowed; nullopt when it has none.
std::optional<std::string> target_host(const std::string& token);

} // namespace argforge
