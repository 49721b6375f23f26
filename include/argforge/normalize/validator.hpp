/*
 * Validator - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Last stage after parsing: merges captured headers, expands -z macros,
 *   fills the dummy target, attaches a piped stdin as a line source and
 *   insists on at least one target or standalone mode.
 */
#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "argforge/normalize/rewriter.hpp"
#include "argforge/options/option_parser.hpp"

namespace argforge {

// Lazy line source over a piped stdin.
class StdinPipe {
public:
    explicit StdinPipe(std::istream& in) : m_in(&in) {}
    // nullopt once the stream is exhausted
    std::optional<std::string> next();
private:
    std::istream* m_in;
};

struct ProcessContext {
    bool stdin_is_tty = true;
    std::istream* input = nullptr;   // piped input, std::cin when detected
    bool ci = false;                 // GITHUB_ACTIONS is set

    static ProcessContext detect();
};

struct CanonicalArgs {
    OptionValues values;
    std::optional<StdinPipe> stdin_pipe;
    bool skip_thread_check = false;
    std::vector<std::string> extras;
    std::vector<std::string> argv;   // the normalized argv the values came from
};

// Appends extra header lines without a leading or doubled delimiter.
std::string merge_headers(const std::string& headers, const std::vector<std::string>& extra);

class Validator {
public:
    Validator(const Catalogue& catalogue, ProcessContext context)
        : m_catalogue(catalogue), m_context(context) {}

    Result<CanonicalArgs> finalize(ParsedOptions parsed, const Rewritten& rewritten) const;
private:
    const Catalogue& m_catalogue;
    ProcessContext m_context;
};

} // namespace argforge
