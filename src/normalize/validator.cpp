/*
 * Validator implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/normalize/validator.hpp>
#include <argforge/normalize/mnemonics.hpp>
#include <argforge/options/schema.hpp>
#include <cstdlib>
#include <iostream>
#ifndef _WIN32
#include <unistd.h>
#else
#include <cstdio>
#include <io.h>
#endif

namespace argforge {

static const char* const kMandatory[] = {
    "direct", "url", "logFile", "bulkFile", "googleDork", "configFile", "requestFile", "updateAll",
    "smokeTest", "vulnTest", "wizard", "dependencies", "purge", "listTampers", "hashFile",
};

std::optional<std::string> StdinPipe::next() {
    std::string line;
    if (!m_in || !std::getline(*m_in, line)) return std::nullopt;
    return line;
}

ProcessContext ProcessContext::detect() {
    ProcessContext ctx;
#ifndef _WIN32
    ctx.stdin_is_tty = isatty(STDIN_FILENO) != 0;
#else
    ctx.stdin_is_tty = _isatty(_fileno(stdin)) != 0;
#endif
    ctx.input = &std::cin;
    ctx.ci = std::getenv("GITHUB_ACTIONS") != nullptr;
    return ctx;
}

std::string merge_headers(const std::string& headers, const std::vector<std::string>& extra) {
    if (extra.empty()) return headers;
    const std::string delimiter = headers.find("\\n") != std::string::npos ? "\\n" : "\n";
    std::string out = headers;
    for (auto &h : extra) {
        bool ends = out.size() >= delimiter.size() &&
                    out.compare(out.size() - delimiter.size(), delimiter.size(), delimiter) == 0;
        if (!out.empty() && !ends) out += delimiter;
        out += h;
    }
    return out;
}

Result<CanonicalArgs> Validator::finalize(ParsedOptions parsed, const Rewritten& rewritten) const {
    CanonicalArgs out;
    out.values = std::move(parsed.values);
    out.extras = std::move(parsed.extras);
    out.argv = rewritten.argv;
    out.skip_thread_check = rewritten.skip_thread_check;

    if (!rewritten.extra_headers.empty())
        out.values.set("headers", merge_headers(out.values.str("headers").value_or(""), rewritten.extra_headers));

    MnemonicExpander mnemonics(m_catalogue);
    for (std::size_t i = 0; i + 1 < out.argv.size(); ++i) {
        if (out.argv[i] != "-z") continue;
        if (auto err = mnemonics.expand(out.argv[i + 1], out.values)) return *err;
    }

    if (out.values.flag("dummy") && !out.values.truthy("url"))
        out.values.set("url", std::string(schema::kDummyUrl));

    if (!m_context.stdin_is_tty && m_context.input && !out.values.truthy("api") &&
        !out.values.truthy("ignoreStdin") && !m_context.ci)
        out.stdin_pipe.emplace(*m_context.input);

    if (rewritten.verbose) out.values.set("verbose", static_cast<std::int64_t>(*rewritten.verbose));

    bool target = out.stdin_pipe.has_value();
    for (auto* dest : kMandatory) target = target || out.values.truthy(dest);
    if (!target)
        return Failure{ErrorKind::Usage,
                       "missing a mandatory option (-d, -u, -l, -m, -r, -g, -c, --wizard, --shell, --update, "
                       "--purge, --list-tampers or --dependencies). Use -h for basic and -hh for advanced help", {}};

    return out;
}

} // namespace argforge
