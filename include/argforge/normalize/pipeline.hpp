/*
 * Command line pipeline - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Single entry point from a raw argv to canonical options:
 *   obsolete check, optional interactive shell, rewriter, option parser
 *   (help), validator. Each stage may stop the run with one of the
 *   Outcome alternatives.
 */
#pragma once
#include <functional>
#include <iostream>
#include <string>
#include <variant>
#include <vector>
#include "argforge/config/settings.hpp"
#include "argforge/normalize/validator.hpp"
#include "argforge/options/catalogue.hpp"
#include "argforge/outcome.hpp"
#include "argforge/shell/shell.hpp"

namespace argforge {

struct PipelineOptions {
    Settings settings;
    ProcessContext process;
    LineReader shell_reader;                               // empty: terminal
    std::function<bool(const std::string&)> is_file;       // empty: disk check
};

using Outcome = std::variant<CanonicalArgs, Failure, QuitRequest, EarlyExit>;

Outcome cmd_line_parser(std::vector<std::string> argv, const PipelineOptions& options,
                        const Catalogue& catalogue = default_catalogue());

// Prints a failure the way the command line reports it: "[!] message" on
// the console, or usage banner and "prog: error: message" on err.
void report_failure(const Failure& failure, const std::string& prog, std::ostream& err = std::cerr);

} // namespace argforge
