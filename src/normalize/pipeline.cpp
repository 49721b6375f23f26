/*
 * Command line pipeline implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/normalize/pipeline.hpp>
#include <argforge/normalize/rewriter.hpp>
#include <argforge/options/help.hpp>
#include <argforge/options/option_parser.hpp>
#include <argforge/util/console.hpp>
#include <algorithm>
#include <filesystem>

namespace argforge {

static Failure with_usage(Failure f, const std::string& usage) {
    if (f.kind == ErrorKind::Usage) f.usage = usage;
    return f;
}

Outcome cmd_line_parser(std::vector<std::string> argv, const PipelineOptions& options, const Catalogue& catalogue) {
    std::string prog = argv.empty() ? std::string("argforge") : std::filesystem::path(argv[0]).filename().string();
    if (argv.empty()) argv.push_back(prog);
    std::string usage = default_usage(prog);

    if (auto err = check_old_options(argv)) return *err;

    if (std::find(argv.begin(), argv.end(), "--shell") != argv.end()) {
        usage.clear();
        ShellSession shell(catalogue, ShellConfig{options.settings.prompt, options.settings.home_dir,
                                                  options.settings.history_length, options.shell_reader});
        auto res = shell.run();
        if (std::holds_alternative<QuitRequest>(res)) return QuitRequest{};
        if (auto* f = std::get_if<Failure>(&res)) return *f;
        auto& words = std::get<ShellLine>(res).words;
        argv.insert(argv.end(), words.begin(), words.end());
    }

    ArgvRewriter rewriter(catalogue, RewriteOptions{options.is_file});
    auto rewritten = rewriter.rewrite(std::move(argv));
    if (auto* f = std::get_if<Failure>(&rewritten)) return *f;
    if (auto* e = std::get_if<EarlyExit>(&rewritten)) return *e;
    const Rewritten& rw = std::get<Rewritten>(rewritten);

    OptionParser parser(catalogue);
    auto parsed = parser.parse(std::vector<std::string>(rw.argv.begin() + 1, rw.argv.end()));
    if (auto* f = std::get_if<Failure>(&parsed)) return with_usage(*f, usage);
    ParsedOptions& po = std::get<ParsedOptions>(parsed);

    if (po.help_requested) {
        HelpFormatter help(catalogue, prog, usage);
        data_to_stdout(help.format_help(rw.help_filtered ? HelpMode::Basic : HelpMode::Advanced));
        if (rw.help_filtered) data_to_stdout("\n[!] to see full list of options run with '-hh'\n");
        return EarlyExit{0};
    }

    Validator validator(catalogue, options.process);
    auto result = validator.finalize(std::move(po), rw);
    if (auto* f = std::get_if<Failure>(&result)) return with_usage(*f, usage);
    CanonicalArgs& args = std::get<CanonicalArgs>(result);

    ConsoleOptions console = console_options();
    console.verbose = static_cast<int>(args.values.integer("verbose").value_or(1));
    set_console_options(console);
    log_debug("parsing command line");
    return std::move(args);
}

void report_failure(const Failure& failure, const std::string& prog, std::ostream& err) {
    if (failure.kind == ErrorKind::Usage) {
        HelpFormatter help(default_catalogue(), prog, failure.usage);
        err << help.format_error(failure.message);
        err.flush();
        return;
    }
    data_to_stdout("[!] " + failure.message + "\n");
}

} // namespace argforge
