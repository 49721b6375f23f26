// argforge main: normalizes the command line and prints the canonical options
#include <argforge/config/settings.hpp>
#include <argforge/normalize/pipeline.hpp>
#include <argforge/options/catalogue.hpp>
#include <argforge/util/console.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>
#include <vector>

namespace fs = std::filesystem;
using namespace argforge;

static void print_summary(const CanonicalArgs& args) {
    auto verbose = args.values.integer("verbose").value_or(1);
    if (verbose >= 2) {
        for (auto &[dest, value] : args.values.all())
            data_to_stdout(apply_color(dest, "36") + " = " + to_string(value) + "\n");
    } else {
        std::string set;
        for (auto &[dest, value] : args.values.all()) {
            if (dest == "verbose" || !args.values.truthy(dest)) continue;
            auto* spec = [&]() -> const OptionSpec* {
                for (auto* s : default_catalogue().all()) if (s->dest == dest) return s;
                return nullptr;
            }();
            // defaults are not worth repeating
            if (spec && spec->default_value == value) continue;
            if (!set.empty()) set += ", ";
            set += dest;
        }
        data_to_stdout("[i] options: " + (set.empty() ? std::string("(none)") : set) + "\n");
    }
    if (!args.extras.empty()) {
        std::string extras;
        for (auto &e : args.extras) extras += (extras.empty() ? "" : " ") + e;
        data_to_stdout("[i] unconsumed arguments: " + extras + "\n");
    }
    if (args.stdin_pipe) data_to_stdout("[i] targets will be read from standard input\n");
    if (args.skip_thread_check) data_to_stdout("[i] thread limit check disabled\n");
}

// Keeps a console window opened by double click from vanishing.
static void pause_on_exit(const std::vector<std::string>& argv, const Settings& settings) {
#ifdef _WIN32
    if (settings.non_interactive || std::find(argv.begin(), argv.end(), "--non-interactive") != argv.end()) return;
    data_to_stdout("\nPress Enter to continue...");
    std::string ignored;
    std::getline(std::cin, ignored);
#else
    (void)argv; (void)settings;
#endif
}

int main(int argc, char* argv[]) {
    Settings settings = load_settings();
    std::vector<std::string> args(argv, argv + argc);
    bool no_color = std::find(args.begin(), args.end(), "--disable-coloring") != args.end();
    set_console_options(ConsoleOptions{settings.color && !no_color, 1});

    PipelineOptions options;
    options.settings = settings;
    options.process = ProcessContext::detect();

    std::string prog = args.empty() ? std::string("argforge") : fs::path(args[0]).filename().string();
    Outcome outcome = cmd_line_parser(args, options);

    return std::visit([&](auto& result) -> int {
        using T = std::decay_t<decltype(result)>;
        if constexpr (std::is_same_v<T, CanonicalArgs>) {
            print_summary(result);
            return 0;
        } else if constexpr (std::is_same_v<T, Failure>) {
            report_failure(result, prog);
            pause_on_exit(args, settings);
            return exit_status(result);
        } else if constexpr (std::is_same_v<T, QuitRequest>) {
            return 0;
        } else {
            pause_on_exit(args, settings);
            return result.status;
        }
    }, outcome);
}
