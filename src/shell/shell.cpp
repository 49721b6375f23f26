/*
 * Interactive shell implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/shell/shell.hpp>
#include <argforge/lex/lexer.hpp>
#include <argforge/line/line_editor.hpp>
#include <argforge/options/schema.hpp>
#include <argforge/util/console.hpp>
#include <cctype>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace argforge {

static const std::regex kNewPrefix(R"(^new\s+)", std::regex::icase);
static const std::regex kHelpWord(R"(^(\?|help)$)", std::regex::icase);

static std::string strip(const std::string& s) {
    std::size_t a = 0; while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    std::size_t b = s.size(); while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

static std::string lower(std::string s) {
    for (auto &c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool create_home_directories(const std::string& home) {
    bool ok = true;
    for (const char* sub : {"history", "output"}) {
        std::error_code ec;
        fs::create_directories(fs::path(home) / sub, ec);
        if (ec) {
            log_warning("unable to create directory '" + (fs::path(home) / sub).string() + "' (" + ec.message() + ")");
            ok = false;
        }
    }
    return ok;
}

ShellSession::ShellSession(const Catalogue& catalogue, ShellConfig config)
    : m_config(std::move(config)), m_history(m_config.home_dir, HistoryKind::Main, m_config.history_length) {
    m_vocabulary = {"x", "q", "exit", "quit", "clear"};
    m_vocabulary.insert(catalogue.invocations().begin(), catalogue.invocations().end());
}

std::vector<std::string> ShellSession::complete(const std::string& prefix) const {
    std::vector<std::string> out;
    for (auto it = m_vocabulary.lower_bound(prefix); it != m_vocabulary.end() && it->rfind(prefix, 0) == 0; ++it)
        out.push_back(*it);
    return out;
}

std::optional<std::string> ShellSession::read(const std::string& prompt) {
    if (m_config.reader) return m_config.reader(prompt, m_history.entries());
    LineEditor editor;
    CompletionOptions comp;
    comp.provider = [this](const std::string&, const std::string& prefix) { return complete(prefix); };
    return editor.read_line(prompt, comp, m_history.entries());
}

ShellResult ShellSession::run() {
    // directory and history problems are logged as warnings; the prompt still works
    create_home_directories(m_config.home_dir);
    m_history.load();

    std::string command;
    while (true) {
        auto input = read(m_config.prompt);
        if (!input) {
            data_to_stdout("\n");
            return QuitRequest{};
        }
        command = std::regex_replace(strip(*input), kNewPrefix, "", std::regex_constants::format_first_only);

        if (command.empty()) continue;
        m_history.add(command);
        std::string lowered = lower(command);
        if (lowered == "clear") {
            m_history.clear();
            data_to_stdout("[i] history cleared\n");
            m_history.save();
        } else if (lowered == "x" || lowered == "q" || lowered == "exit" || lowered == "quit") {
            return QuitRequest{};
        } else if (command[0] != '-') {
            if (!std::regex_search(command, kHelpWord)) data_to_stdout("[!] invalid option(s) provided\n");
            data_to_stdout(std::string("[i] valid example: '") + schema::kShellExample + "'\n");
        } else {
            m_history.save();
            m_history.load();
            break;
        }
    }

    auto split = split_command_line(command);
    if (!split.ok())
        return Failure{ErrorKind::ShellSyntax,
                       "something went wrong during command line parsing ('" + split.error + "')", {}};
    return ShellLine{command, std::move(split.words)};
}

} // namespace argforge
