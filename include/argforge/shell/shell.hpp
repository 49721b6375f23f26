/*
 * Interactive shell - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   The "--shell" prompt. It loops until the user types an option line
 *   (starting with '-'), which is split into words with shell quoting and
 *   handed back to the caller, or until the user quits. Quit words, Ctrl-C,
 *   Ctrl-D and end of input all give a QuitRequest.
 */
#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "argforge/options/catalogue.hpp"
#include "argforge/outcome.hpp"
#include "argforge/shell/history.hpp"

namespace argforge {

// Returns nullopt when the user interrupts or input ends.
using LineReader = std::function<std::optional<std::string>(const std::string& prompt,
                                                            const std::vector<std::string>& history)>;

struct ShellConfig {
    std::string prompt = "argforge > ";
    std::string home_dir;
    std::size_t history_length = 1000;
    LineReader reader;   // empty: the terminal line editor
};

struct ShellLine {
    std::string line;                  // accepted line, after "new " removal
    std::vector<std::string> words;
};

using ShellResult = std::variant<ShellLine, Failure, QuitRequest>;

class ShellSession {
public:
    ShellSession(const Catalogue& catalogue, ShellConfig config);
    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    ShellResult run();

    const std::set<std::string>& vocabulary() const { return m_vocabulary; }
    std::vector<std::string> complete(const std::string& prefix) const;
    const History& history() const { return m_history; }
private:
    std::optional<std::string> read(const std::string& prompt);

    ShellConfig m_config;
    History m_history;
    std::set<std::string> m_vocabulary;
};

// Creates <home>, <home>/history and <home>/output; false on failure.
bool create_home_directories(const std::string& home);

} // namespace argforge
