/*
 * Line editor - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Supports character insertion, Backspace, Enter, Up/Down history browsing
 * and Tab completion. Falls back to plain line reads when stdin is not a
 * terminal.
 */
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace argforge {

struct CompletionOptions {
    // receives the whole buffer and the prefix of the word being completed
    std::function<std::vector<std::string>(const std::string& buffer, const std::string& prefix)> provider;
};

class LineEditor {
public:
    LineEditor();
    ~LineEditor();
    LineEditor(const LineEditor&) = delete;
    LineEditor& operator=(const LineEditor&) = delete;

    // nullopt on Ctrl-C, Ctrl-D on an empty line, or end of input
    std::optional<std::string> read_line(const std::string& prompt,
                                         const CompletionOptions& comp,
                                         const std::vector<std::string>& history);
private:
    std::optional<std::string> read_plain(const std::string& prompt);

    bool m_raw = false;
    void enable_raw();
    void disable_raw();
    int read_key();
    void write(const std::string& s);
    void redraw(const std::string& prompt, const std::string& buf, std::size_t old_len);
};

} // namespace argforge
