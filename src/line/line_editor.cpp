/*
 * Line editor implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/line/line_editor.hpp>
#include <iostream>
#ifndef _WIN32
#include <csignal>
#include <termios.h>
#include <unistd.h>
#endif

namespace argforge {

#ifndef _WIN32
static struct termios g_orig;
static volatile sig_atomic_t g_interrupted = 0;
static void on_sigint(int) { g_interrupted = 1; }
#endif

LineEditor::LineEditor() {}
LineEditor::~LineEditor() { if (m_raw) disable_raw(); }

std::optional<std::string> LineEditor::read_plain(const std::string& prompt) {
    std::cout << prompt << std::flush;
#ifndef _WIN32
    // no SA_RESTART, so Ctrl-C interrupts the blocking read
    struct sigaction sa{}, old{};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    g_interrupted = 0;
    sigaction(SIGINT, &sa, &old);
#endif
    std::string line;
    bool ok = static_cast<bool>(std::getline(std::cin, line));
#ifndef _WIN32
    sigaction(SIGINT, &old, nullptr);
    if (g_interrupted) { std::cin.clear(); return std::nullopt; }
#endif
    if (!ok) return std::nullopt;
    return line;
}

#ifdef _WIN32

void LineEditor::enable_raw() {}
void LineEditor::disable_raw() {}
int LineEditor::read_key() { return -1; }
void LineEditor::write(const std::string& s) { std::cout << s << std::flush; }
void LineEditor::redraw(const std::string&, const std::string&, std::size_t) {}

std::optional<std::string> LineEditor::read_line(const std::string& prompt, const CompletionOptions&,
                                                 const std::vector<std::string>&) {
    return read_plain(prompt);
}

#else

void LineEditor::enable_raw() {
    if (m_raw) return;
    struct termios t; tcgetattr(STDIN_FILENO, &t); g_orig = t;
    // ISIG off: Ctrl-C arrives as byte 3 instead of a signal
    t.c_lflag &= ~(ICANON | ECHO | ISIG);
    t.c_cc[VMIN] = 1; t.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &t);
    m_raw = true;
}
void LineEditor::disable_raw() {
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &g_orig); m_raw = false;
}

int LineEditor::read_key() {
    unsigned char c; if (read(STDIN_FILENO, &c, 1) != 1) return -1; return c;
}

void LineEditor::write(const std::string& s) {
    std::size_t off = 0;
    while (off < s.size()) {
        auto n = ::write(STDOUT_FILENO, s.data() + off, s.size() - off);
        if (n <= 0) return;
        off += static_cast<std::size_t>(n);
    }
}

void LineEditor::redraw(const std::string& prompt, const std::string& buf, std::size_t old_len) {
    write("\r"); write(std::string(prompt.size() + old_len, ' '));
    write("\r"); write(prompt); write(buf);
}

std::optional<std::string> LineEditor::read_line(const std::string& prompt,
                                                 const CompletionOptions& comp,
                                                 const std::vector<std::string>& history) {
    if (!isatty(STDIN_FILENO)) return read_plain(prompt);
    enable_raw();
    write(prompt);
    std::string buf; std::size_t hist_index = history.size(); // one past last
    bool last_was_tab = false;
    while (true) {
        int k = read_key();
        if (k == -1) { disable_raw(); return std::nullopt; }
        if (k == '\n' || k == '\r') { write("\n"); disable_raw(); return buf; }
        if (k == 3) { // Ctrl-C
            write("^C"); disable_raw(); return std::nullopt; }
        if (k == 4) { // Ctrl-D
            if (buf.empty()) { disable_raw(); return std::nullopt; }
            continue;
        }
        if (k == 127 || k == 8) { // Backspace
            if (!buf.empty()) { buf.pop_back(); write("\b \b"); }
            last_was_tab = false;
            continue;
        }
        if (k == '\t') {
            std::size_t start = buf.find_last_of(' ');
            std::size_t token_pos = (start == std::string::npos) ? 0 : start + 1;
            std::string prefix = buf.substr(token_pos);
            if (!comp.provider) continue;
            auto matches = comp.provider(buf, prefix);
            if (matches.empty()) continue;
            std::string common = matches[0];
            for (auto &m : matches) {
                std::size_t j = 0; while (j < common.size() && j < m.size() && common[j] == m[j]) ++j;
                common.resize(j);
            }
            if (matches.size() == 1) {
                std::string add = matches[0].substr(prefix.size()) + " ";
                buf += add; write(add);
                last_was_tab = false;
            } else if (common.size() > prefix.size()) {
                std::string add = common.substr(prefix.size()); buf += add; write(add);
                last_was_tab = false;
            } else if (last_was_tab) {
                write("\n");
                int col = 0;
                for (auto &m : matches) {
                    write(m); write("  ");
                    if (++col % 4 == 0) write("\n");
                }
                if (col % 4 != 0) write("\n");
                write(prompt); write(buf);
                last_was_tab = false;
            } else {
                last_was_tab = true; // next Tab lists the candidates
            }
            continue;
        }
        if (k == 27) { // ESC sequence
            int k1 = read_key(); int k2 = read_key();
            if (k1 == '[') {
                std::size_t old_len = buf.size();
                if (k2 == 'A' && hist_index > 0) {
                    buf = history[--hist_index];
                    redraw(prompt, buf, old_len);
                } else if (k2 == 'B' && hist_index < history.size()) {
                    ++hist_index;
                    if (hist_index == history.size()) buf.clear(); else buf = history[hist_index];
                    redraw(prompt, buf, old_len);
                }
            }
            last_was_tab = false;
            continue;
        }
        if (k >= 32 && k < 127) {
            buf.push_back(static_cast<char>(k));
            write(std::string(1, static_cast<char>(k)));
            last_was_tab = false;
        }
    }
}

#endif

} // namespace argforge
