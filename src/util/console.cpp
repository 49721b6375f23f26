/*
 * Console output and logging implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/util/console.hpp>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace argforge {

static ConsoleOptions g_opts;
static std::ostream* g_out = nullptr;

void set_console_options(const ConsoleOptions& opts) { g_opts = opts; }
const ConsoleOptions& console_options() { return g_opts; }

void set_console_stream(std::ostream* out) { g_out = out; }
std::ostream& console_stream() { return g_out ? *g_out : std::cout; }

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::string apply_color(const std::string& s, const char* code) {
    if (!g_opts.color) return s;
    return std::string("\x1b[") + code + "m" + s + "\x1b[0m";
}

void data_to_stdout(const std::string& s) {
    auto& out = console_stream();
    out << s;
    out.flush();
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "?";
}

static const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "34";
        case LogLevel::Info: return "32";
        case LogLevel::Warning: return "33";
        case LogLevel::Error: return "31";
        case LogLevel::Critical: return "1;31";
    }
    return "0";
}

static bool enabled(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return g_opts.verbose >= 2;
        case LogLevel::Info:
        case LogLevel::Warning: return g_opts.verbose >= 1;
        default: return true;
    }
}

void log(LogLevel level, const std::string& msg) {
    if (!enabled(level)) return;
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    std::ostringstream ts; ts << std::put_time(&tm, "%H:%M:%S");
    auto& out = console_stream();
    out << '[' << apply_color(ts.str(), "36") << "] [" << apply_color(level_name(level), level_color(level)) << "] " << msg << '\n';
    out.flush();
}

} // namespace argforge
