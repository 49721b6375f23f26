/*
 * Console output and logging - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Every diagnostic line (logger messages, raw "[i]"/"[!]" notices, help and
 *   version text) goes through this module so that color and verbosity are
 *   decided in one place and tests can capture the output.
 */
#pragma once
#include <ostream>
#include <string>

namespace argforge {

enum class LogLevel { Debug, Info, Warning, Error, Critical };

struct ConsoleOptions {
    bool color = true;   // ANSI colors on level tags
    int verbose = 1;     // 0: errors only, 1: info/warning, 2+: debug
};

void set_console_options(const ConsoleOptions& opts);
const ConsoleOptions& console_options();

// nullptr restores std::cout
void set_console_stream(std::ostream* out);
std::ostream& console_stream();

std::string getenv_or(const char* key, const std::string& def = "");
std::string apply_color(const std::string& s, const char* code);

// Raw write, no prefix and no newline added.
void data_to_stdout(const std::string& s);

// "[HH:MM:SS] [LEVEL] message", filtered by verbosity.
void log(LogLevel level, const std::string& msg);
inline void log_debug(const std::string& msg) { log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg) { log(LogLevel::Info, msg); }
inline void log_warning(const std::string& msg) { log(LogLevel::Warning, msg); }
inline void log_error(const std::string& msg) { log(LogLevel::Error, msg); }

} // namespace argforge
