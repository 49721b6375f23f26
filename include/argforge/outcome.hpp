/*
 * Pipeline outcomes - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Result kinds shared by every stage. A stage never throws: it returns a
 *   variant holding either its value or one of the terminal kinds below, so
 *   callers can tell a user-requested quit from invalid input.
 */
#pragma once
#include <string>
#include <variant>

namespace argforge {

enum class ErrorKind { Lexical, ShellSyntax, Usage, Mnemonic, Obsolete };

struct Failure {
    ErrorKind kind;
    std::string message;
    std::string usage;   // usage banner, filled in for Usage failures only
};

// The user left the interactive shell (quit word, Ctrl-C, Ctrl-D, EOF).
struct QuitRequest {};

// Help or version was printed; nothing left to do.
struct EarlyExit { int status = 0; };

template <class T>
using Result = std::variant<T, Failure>;

inline const char* kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::Lexical: return "lexical";
        case ErrorKind::ShellSyntax: return "shell-syntax";
        case ErrorKind::Usage: return "usage";
        case ErrorKind::Mnemonic: return "mnemonic";
        case ErrorKind::Obsolete: return "obsolete";
    }
    return "?";
}

// Process exit status for a failure.
inline int exit_status(const Failure& f) { return f.kind == ErrorKind::Usage ? 2 : 1; }

} // namespace argforge
