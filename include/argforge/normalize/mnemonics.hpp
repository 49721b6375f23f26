/*
 * Mnemonic expander - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Expands a -z macro such as "flu,bat,ban,tec=EU" into option values.
 *   Every code is a prefix of some grouped option name with its hyphens
 *   removed; an exact name beats a longer one and otherwise the shortest
 *   candidate wins.
 */
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "argforge/options/catalogue.hpp"
#include "argforge/outcome.hpp"

namespace argforge {

class MnemonicExpander {
public:
    explicit MnemonicExpander(const Catalogue& catalogue);

    // Applies every code of the macro to values; the first code to claim a
    // destination keeps it.
    std::optional<Failure> expand(const std::string& macro, OptionValues& values) const;

    // Failure when no option name starts with the code.
    Result<const OptionSpec*> resolve(const std::string& code) const;
private:
    struct Node {
        std::map<char, std::unique_ptr<Node>> next;
        std::vector<const OptionSpec*> current;   // options reachable through this prefix
    };
    Node m_root;
};

} // namespace argforge
