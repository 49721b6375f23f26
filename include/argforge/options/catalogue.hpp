/*
 * Option catalogue - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Read-only view over the static option schema, built once. The rewriter,
 *   the option parser, the mnemonic expander, the help formatter and the
 *   shell completion all consult the same instance.
 */
#pragma once
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "argforge/options/option_spec.hpp"

namespace argforge {

class Catalogue {
public:
    explicit Catalogue(std::vector<OptionGroup> groups);
    Catalogue(const Catalogue&) = delete;
    Catalogue& operator=(const Catalogue&) = delete;

    // groups()[i].title is empty for top-level options
    const std::vector<OptionGroup>& groups() const { return m_groups; }

    // Exact lookup by invocation string ("-u", "--url").
    const OptionSpec* find(const std::string& invocation) const;

    // Every "--name" starting with prefix, sorted.
    std::vector<std::string> long_names_with_prefix(const std::string& prefix) const;

    // Visible long names without leading hyphens.
    bool is_known_long(const std::string& bare) const;
    bool is_known_valued_long(const std::string& bare) const;

    // Every registered invocation string, across all groups.
    const std::set<std::string>& invocations() const { return m_invocations; }

    std::vector<const OptionSpec*> all() const;
private:
    std::vector<OptionGroup> m_groups;
    std::unordered_map<std::string, const OptionSpec*> m_by_name;
    std::set<std::string> m_invocations;
    std::set<std::string> m_long_options;   // visible, take a value
    std::set<std::string> m_long_switches;  // visible, boolean
};

// Catalogue built from the static schema (options/schema.hpp).
const Catalogue& default_catalogue();

} // namespace argforge
