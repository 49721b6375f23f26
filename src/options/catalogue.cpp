/*
 * Option catalogue implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/options/catalogue.hpp>
#include <argforge/options/schema.hpp>

namespace argforge {

Catalogue::Catalogue(std::vector<OptionGroup> groups) : m_groups(std::move(groups)) {
    // m_groups is not touched after this point, so the OptionSpec pointers stay valid
    for (auto &g : m_groups) {
        for (auto &opt : g.options) {
            for (auto &name : opt.names) {
                m_by_name[name] = &opt;
                m_invocations.insert(name);
                if (opt.hidden || name.rfind("--", 0) != 0) continue;
                if (opt.takes_value()) m_long_options.insert(name.substr(2));
                else m_long_switches.insert(name.substr(2));
            }
        }
    }
}

const OptionSpec* Catalogue::find(const std::string& invocation) const {
    auto it = m_by_name.find(invocation);
    return it == m_by_name.end() ? nullptr : it->second;
}

std::vector<std::string> Catalogue::long_names_with_prefix(const std::string& prefix) const {
    std::vector<std::string> out;
    for (auto it = m_invocations.lower_bound(prefix); it != m_invocations.end(); ++it) {
        if (it->rfind(prefix, 0) != 0) break;
        if (it->rfind("--", 0) == 0) out.push_back(*it);
    }
    return out;
}

bool Catalogue::is_known_long(const std::string& bare) const {
    return m_long_options.count(bare) != 0 || m_long_switches.count(bare) != 0;
}

bool Catalogue::is_known_valued_long(const std::string& bare) const {
    return m_long_options.count(bare) != 0;
}

std::vector<const OptionSpec*> Catalogue::all() const {
    std::vector<const OptionSpec*> out;
    for (auto &g : m_groups) for (auto &opt : g.options) out.push_back(&opt);
    return out;
}

const Catalogue& default_catalogue() {
    static const Catalogue catalogue(schema::option_groups());
    return catalogue;
}

} // namespace argforge
