/*
 * Mnemonic expander implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/normalize/mnemonics.hpp>
#include <argforge/util/console.hpp>
#include <algorithm>
#include <set>
#include <sstream>

namespace argforge {

static std::string without_hyphens(const std::string& s) {
    std::string out;
    for (char c : s) if (c != '-') out.push_back(c);
    return out;
}

static std::string trim(const std::string& s) {
    auto a = s.find_first_not_of(" \t");
    if (a == std::string::npos) return {};
    return s.substr(a, s.find_last_not_of(" \t") - a + 1);
}

MnemonicExpander::MnemonicExpander(const Catalogue& catalogue) {
    for (auto &g : catalogue.groups()) {
        if (g.title.empty()) continue;
        for (auto &opt : g.options) {
            for (auto &name : opt.names) {
                Node* node = &m_root;
                for (char c : without_hyphens(name)) {
                    auto& child = node->next[c];
                    if (!child) child = std::make_unique<Node>();
                    node = child.get();
                    if (std::find(node->current.begin(), node->current.end(), &opt) == node->current.end())
                        node->current.push_back(&opt);
                }
            }
        }
    }
}

Result<const OptionSpec*> MnemonicExpander::resolve(const std::string& code) const {
    const Node* node = &m_root;
    for (char c : code) {
        auto it = node->next.find(c);
        if (it == node->next.end()) { node = nullptr; break; }
        node = it->second.get();
    }
    if (!node || node == &m_root)
        return Failure{ErrorKind::Mnemonic, "mnemonic '" + code + "' can't be resolved to any parameter name", {}};

    if (node->current.size() == 1) {
        log_debug("mnemonic '" + code + "' resolved to " + node->current.front()->names.back());
        return node->current.front();
    }

    // candidate name -> option, in registration order
    std::vector<std::pair<std::string, const OptionSpec*>> candidates;
    for (auto* opt : node->current)
        for (auto &n : opt->names) {
            std::string bare = without_hyphens(n);
            if (bare.rfind(code, 0) == 0) candidates.emplace_back(bare, opt);
        }
    for (auto &[name, opt] : candidates) {
        if (name == code) {
            log_debug("mnemonic '" + code + "' resolved to " + opt->names.back());
            return opt;
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](auto const& a, auto const& b) { return a.first.size() < b.first.size(); });
    std::ostringstream msg;
    msg << "detected ambiguity (mnemonic '" << code << "' can be resolved to any of: ";
    std::set<std::string> listed; bool first = true;
    for (auto &[name, opt] : candidates) {
        if (!listed.insert(name).second) continue;
        msg << (first ? "" : ", ") << "'" << name << "'"; first = false;
    }
    msg << "). Resolved to shortest of those ('" << candidates.front().first << "')";
    log_warning(msg.str());
    return candidates.front().second;
}

std::optional<Failure> MnemonicExpander::expand(const std::string& macro, OptionValues& values) const {
    std::set<std::string> claimed;
    std::istringstream in(macro);
    std::string item;
    while (std::getline(in, item, ',')) {
        auto eq = item.find('=');
        std::string code = trim(without_hyphens(item.substr(0, eq)));
        std::optional<std::string> raw;
        if (eq != std::string::npos) raw = item.substr(eq + 1);

        auto resolved = resolve(code);
        if (auto* f = std::get_if<Failure>(&resolved)) return *f;
        const OptionSpec& spec = *std::get<const OptionSpec*>(resolved);

        if (claimed.count(spec.dest)) {
            log_debug("mnemonic '" + code + "' skipped, '" + spec.dest + "' already set by an earlier code");
            continue;
        }
        if (!spec.takes_value()) {
            values.set(spec.dest, true);
        } else {
            std::optional<OptionValue> value;
            if (raw) value = convert_value(spec.type, *raw);
            if (!value)
                return Failure{ErrorKind::Mnemonic,
                               "mnemonic '" + code + "' requires value of type '" + type_name(spec.type) + "'", {}};
            values.set(spec.dest, std::move(*value));
        }
        claimed.insert(spec.dest);
    }
    return std::nullopt;
}

} // namespace argforge
