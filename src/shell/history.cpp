/*
 * Shell history implementation - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/shell/history.hpp>
#include <argforge/util/console.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace argforge {

const char* history_kind_name(HistoryKind kind) {
    switch (kind) {
        case HistoryKind::Main: return "main";
        case HistoryKind::Sql: return "sql";
        case HistoryKind::Os: return "os";
    }
    return "main";
}

History::History(std::string home_dir, HistoryKind kind, std::size_t max_length)
    : m_home(std::move(home_dir)), m_kind(kind), m_max(max_length) {}

std::string History::path() const {
    return (fs::path(m_home) / "history" / (std::string(history_kind_name(m_kind)) + ".hst")).string();
}

void History::trim() {
    if (m_entries.size() > m_max)
        m_entries.erase(m_entries.begin(), m_entries.end() - static_cast<std::ptrdiff_t>(m_max));
}

void History::add(const std::string& line) {
    if (line.empty()) return;
    m_entries.push_back(line);
    trim();
}

bool History::load() {
    m_entries.clear();
    std::error_code ec;
    if (!fs::exists(path(), ec)) return true;
    std::ifstream in(path());
    if (!in) {
        log_warning("there was a problem loading the history file '" + path() + "'");
        return false;
    }
    std::string line;
    while (std::getline(in, line)) if (!line.empty()) m_entries.push_back(line);
    trim();
    return true;
}

bool History::save() const {
    std::error_code ec;
    fs::create_directories(fs::path(path()).parent_path(), ec);
    std::ofstream out(path(), std::ios::trunc);
    if (!out) {
        log_warning("there was a problem writing the history file '" + path() + "'");
        return false;
    }
    for (auto &e : m_entries) out << e << '\n';
    return static_cast<bool>(out);
}

} // namespace argforge
