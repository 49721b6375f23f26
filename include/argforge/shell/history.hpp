/*
 * Shell history - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   One plain-text file per prompt kind under <home>/history/, one entry per
 *   line. Only the newest max_length entries are kept.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace argforge {

// Main backs the --shell prompt. Sql and Os are the file keys reserved for the
// --sql-shell and --os-shell prompts of a target session, which share this store.
enum class HistoryKind { Main, Sql, Os };

const char* history_kind_name(HistoryKind kind);

class History {
public:
    History(std::string home_dir, HistoryKind kind, std::size_t max_length = 1000);

    // false when the file exists but cannot be read
    bool load();
    bool save() const;
    void clear() { m_entries.clear(); }
    void add(const std::string& line);

    const std::vector<std::string>& entries() const { return m_entries; }
    std::string path() const;
private:
    void trim();

    std::string m_home;
    HistoryKind m_kind;
    std::size_t m_max;
    std::vector<std::string> m_entries;
};

} // namespace argforge
