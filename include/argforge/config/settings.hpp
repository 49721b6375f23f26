/*
 * Runtime settings - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Settings come from ~/.argforgerc, one key=value per line, '#' starts a
 *   comment line. Unknown keys are ignored. ARGFORGE_HOME overrides home_dir.
 */
#pragma once
#include <cstddef>
#include <istream>
#include <string>

namespace argforge {

struct Settings {
    bool color = true;
    std::string prompt = "argforge > ";
    std::string home_dir;                 // history/ and output/ live here
    std::size_t history_length = 1000;
    bool non_interactive = false;         // no "Press Enter" guard on Windows
};

std::string default_home_dir();

Settings parse_settings(std::istream& in, Settings base = {});
Settings load_settings();

} // namespace argforge
