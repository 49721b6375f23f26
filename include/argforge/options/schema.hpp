/*
 * Static option schema - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   The declarative part of the command line: option groups with their
 *   invocation strings, destinations, types, defaults and help text, plus
 *   the legacy-name tables consulted by the argv rewriter.
 */
#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "argforge/options/option_spec.hpp"

#ifndef ARGFORGE_VERSION
#define ARGFORGE_VERSION "1.0.0#dev"
#endif

namespace argforge::schema {

inline constexpr const char* kVersionString = "argforge/" ARGFORGE_VERSION;
inline constexpr const char* kDummyUrl = "http://foo/bar?id=1";
inline constexpr std::size_t kMaxHelpOptionLength = 18;
inline constexpr const char* kShellExample = "-u http://www.site.com/vuln.php?id=1 --banner";

std::vector<OptionGroup> option_groups();

// Accepted for compatibility with pasted curl commands and dropped.
const std::set<std::string>& ignored_options();

// name -> hint (empty when there is none)
const std::map<std::string, std::string>& deprecated_options();
const std::map<std::string, std::string>& obsolete_options();

// Destinations still listed by the basic (-h) help.
const std::set<std::string>& basic_help_items();

} // namespace argforge::schema
