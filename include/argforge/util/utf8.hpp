/*
 * UTF-8 helpers - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace argforge {

// Malformed sequences decode to U+FFFD, one per offending byte.
std::u32string utf8_decode(const std::string& s);
std::string utf8_encode(const std::u32string& s);

} // namespace argforge
