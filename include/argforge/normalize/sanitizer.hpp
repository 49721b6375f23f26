/*
 * Lexical sanitizer - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Per-token fix-ups for arguments pasted from word processors and web
 *   pages: typographic dashes in front of an option become ASCII hyphens,
 *   typographic quotes around a token are dropped, and tokens whose value is
 *   wrapped in rich-text quotes or contains a full-width comma are refused.
 */
#pragma once
#include <optional>
#include <string>
#include "argforge/outcome.hpp"

namespace argforge {

// Leading run of dash look-alikes -> same number of '-'.
std::string normalize_dashes(const std::string& token);

// Strips typographic quotation marks from both ends.
std::string strip_quotes(const std::string& token);

// normalize_dashes + strip_quotes; returns token unchanged when nothing applies.
std::string sanitize_token(const std::string& token);

// Lexical failure for rich-text quotes around the value or a full-width comma in it.
std::optional<Failure> check_illegal_characters(const std::string& token);

} // namespace argforge
