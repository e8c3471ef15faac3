#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "outline_types.hpp"

std::string trim_copy(const std::string& s);

// Trims and replaces every whitespace run with a single space.
std::string collapse_whitespace(const std::string& s);

std::string UnicodeToUTF8(int codepoint);

// Number of code points, continuation bytes are not counted.
std::size_t utf8_length(const std::string& s);

// ASCII only, other bytes are copied through.
std::string to_lower_copy(const std::string& s);

// At least two letters and no lowercase ASCII letter.
bool is_all_caps(const std::string& s);

nlohmann::ordered_json outline_record_to_json(const PDF_Outline_Record& record);

// Two-space indented JSON with the fixed key order title, outline(level, text, page).
std::string format_outline_record(const PDF_Outline_Record& record);
