#include "string_utils.hpp"

#include <cctype>

std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_space = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            in_space = true;
        } else {
            if (in_space && !out.empty()) {
                out.push_back(' ');
            }
            out.push_back(static_cast<char>(c));
            in_space = false;
        }
    }
    return out;
}

std::string UnicodeToUTF8(int codepoint) {
    std::string out;
    if (codepoint < 0 || codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        // U+FFFD replacement character
        return "\xEF\xBF\xBD";
    }

    if (codepoint <= 0x7F) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    return out;
}

std::size_t utf8_length(const std::string& s) {
    std::size_t length = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

std::string to_lower_copy(const std::string& s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool is_all_caps(const std::string& s) {
    unsigned int letters = 0;
    for (unsigned char c : s) {
        if (c >= 0x80) {
            continue;
        }
        if (std::islower(c)) {
            return false;
        }
        if (std::isupper(c)) {
            ++letters;
        }
    }
    return letters >= 2;
}

nlohmann::ordered_json outline_record_to_json(const PDF_Outline_Record& record) {
    nlohmann::ordered_json json_record;
    json_record["title"] = record.title;
    json_record["outline"] = nlohmann::ordered_json::array();
    for (const PDF_Outline_Entry& entry : record.outline) {
        nlohmann::ordered_json json_entry;
        json_entry["level"] = heading_level_name(entry.level);
        json_entry["text"] = entry.text;
        json_entry["page"] = entry.page;
        json_record["outline"].push_back(std::move(json_entry));
    }
    return json_record;
}

std::string format_outline_record(const PDF_Outline_Record& record) {
    // invalid UTF-8 from broken font encodings must not abort the document
    return outline_record_to_json(record).dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + "\n";
}
