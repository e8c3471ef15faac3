#include "fragment_collector.hpp"
#include "logging.hpp"
#include "outline_errors.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>

namespace {

struct Line_Accumulator {
    PDF_Fragment line;
    PDF_Fragment last;          // most recently appended piece, used for gap tests
    std::size_t chars = 0;
    std::size_t bold_chars = 0;
    std::size_t italic_chars = 0;
    std::size_t dominant_chars = 0;
};

void start_line(Line_Accumulator& acc, const PDF_Fragment& fragment, std::size_t chars) {
    acc = Line_Accumulator();
    acc.line = fragment;
    acc.last = fragment;
    acc.chars = chars;
    acc.bold_chars = fragment.is_bold ? chars : 0;
    acc.italic_chars = fragment.is_italic ? chars : 0;
    acc.dominant_chars = chars;
}

void append_to_line(Line_Accumulator& acc, const PDF_Fragment& fragment, std::size_t chars, const Outline_Configuration& config) {
    double smaller = std::min(acc.last.font_size, fragment.font_size);
    double gap = fragment.x - (acc.last.x + acc.last.width);
    if (gap > config.space_gap_factor * smaller) {
        acc.line.text += ' ';
    }
    acc.line.text += fragment.text;

    double right = std::max(acc.line.x + acc.line.width, fragment.x + fragment.width);
    double bottom = std::max(acc.line.y + acc.line.height, fragment.y + fragment.height);
    acc.line.x = std::min(acc.line.x, fragment.x);
    acc.line.y = std::min(acc.line.y, fragment.y);
    acc.line.width = right - acc.line.x;
    acc.line.height = bottom - acc.line.y;

    acc.chars += chars;
    if (fragment.is_bold) acc.bold_chars += chars;
    if (fragment.is_italic) acc.italic_chars += chars;
    if (chars > acc.dominant_chars) {
        acc.dominant_chars = chars;
        acc.line.font_size = fragment.font_size;
        acc.line.font_name = fragment.font_name;
    }
    acc.last = fragment;
}

PDF_Fragment finish_line(const Line_Accumulator& acc) {
    PDF_Fragment line = acc.line;
    line.text = collapse_whitespace(line.text);
    line.is_bold = acc.bold_chars * 2 >= acc.chars && acc.bold_chars > 0;
    line.is_italic = acc.italic_chars * 2 >= acc.chars && acc.italic_chars > 0;
    return line;
}

} // namespace

bool same_visual_line(const PDF_Fragment& current, const PDF_Fragment& next, const Outline_Configuration& config) {
    if (current.page != next.page) {
        return false;
    }
    if (std::fabs(current.font_size - next.font_size) > config.size_bucket_epsilon) {
        return false;
    }

    double smaller = std::min(current.font_size, next.font_size);
    if (std::fabs(current.y - next.y) >= config.line_merge_tolerance * smaller) {
        return false;
    }

    double gap = next.x - (current.x + current.width);
    // glyph boxes of adjacent characters may overlap slightly
    return gap > -0.5 * smaller && gap < config.word_gap_factor * smaller;
}

PDF_Normalized_Document collect_fragments(const std::vector<PDF_Raw_Page>& pages, const Outline_Configuration& config) {
    if (pages.empty()) {
        throw unreadable_document_error("document has no pages");
    }

    PDF_Normalized_Document document;
    std::size_t raw_count = 0;

    for (const PDF_Raw_Page& page : pages) {
        document.pages[page.page_number] = page.geometry;

        Line_Accumulator acc;
        bool open = false;

        for (const PDF_Fragment& raw : page.fragments) {
            ++raw_count;
            std::string text = collapse_whitespace(raw.text);
            if (text.empty() || raw.font_size <= 0) {
                continue;
            }

            PDF_Fragment fragment = raw;
            fragment.text = text;
            fragment.page = page.page_number;
            std::size_t chars = utf8_length(text);

            if (open && same_visual_line(acc.last, fragment, config)) {
                append_to_line(acc, fragment, chars, config);
                continue;
            }

            if (open) {
                document.fragments.push_back(finish_line(acc));
            }
            start_line(acc, fragment, chars);
            open = true;
        }

        if (open) {
            document.fragments.push_back(finish_line(acc));
        }
    }

    if (document.fragments.empty()) {
        throw parse_error("no extractable text in " + std::to_string(pages.size()) + " page(s)");
    }

    LOG_CHANNEL_DEBUG("collector") << "Collected " << document.fragments.size() << " line(s) from "
                                   << raw_count << " raw fragment(s) on " << pages.size() << " page(s)";
    return document;
}
