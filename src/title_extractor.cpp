#include "title_extractor.hpp"
#include "font_profiler.hpp"
#include "heading_classifier.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace {

const unsigned int title_page = 1;

// Another page-1 line starts strictly between the two title lines.
bool interrupted(const std::vector<PDF_Fragment>& fragments,
                 const std::vector<std::size_t>& page_lines,
                 const std::set<std::size_t>& title_lines,
                 const PDF_Fragment& upper, const PDF_Fragment& lower) {
    for (std::size_t index : page_lines) {
        if (title_lines.count(index)) {
            continue;
        }
        double y = fragments[index].y;
        if (y > upper.y && y < lower.y) {
            return true;
        }
    }
    return false;
}

} // namespace

PDF_Title extract_title(const PDF_Normalized_Document& document, const Outline_Configuration& config) {
    PDF_Title title;
    const std::vector<PDF_Fragment>& fragments = document.fragments;

    // a header or footer repeated across pages is never the title, even as a fallback
    std::set<std::size_t> running = running_margin_lines(document, config);

    std::vector<std::size_t> page_lines;
    double largest = 0;
    for (std::size_t i = 0; i < fragments.size(); ++i) {
        if (fragments[i].page == title_page && !running.count(i)) {
            page_lines.push_back(i);
            largest = std::max(largest, round_font_size(fragments[i].font_size));
        }
    }
    if (page_lines.empty()) {
        LOG_CHANNEL_DEBUG("title") << "No text on page 1 outside running headers, title left empty";
        return title;
    }

    PDF_Page_Geometry geometry;
    auto page_it = document.pages.find(title_page);
    if (page_it != document.pages.end()) {
        geometry = page_it->second;
    }

    std::vector<std::size_t> largest_lines;
    std::vector<std::size_t> outside_margins;
    for (std::size_t index : page_lines) {
        if (std::fabs(round_font_size(fragments[index].font_size) - largest) > config.size_bucket_epsilon) {
            continue;
        }
        largest_lines.push_back(index);
        if (!in_margin_band(fragments[index], geometry, config.margin_band_fraction)) {
            outside_margins.push_back(index);
        }
    }

    std::vector<std::size_t> candidates = outside_margins.empty() ? largest_lines : outside_margins;
    std::stable_sort(candidates.begin(), candidates.end(), [&fragments](std::size_t a, std::size_t b) {
        if (fragments[a].y != fragments[b].y) return fragments[a].y < fragments[b].y;
        return fragments[a].x < fragments[b].x;
    });

    std::size_t first = candidates.front();
    title.text = trim_copy(fragments[first].text);
    title.fragment_indices.insert(first);
    const PDF_Fragment* previous = &fragments[first];

    for (std::size_t i = 1; i < candidates.size(); ++i) {
        const PDF_Fragment& next = fragments[candidates[i]];
        double gap = next.y - (previous->y + previous->height);
        if (gap > config.title_line_gap_factor * next.font_size) {
            break;
        }
        if (interrupted(fragments, page_lines, title.fragment_indices, *previous, next)) {
            break;
        }

        std::string joined = title.text + " " + trim_copy(next.text);
        if (utf8_length(joined) > config.max_heading_length) {
            break;
        }

        title.text = joined;
        title.fragment_indices.insert(candidates[i]);
        previous = &next;
    }

    LOG_CHANNEL_DEBUG("title") << "Title '" << title.text << "' from " << title.fragment_indices.size() << " line(s)";
    return title;
}
