#include "heading_classifier.hpp"
#include "font_profiler.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <utility>

double size_ratio_signal(const PDF_Fragment& fragment, const PDF_Font_Profile& profile, const Heading_Score_Weights& weights) {
    if (profile.body_size <= 0) {
        return 0;
    }
    double ratio = fragment.font_size / profile.body_size;
    return std::clamp(ratio - 1.0, 0.0, 1.0) * weights.size_ratio;
}

double bold_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights) {
    return fragment.is_bold ? weights.bold : 0;
}

double italic_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights) {
    return fragment.is_italic ? weights.italic : 0;
}

bool has_numbering_pattern(const std::string& text) {
    // "1." / "1.2." with a trailing dot, a dotted sequence "1.1", a keyword, or a roman numeral with a dot
    static const std::regex numbering("^(\\d+(\\.\\d+)*\\.(\\s|$)|\\d+(\\.\\d+)+|(chapter|section|part|appendix)\\b|[ivxlc]+\\.\\s)",
                                      std::regex::icase);
    return std::regex_search(trim_copy(text), numbering);
}

double numbering_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights) {
    return has_numbering_pattern(fragment.text) ? weights.numbering : 0;
}

double all_caps_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights) {
    if (utf8_length(fragment.text) > PDF_OUTLINE_ALL_CAPS_MAX_LENGTH) {
        return 0;
    }
    return is_all_caps(fragment.text) ? weights.all_caps : 0;
}

double length_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights) {
    std::size_t length = utf8_length(trim_copy(fragment.text));
    return (length >= PDF_OUTLINE_LENGTH_SIGNAL_MIN && length <= PDF_OUTLINE_LENGTH_SIGNAL_MAX) ? weights.length : 0;
}

double keyword_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights) {
    static const char* const keywords[] = {"introduction", "background", "methodology", "results", "conclusion"};
    std::string text = to_lower_copy(fragment.text);
    for (const char* keyword : keywords) {
        if (text.find(keyword) != std::string::npos) {
            return weights.keyword;
        }
    }
    return 0;
}

double left_position_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights) {
    return fragment.x < PDF_OUTLINE_LEFT_POSITION_MAX_X ? weights.left_position : 0;
}

double heading_score(const PDF_Fragment& fragment, const PDF_Font_Profile& profile, const Outline_Configuration& config) {
    const Heading_Score_Weights& weights = config.weights;
    return size_ratio_signal(fragment, profile, weights)
           + bold_signal(fragment, weights)
           + italic_signal(fragment, weights)
           + numbering_signal(fragment, weights)
           + all_caps_signal(fragment, weights)
           + length_signal(fragment, weights)
           + keyword_signal(fragment, weights)
           + left_position_signal(fragment, weights);
}

std::optional<double> body_left_margin(const std::vector<PDF_Fragment>& fragments, const PDF_Font_Profile& profile, const Outline_Configuration& config) {
    std::map<double, std::size_t> left_edges;
    for (const PDF_Fragment& fragment : fragments) {
        if (std::fabs(round_font_size(fragment.font_size) - profile.body_size) > config.size_bucket_epsilon) {
            continue;
        }
        left_edges[std::round(fragment.x)] += utf8_length(fragment.text);
    }

    std::optional<double> margin;
    std::size_t best = 0;
    for (const auto& [x, weight] : left_edges) {
        if (weight > best) {
            best = weight;
            margin = x;
        }
    }
    return margin;
}

bool in_margin_band(const PDF_Fragment& fragment, const PDF_Page_Geometry& geometry, double band_fraction) {
    if (!geometry.height || *geometry.height <= 0) {
        return false;
    }
    double band = *geometry.height * band_fraction;
    double centre = fragment.y + fragment.height / 2;
    return centre < band || centre > *geometry.height - band;
}

std::set<std::size_t> running_margin_lines(const PDF_Normalized_Document& document, const Outline_Configuration& config) {
    std::map<std::string, std::set<unsigned int>> pages_of_text;
    std::vector<std::pair<std::size_t, std::string>> margin_lines;

    for (std::size_t i = 0; i < document.fragments.size(); ++i) {
        const PDF_Fragment& fragment = document.fragments[i];
        auto page_it = document.pages.find(fragment.page);
        if (page_it == document.pages.end() || !in_margin_band(fragment, page_it->second, config.margin_band_fraction)) {
            continue;
        }
        std::string key = to_lower_copy(trim_copy(fragment.text));
        pages_of_text[key].insert(fragment.page);
        margin_lines.emplace_back(i, key);
    }

    std::set<std::size_t> running;
    for (const auto& [index, key] : margin_lines) {
        if (pages_of_text[key].size() >= 2) {
            running.insert(index);
        }
    }
    return running;
}

bool has_heading_alignment(const PDF_Fragment& fragment, const PDF_Page_Geometry& geometry, const std::optional<double>& body_left, const Outline_Configuration& config) {
    if (!body_left) {
        return true;
    }

    if (fragment.x >= *body_left - config.alignment_tolerance &&
        fragment.x <= *body_left + config.max_indent) {
        return true;
    }

    if (geometry.width && *geometry.width > 0) {
        double page_centre = *geometry.width / 2;
        double centre = fragment.x + fragment.width / 2;
        return std::fabs(centre - page_centre) <= config.center_tolerance_fraction * *geometry.width;
    }

    return false;
}

std::vector<PDF_Heading_Candidate> classify_headings(const PDF_Normalized_Document& document,
                                                     const PDF_Font_Profile& profile,
                                                     const Outline_Configuration& config,
                                                     const std::set<std::size_t>& excluded) {
    std::vector<PDF_Heading_Candidate> candidates;
    if (profile.candidate_sizes.empty()) {
        return candidates;
    }

    std::map<unsigned int, double> largest_on_page;
    for (const PDF_Fragment& fragment : document.fragments) {
        double size = round_font_size(fragment.font_size);
        double& largest = largest_on_page[fragment.page];
        largest = std::max(largest, size);
    }

    std::optional<double> body_left = body_left_margin(document.fragments, profile, config);
    std::set<std::size_t> running = running_margin_lines(document, config);
    std::size_t rejected_by_position = 0;

    for (std::size_t order = 0; order < document.fragments.size(); ++order) {
        const PDF_Fragment& fragment = document.fragments[order];

        if (excluded.count(order)) {
            continue;
        }

        std::optional<std::size_t> bucket = candidate_bucket(profile, fragment.font_size);
        if (!bucket) {
            continue;
        }

        std::size_t length = utf8_length(trim_copy(fragment.text));
        if (length < config.min_heading_length || length > config.max_heading_length) {
            continue;
        }

        PDF_Page_Geometry geometry;
        auto page_it = document.pages.find(fragment.page);
        if (page_it != document.pages.end()) {
            geometry = page_it->second;
        }

        // running headers and footers never get the largest-on-page exemption
        bool largest = round_font_size(fragment.font_size) >= largest_on_page[fragment.page] && !running.count(order);
        if (!largest && in_margin_band(fragment, geometry, config.margin_band_fraction)) {
            ++rejected_by_position;
            continue;
        }

        if (!has_heading_alignment(fragment, geometry, body_left, config)) {
            ++rejected_by_position;
            continue;
        }

        double score = heading_score(fragment, profile, config);
        if (score < config.min_heading_score) {
            continue;
        }

        PDF_Heading_Candidate candidate;
        candidate.fragment = fragment;
        candidate.fragment.text = trim_copy(fragment.text);
        candidate.score = score;
        candidate.size_rank = *bucket;
        candidate.order = order;
        candidates.push_back(std::move(candidate));
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const PDF_Heading_Candidate& a, const PDF_Heading_Candidate& b) {
                  if (a.size_rank != b.size_rank) return a.size_rank < b.size_rank;
                  if (a.score != b.score) return a.score > b.score;
                  return a.order < b.order;
              });

    LOG_CHANNEL_DEBUG("classifier") << candidates.size() << " heading candidate(s), "
                                    << rejected_by_position << " rejected by position";
    return candidates;
}
