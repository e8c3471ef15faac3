#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "configuration.hpp"
#include "outline_types.hpp"

#ifndef PDF_OUTLINE_ALL_CAPS_MAX_LENGTH
#define PDF_OUTLINE_ALL_CAPS_MAX_LENGTH 60
#endif

#ifndef PDF_OUTLINE_LENGTH_SIGNAL_MIN
#define PDF_OUTLINE_LENGTH_SIGNAL_MIN 10
#endif

#ifndef PDF_OUTLINE_LENGTH_SIGNAL_MAX
#define PDF_OUTLINE_LENGTH_SIGNAL_MAX 80
#endif

// Absolute x (points) under which a line counts as sitting at the left edge.
#ifndef PDF_OUTLINE_LEFT_POSITION_MAX_X
#define PDF_OUTLINE_LEFT_POSITION_MAX_X 100
#endif

// ===== score signals =====
// Each signal returns its weighted contribution, 0 when it does not fire.

// min(size / body - 1, 1) scaled by the size weight
double size_ratio_signal(const PDF_Fragment& fragment, const PDF_Font_Profile& profile, const Heading_Score_Weights& weights);
double bold_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights);
double italic_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights);
// "1.", "1.1", "2.3.4", "Chapter", "Section", "Part", "Appendix", "IV. "; a bare "2024" does not count
double numbering_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights);
double all_caps_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights);
double length_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights);
// "introduction", "background", "methodology", "results", "conclusion" anywhere in the text
double keyword_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights);
double left_position_signal(const PDF_Fragment& fragment, const Heading_Score_Weights& weights);

bool has_numbering_pattern(const std::string& text);

// Sum of all signals. Pure: depends only on its arguments.
double heading_score(const PDF_Fragment& fragment, const PDF_Font_Profile& profile, const Outline_Configuration& config);

// ===== position filters =====

// Left x shared by most body-size characters, nullopt without body text.
std::optional<double> body_left_margin(const std::vector<PDF_Fragment>& fragments, const PDF_Font_Profile& profile, const Outline_Configuration& config);

// Vertical centre inside the top or bottom band. Always false without a page height.
bool in_margin_band(const PDF_Fragment& fragment, const PDF_Page_Geometry& geometry, double band_fraction);

// Document-order indices of margin-band lines whose text (case-insensitive)
// sits in a margin band on at least two pages: running headers and footers.
std::set<std::size_t> running_margin_lines(const PDF_Normalized_Document& document, const Outline_Configuration& config);

// Left-aligned with (or indented from) the body margin, or centred on the page.
bool has_heading_alignment(const PDF_Fragment& fragment, const PDF_Page_Geometry& geometry, const std::optional<double>& body_left, const Outline_Configuration& config);

// Applies the qualification filters and returns candidates ordered by
// size rank, then score (highest first), then document order.
// `excluded` holds document-order indices that must never qualify (the title lines).
std::vector<PDF_Heading_Candidate> classify_headings(const PDF_Normalized_Document& document,
                                                     const PDF_Font_Profile& profile,
                                                     const Outline_Configuration& config,
                                                     const std::set<std::size_t>& excluded = {});
