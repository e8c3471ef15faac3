#pragma once

#include <cstddef>
#include <set>
#include <string>

#include "configuration.hpp"
#include "outline_types.hpp"

struct PDF_Title {
    std::string text;
    // document-order indices of the lines joined into `text`
    std::set<std::size_t> fragment_indices;
};

// Joins the top run of largest-size lines on page 1, skipping margin bands
// unless nothing else is left. Running headers and footers (see
// running_margin_lines) are never considered. Returns an empty title when
// page 1 has no other text.
PDF_Title extract_title(const PDF_Normalized_Document& document, const Outline_Configuration& config);
