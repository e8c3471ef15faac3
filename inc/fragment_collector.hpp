#pragma once

#include <vector>

#include "configuration.hpp"
#include "outline_types.hpp"

// True when `next` continues the visual line of `current`: same page and
// size bucket, vertical offset below line_merge_tolerance x the smaller
// size, horizontal gap below word_gap_factor x the smaller size.
bool same_visual_line(const PDF_Fragment& current, const PDF_Fragment& next, const Outline_Configuration& config);

// Flattens raw pages into line-level fragments in document order.
// Blank fragments are dropped, whitespace runs collapsed.
// Throws unreadable_document_error when `pages` is empty and parse_error
// when pages exist but no fragment survives.
PDF_Normalized_Document collect_fragments(const std::vector<PDF_Raw_Page>& pages, const Outline_Configuration& config);
