#pragma once

#include <vector>

#include "configuration.hpp"
#include "outline_types.hpp"

// Positions closer than this (points) on the same page are the same spot.
#ifndef PDF_OUTLINE_DUPLICATE_POSITION_DELTA
#define PDF_OUTLINE_DUPLICATE_POSITION_DELTA 0.5
#endif

// Maps the distinct size ranks present among `candidates` onto H1..H3,
// largest first; ranks past the third fold into H3. Duplicates are removed
// keeping the first in document order and the result is sorted by page,
// then top-to-bottom.
std::vector<PDF_Outline_Entry> assign_levels(const std::vector<PDF_Heading_Candidate>& candidates, const Outline_Configuration& config);
