#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "configuration.hpp"
#include "outline_types.hpp"

// Sizes are compared after rounding to this step (points).
#ifndef PDF_OUTLINE_SIZE_ROUNDING_STEP
#define PDF_OUTLINE_SIZE_ROUNDING_STEP 0.1
#endif

double round_font_size(double font_size);

// Character-weighted histogram, body size and descending candidate buckets.
// A document with fewer than two distinct sizes is flat and has no candidates.
PDF_Font_Profile build_font_profile(const std::vector<PDF_Fragment>& fragments, const Outline_Configuration& config);

// Index of the candidate bucket `font_size` falls into, if any.
std::optional<std::size_t> candidate_bucket(const PDF_Font_Profile& profile, double font_size);
