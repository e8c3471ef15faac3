#pragma once

#include <string>

#include <nlohmann/json.hpp>

#ifndef PDF_OUTLINE_MIN_HEADING_LENGTH
#define PDF_OUTLINE_MIN_HEADING_LENGTH 3
#endif

#ifndef PDF_OUTLINE_MAX_HEADING_LENGTH
#define PDF_OUTLINE_MAX_HEADING_LENGTH 200
#endif

// source heuristics disagree between 1.1 and 1.2, keep it overridable
#ifndef PDF_OUTLINE_HEADING_SIZE_THRESHOLD
#define PDF_OUTLINE_HEADING_SIZE_THRESHOLD 1.10
#endif

#ifndef PDF_OUTLINE_MARGIN_BAND_FRACTION
#define PDF_OUTLINE_MARGIN_BAND_FRACTION 0.08
#endif

#ifndef PDF_OUTLINE_MAX_LEVELS
#define PDF_OUTLINE_MAX_LEVELS 3
#endif

#ifndef PDF_OUTLINE_DOCUMENT_TIMEOUT_SECONDS
#define PDF_OUTLINE_DOCUMENT_TIMEOUT_SECONDS 10.0
#endif

struct Heading_Score_Weights {
    double size_ratio = 0.4;
    double bold = 0.3;
    double italic = 0.1;
    double numbering = 0.2;
    double all_caps = 0.1;
    double length = 0.1;
    double keyword = 0.2;
    double left_position = 0.2;
};

struct Outline_Configuration {
    // heading filters
    unsigned int min_heading_length = PDF_OUTLINE_MIN_HEADING_LENGTH;
    unsigned int max_heading_length = PDF_OUTLINE_MAX_HEADING_LENGTH;
    double heading_size_threshold = PDF_OUTLINE_HEADING_SIZE_THRESHOLD;
    double margin_band_fraction = PDF_OUTLINE_MARGIN_BAND_FRACTION;
    unsigned int max_levels = PDF_OUTLINE_MAX_LEVELS;
    double min_heading_score = 0.0;
    Heading_Score_Weights weights;

    // font size bucketing
    double size_bucket_epsilon = 0.5;

    // alignment, in points unless stated otherwise
    double alignment_tolerance = 6.0;
    double max_indent = 72.0;
    double center_tolerance_fraction = 0.05;

    // line merging, as multiples of the smaller font size
    double line_merge_tolerance = 0.5;
    double word_gap_factor = 1.0;
    double space_gap_factor = 0.15;

    // title
    double title_line_gap_factor = 1.5;

    bool merge_repeated_headings = true;

    double document_timeout_seconds = PDF_OUTLINE_DOCUMENT_TIMEOUT_SECONDS;
};

// Throws configuration_error describing the first invalid field.
void validate_configuration(const Outline_Configuration& config);

// Overrides the fields present in `json`, leaving the others untouched.
// Unknown keys are logged and ignored. Throws configuration_error on
// mistyped values.
void apply_configuration_json(Outline_Configuration& config, const nlohmann::json& json);

// Reads a JSON configuration file on top of the defaults and validates it.
Outline_Configuration load_configuration_file(const std::string& file_path);
