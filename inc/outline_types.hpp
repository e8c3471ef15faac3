#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

// A contiguous run of text with uniform font metadata.
// Coordinates are in points, y is the top edge and grows downwards.
struct PDF_Fragment {
    std::string text;
    unsigned int page = 1;
    double font_size = 0;
    std::string font_name;
    bool is_bold = false;
    bool is_italic = false;
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

struct PDF_Page_Geometry {
    std::optional<double> width;
    std::optional<double> height;
};

// One page as emitted by the PDF reader, before normalization.
struct PDF_Raw_Page {
    unsigned int page_number = 1;
    PDF_Page_Geometry geometry;
    std::vector<PDF_Fragment> fragments;
};

// Line-level fragments in document order, plus page geometry by page number.
struct PDF_Normalized_Document {
    std::vector<PDF_Fragment> fragments;
    std::map<unsigned int, PDF_Page_Geometry> pages;
};

// Range of histogram sizes folded into one candidate size.
struct PDF_Size_Bucket {
    double representative = 0;  // largest member, the value listed in candidate_sizes
    double smallest = 0;
};

struct PDF_Font_Profile {
    double body_size = 0;
    std::vector<double> candidate_sizes;        // descending, one per bucket
    std::vector<PDF_Size_Bucket> buckets;       // parallel to candidate_sizes
    std::map<double, double> size_histogram;    // rounded size -> character weight
    bool is_flat = false;
};

struct PDF_Heading_Candidate {
    PDF_Fragment fragment;
    double score = 0;
    std::size_t size_rank = 0;  // index into PDF_Font_Profile::candidate_sizes
    std::size_t order = 0;      // index in document order
};

enum class Heading_Level { H1 = 1, H2 = 2, H3 = 3 };

struct PDF_Outline_Entry {
    Heading_Level level = Heading_Level::H1;
    std::string text;
    unsigned int page = 1;

    // not serialized
    double font_size = 0;
    double y = 0;
};

struct PDF_Outline_Record {
    std::string title;
    std::vector<PDF_Outline_Entry> outline;
};

// "H1", "H2" or "H3"
const char* heading_level_name(Heading_Level level);
