#include "font_profiler.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <cmath>

namespace {

const double size_compare_slack = 1e-6;

} // namespace

double round_font_size(double font_size) {
    return std::round(font_size / PDF_OUTLINE_SIZE_ROUNDING_STEP) * PDF_OUTLINE_SIZE_ROUNDING_STEP;
}

PDF_Font_Profile build_font_profile(const std::vector<PDF_Fragment>& fragments, const Outline_Configuration& config) {
    PDF_Font_Profile profile;

    for (const PDF_Fragment& fragment : fragments) {
        if (fragment.font_size <= 0) {
            continue;
        }
        profile.size_histogram[round_font_size(fragment.font_size)] += static_cast<double>(utf8_length(fragment.text));
    }

    // map is ascending, so a strict comparison keeps the smaller size on ties
    double best_weight = -1;
    for (const auto& [size, weight] : profile.size_histogram) {
        if (weight > best_weight) {
            best_weight = weight;
            profile.body_size = size;
        }
    }

    if (profile.size_histogram.size() < 2) {
        profile.is_flat = true;
        LOG_CHANNEL_WARNING("profiler") << "Flat document: " << profile.size_histogram.size()
                                        << " distinct font size(s), no headings can be produced";
        return profile;
    }

    double minimum = profile.body_size * config.heading_size_threshold;
    for (auto it = profile.size_histogram.rbegin(); it != profile.size_histogram.rend(); ++it) {
        double size = it->first;
        if (size <= profile.body_size || size < minimum - size_compare_slack) {
            break;
        }

        if (!profile.buckets.empty() &&
            profile.buckets.back().representative - size <= config.size_bucket_epsilon + size_compare_slack) {
            profile.buckets.back().smallest = size;
        } else {
            profile.buckets.push_back({size, size});
            profile.candidate_sizes.push_back(size);
        }
    }

    LOG_CHANNEL_DEBUG("profiler") << "Body size " << profile.body_size << "pt, "
                                  << profile.candidate_sizes.size() << " candidate size bucket(s)";
    return profile;
}

std::optional<std::size_t> candidate_bucket(const PDF_Font_Profile& profile, double font_size) {
    double size = round_font_size(font_size);
    for (std::size_t i = 0; i < profile.buckets.size(); ++i) {
        const PDF_Size_Bucket& bucket = profile.buckets[i];
        if (size >= bucket.smallest - size_compare_slack && size <= bucket.representative + size_compare_slack) {
            return i;
        }
    }
    return std::nullopt;
}
