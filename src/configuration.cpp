#include "configuration.hpp"
#include "logging.hpp"
#include "outline_errors.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <set>

namespace {

const std::set<std::string> known_keys = {
    "min_heading_length", "max_heading_length", "heading_size_threshold",
    "margin_band_fraction", "max_levels", "min_heading_score", "weights",
    "size_bucket_epsilon", "alignment_tolerance", "max_indent",
    "center_tolerance_fraction", "line_merge_tolerance", "word_gap_factor",
    "space_gap_factor", "title_line_gap_factor", "merge_repeated_headings",
    "document_timeout_seconds"
};

template <typename T>
void read_field(const nlohmann::json& json, const char* key, T& field) {
    auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    try {
        field = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw configuration_error(std::string("invalid value for '") + key + "': " + e.what());
    }
}

// get<unsigned int>() wraps negative numbers around instead of failing
void read_field(const nlohmann::json& json, const char* key, unsigned int& field) {
    auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    bool in_range = false;
    if (it->is_number_unsigned()) {
        in_range = it->get<std::uint64_t>() <= std::numeric_limits<unsigned int>::max();
    } else if (it->is_number_integer()) {
        std::int64_t value = it->get<std::int64_t>();
        in_range = value >= 0 && static_cast<std::uint64_t>(value) <= std::numeric_limits<unsigned int>::max();
    }
    if (!in_range) {
        throw configuration_error(std::string("invalid value for '") + key + "': expected a non-negative integer");
    }
    read_field<unsigned int>(json, key, field);
}

} // namespace

void validate_configuration(const Outline_Configuration& config) {
    if (config.min_heading_length == 0) {
        throw configuration_error("min_heading_length must be at least 1");
    }
    if (config.max_heading_length < config.min_heading_length) {
        throw configuration_error("max_heading_length must not be smaller than min_heading_length");
    }
    if (config.heading_size_threshold < 1.0) {
        throw configuration_error("heading_size_threshold must be >= 1.0");
    }
    if (config.margin_band_fraction < 0.0 || config.margin_band_fraction >= 0.5) {
        throw configuration_error("margin_band_fraction must be in [0, 0.5)");
    }
    if (config.max_levels != PDF_OUTLINE_MAX_LEVELS) {
        throw configuration_error("max_levels is fixed at " + std::to_string(PDF_OUTLINE_MAX_LEVELS));
    }
    if (config.size_bucket_epsilon < 0.0) {
        throw configuration_error("size_bucket_epsilon must not be negative");
    }
    if (config.alignment_tolerance < 0.0 || config.max_indent < 0.0 || config.center_tolerance_fraction < 0.0) {
        throw configuration_error("alignment tolerances must not be negative");
    }
    if (config.line_merge_tolerance <= 0.0 || config.word_gap_factor <= 0.0 || config.space_gap_factor < 0.0) {
        throw configuration_error("line merge factors must be positive");
    }
    if (config.title_line_gap_factor < 0.0) {
        throw configuration_error("title_line_gap_factor must not be negative");
    }
    if (config.document_timeout_seconds <= 0.0) {
        throw configuration_error("document_timeout_seconds must be positive");
    }
}

void apply_configuration_json(Outline_Configuration& config, const nlohmann::json& json) {
    if (!json.is_object()) {
        throw configuration_error("configuration must be a JSON object");
    }

    for (auto it = json.begin(); it != json.end(); ++it) {
        if (known_keys.find(it.key()) == known_keys.end()) {
            LOG_CHANNEL_WARNING("config") << "Ignoring unknown configuration key '" << it.key() << "'";
        }
    }

    read_field(json, "min_heading_length", config.min_heading_length);
    read_field(json, "max_heading_length", config.max_heading_length);
    read_field(json, "heading_size_threshold", config.heading_size_threshold);
    read_field(json, "margin_band_fraction", config.margin_band_fraction);
    read_field(json, "max_levels", config.max_levels);
    read_field(json, "min_heading_score", config.min_heading_score);
    read_field(json, "size_bucket_epsilon", config.size_bucket_epsilon);
    read_field(json, "alignment_tolerance", config.alignment_tolerance);
    read_field(json, "max_indent", config.max_indent);
    read_field(json, "center_tolerance_fraction", config.center_tolerance_fraction);
    read_field(json, "line_merge_tolerance", config.line_merge_tolerance);
    read_field(json, "word_gap_factor", config.word_gap_factor);
    read_field(json, "space_gap_factor", config.space_gap_factor);
    read_field(json, "title_line_gap_factor", config.title_line_gap_factor);
    read_field(json, "merge_repeated_headings", config.merge_repeated_headings);
    read_field(json, "document_timeout_seconds", config.document_timeout_seconds);

    auto weights = json.find("weights");
    if (weights != json.end()) {
        if (!weights->is_object()) {
            throw configuration_error("'weights' must be a JSON object");
        }
        read_field(*weights, "size_ratio", config.weights.size_ratio);
        read_field(*weights, "bold", config.weights.bold);
        read_field(*weights, "italic", config.weights.italic);
        read_field(*weights, "numbering", config.weights.numbering);
        read_field(*weights, "all_caps", config.weights.all_caps);
        read_field(*weights, "length", config.weights.length);
        read_field(*weights, "keyword", config.weights.keyword);
        read_field(*weights, "left_position", config.weights.left_position);
    }
}

Outline_Configuration load_configuration_file(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        throw configuration_error("cannot open configuration file " + file_path);
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw configuration_error("cannot parse configuration file " + file_path + ": " + e.what());
    }

    Outline_Configuration config;
    apply_configuration_json(config, json);
    validate_configuration(config);
    LOG_CHANNEL_INFO("config") << "Loaded configuration from " << file_path;
    return config;
}
