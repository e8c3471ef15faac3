#include "outline_extractor.hpp"
#include "deadline.hpp"
#include "font_profiler.hpp"
#include "fragment_collector.hpp"
#include "heading_classifier.hpp"
#include "level_assigner.hpp"
#include "logging.hpp"
#include "pdf_utils.hpp"
#include "title_extractor.hpp"

namespace {

void check_deadline(const document_deadline* deadline, const char* stage) {
    if (deadline) {
        deadline->check(stage);
    }
}

} // namespace

PDF_Outline_Record extract_outline(const std::vector<PDF_Raw_Page>& pages,
                                   const Outline_Configuration& config,
                                   const document_deadline* deadline) {
    PDF_Normalized_Document document = collect_fragments(pages, config);
    check_deadline(deadline, "fragment collection");

    PDF_Font_Profile profile = build_font_profile(document.fragments, config);
    check_deadline(deadline, "font profiling");

    PDF_Title title = extract_title(document, config);
    check_deadline(deadline, "title extraction");

    PDF_Outline_Record record;
    record.title = title.text;

    if (!profile.is_flat) {
        std::vector<PDF_Heading_Candidate> candidates = classify_headings(document, profile, config, title.fragment_indices);
        check_deadline(deadline, "heading classification");

        record.outline = assign_levels(candidates, config);
        check_deadline(deadline, "level assignment");
    }

    return record;
}

PDF_Outline_Record extract_outline_from_file(const std::string& file_path,
                                             const Outline_Configuration& config,
                                             document_deadline* deadline) {
    std::vector<PDF_Raw_Page> pages = parse_pdf_file(file_path, deadline);
    PDF_Outline_Record record = extract_outline(pages, config, deadline);
    LOG_INFO << "Extracted " << record.outline.size() << " heading(s) from " << file_path;
    return record;
}
