#pragma once

#include <string>
#include <vector>

#include "configuration.hpp"
#include "outline_types.hpp"

class document_deadline;

// Runs collector, profiler, title extraction, classifier and level
// assignment over one document's raw pages. The deadline, when given, is
// checked between stages.
// Throws unreadable_document_error, parse_error or document_timeout_error.
PDF_Outline_Record extract_outline(const std::vector<PDF_Raw_Page>& pages,
                                   const Outline_Configuration& config,
                                   const document_deadline* deadline = nullptr);

// Reads and parses the PDF (releasing MuPDF before classification), then extract_outline.
PDF_Outline_Record extract_outline_from_file(const std::string& file_path,
                                             const Outline_Configuration& config,
                                             document_deadline* deadline = nullptr);
