#pragma once

#include <string>
#include <vector>

#include <mupdf/fitz.h>

#include "outline_types.hpp"

class document_deadline;

#ifndef PDF_OUTLINE_SAME_SPAN_SIZE_DELTA
#define PDF_OUTLINE_SAME_SPAN_SIZE_DELTA 0.01
#endif

// Extracts, per page, the ordered span-level fragments of a PDF held in memory.
// A span is a run of characters on one MuPDF line sharing font and size.
// The MuPDF context and document live only for the duration of the call.
// Throws unreadable_document_error for corrupt, encrypted or zero-page
// documents and document_timeout_error once `deadline` expires.
// Pages MuPDF fails to interpret are logged and skipped.
std::vector<PDF_Raw_Page> parse_pdf_bytes(const std::string& bytes, const std::string& name, document_deadline* deadline = nullptr);

// Reads the whole file once, then behaves like parse_pdf_bytes.
std::vector<PDF_Raw_Page> parse_pdf_file(const std::string& file_path, document_deadline* deadline = nullptr);
