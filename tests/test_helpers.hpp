#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "outline_types.hpp"
#include "string_utils.hpp"

// Letter-size page, the geometry MuPDF reports for most test documents.
const double TEST_PAGE_WIDTH = 612;
const double TEST_PAGE_HEIGHT = 792;
const double TEST_LEFT_MARGIN = 72;

inline PDF_Fragment make_fragment(const std::string& text, unsigned int page, double size, double x, double y,
                                  bool bold = false, bool italic = false) {
    PDF_Fragment fragment;
    fragment.text = text;
    fragment.page = page;
    fragment.font_size = size;
    fragment.font_name = bold ? "Helvetica-Bold" : "Helvetica";
    fragment.is_bold = bold;
    fragment.is_italic = italic;
    fragment.x = x;
    fragment.y = y;
    fragment.width = 0.5 * size * static_cast<double>(utf8_length(text));
    fragment.height = size;
    return fragment;
}

// `lines` body lines of 11pt text at the left margin, 14pt apart
inline void add_body_text(std::vector<PDF_Fragment>& fragments, unsigned int page, double y, int lines) {
    for (int i = 0; i < lines; ++i) {
        fragments.push_back(make_fragment("Lorem ipsum dolor sit amet, consectetur adipiscing elit sed do",
                                          page, 11, TEST_LEFT_MARGIN, y + 14 * i));
    }
}

inline PDF_Raw_Page make_page(unsigned int page_number, const std::vector<PDF_Fragment>& fragments,
                              bool with_geometry = true) {
    PDF_Raw_Page page;
    page.page_number = page_number;
    if (with_geometry) {
        page.geometry.width = TEST_PAGE_WIDTH;
        page.geometry.height = TEST_PAGE_HEIGHT;
    }
    for (const PDF_Fragment& fragment : fragments) {
        if (fragment.page == page_number) {
            page.fragments.push_back(fragment);
        }
    }
    return page;
}

inline PDF_Normalized_Document make_document(const std::vector<PDF_Fragment>& fragments, unsigned int page_count,
                                             bool with_geometry = true) {
    PDF_Normalized_Document document;
    document.fragments = fragments;
    for (unsigned int page = 1; page <= page_count; ++page) {
        PDF_Page_Geometry geometry;
        if (with_geometry) {
            geometry.width = TEST_PAGE_WIDTH;
            geometry.height = TEST_PAGE_HEIGHT;
        }
        document.pages[page] = geometry;
    }
    return document;
}

// ===== minimal PDF writer =====

struct Test_Pdf_Line {
    bool bold;
    double size;
    double x;
    double y;       // PDF user space, origin bottom-left
    std::string text;
};

// One content stream per page, Helvetica (/F1) and Helvetica-Bold (/F2).
inline std::string make_test_pdf(const std::vector<std::vector<Test_Pdf_Line>>& pages) {
    std::vector<std::string> objects;
    std::string kids;
    unsigned int first_page_object = 5;
    for (std::size_t i = 0; i < pages.size(); ++i) {
        kids += std::to_string(first_page_object + 2 * i) + " 0 R ";
    }

    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages.size()) + " >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold >>");

    for (std::size_t i = 0; i < pages.size(); ++i) {
        std::string content;
        for (const Test_Pdf_Line& line : pages[i]) {
            char buffer[128];
            std::snprintf(buffer, sizeof(buffer), "BT /%s %.1f Tf %.1f %.1f Td (", line.bold ? "F2" : "F1", line.size, line.x, line.y);
            content += buffer;
            content += line.text + ") Tj ET\n";
        }
        unsigned int content_object = first_page_object + 2 * static_cast<unsigned int>(i) + 1;
        objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Resources << /Font << /F1 3 0 R /F2 4 0 R >> >> /Contents "
                          + std::to_string(content_object) + " 0 R >>");
        objects.push_back("<< /Length " + std::to_string(content.size()) + " >>\nstream\n" + content + "endstream");
    }

    std::string pdf = "%PDF-1.4\n";
    std::vector<std::size_t> offsets;
    for (std::size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }

    std::size_t xref = pdf.size();
    pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
    pdf += "0000000000 65535 f \n";
    for (std::size_t offset : offsets) {
        char entry[32];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
        pdf += entry;
    }
    pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\n";
    pdf += "startxref\n" + std::to_string(xref) + "\n%%EOF\n";
    return pdf;
}

// Two pages: 24pt title, 18pt section on page 1, 14pt subsection on page 2, 11pt body.
inline std::string make_report_pdf() {
    std::vector<Test_Pdf_Line> first = {
        {false, 24, 72, 680, "Annual Report 2024"},
        {true, 18, 72, 620, "Section 1: Overview"},
    };
    std::vector<Test_Pdf_Line> second = {
        {true, 14, 72, 680, "1.1 Background"},
    };
    for (int i = 0; i < 12; ++i) {
        first.push_back({false, 11, 72, 590.0 - 14 * i, "The quick brown fox jumps over the lazy dog again and again."});
        second.push_back({false, 11, 72, 650.0 - 14 * i, "Pack my box with five dozen liquor jugs before the sun sets."});
    }
    return make_test_pdf({first, second});
}

// Removes itself on destruction.
class temporary_directory {
    public:
        temporary_directory(temporary_directory const&) = delete;
        temporary_directory& operator=(temporary_directory const&) = delete;

        temporary_directory() :
            path_(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("pdf_outline_test_%%%%-%%%%-%%%%")) {
            boost::filesystem::create_directories(path_);
        }

        ~temporary_directory() {
            boost::system::error_code ec;
            boost::filesystem::remove_all(path_, ec);
        }

        const boost::filesystem::path& path() const { return path_; }

    private:
        boost::filesystem::path path_;
};
