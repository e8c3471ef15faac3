#include "pdf_utils.hpp"
#include "deadline.hpp"
#include "logging.hpp"
#include "outline_errors.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <optional>

namespace {

// Owns the MuPDF context, stream and document of one parse.
// fz_drop_* never throws, so the destructor is safe outside fz_try.
class mupdf_session {
    public:
        mupdf_session(mupdf_session const&) = delete;
        mupdf_session& operator=(mupdf_session const&) = delete;

        mupdf_session() = default;

        ~mupdf_session() {
            if (ctx) {
                fz_drop_document(ctx, doc);
                fz_drop_stream(ctx, stream);
                fz_drop_context(ctx);
            }
        }

        fz_context* ctx = nullptr;
        fz_stream* stream = nullptr;
        fz_document* doc = nullptr;
};

class stext_page_guard {
    public:
        stext_page_guard(stext_page_guard const&) = delete;
        stext_page_guard& operator=(stext_page_guard const&) = delete;

        stext_page_guard(fz_context* ctx, fz_stext_page* text) : ctx_(ctx), text_(text) {}

        ~stext_page_guard() {
            fz_drop_stext_page(ctx_, text_);
        }

    private:
        fz_context* ctx_;
        fz_stext_page* text_;
};

struct Span_Builder {
    bool open = false;
    fz_font* font = nullptr;
    double size = 0;
    fz_rect bbox;
    PDF_Fragment fragment;
};

void flush_span(Span_Builder& span, const fz_rect& mediabox, PDF_Raw_Page& raw_page) {
    if (!span.open) {
        return;
    }
    span.fragment.x = span.bbox.x0 - mediabox.x0;
    span.fragment.y = span.bbox.y0 - mediabox.y0;
    span.fragment.width = span.bbox.x1 - span.bbox.x0;
    span.fragment.height = span.bbox.y1 - span.bbox.y0;
    raw_page.fragments.push_back(std::move(span.fragment));
    span = Span_Builder();
}

void collect_page_spans(fz_context* ctx, fz_stext_page* text, const fz_rect& mediabox, PDF_Raw_Page& raw_page) {
    for (fz_stext_block* block = text->first_block; block; block = block->next) {
        if (block->type != FZ_STEXT_BLOCK_TEXT) { // only text blocks have lines, image blocks do not have lines
            continue;
        }

        for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
            Span_Builder span;

            for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                if (span.open &&
                    (ch->font != span.font || std::fabs(ch->size - span.size) > PDF_OUTLINE_SAME_SPAN_SIZE_DELTA)) {
                    flush_span(span, mediabox, raw_page);
                }

                fz_rect char_box = fz_rect_from_quad(ch->quad);
                if (!span.open) {
                    span.open = true;
                    span.font = ch->font;
                    span.size = ch->size;
                    span.bbox = char_box;
                    span.fragment.page = raw_page.page_number;
                    span.fragment.font_size = ch->size;
                    if (ch->font) {
                        span.fragment.font_name = fz_font_name(ctx, ch->font);
                        span.fragment.is_bold = fz_font_is_bold(ctx, ch->font) != 0;
                        span.fragment.is_italic = fz_font_is_italic(ctx, ch->font) != 0;
                    }
                } else {
                    span.bbox = fz_union_rect(span.bbox, char_box);
                }

                span.fragment.text += UnicodeToUTF8(ch->c);
            }

            flush_span(span, mediabox, raw_page);
        }
    }
}

} // namespace

std::vector<PDF_Raw_Page> parse_pdf_bytes(const std::string& bytes, const std::string& name, document_deadline* deadline) {
    std::vector<PDF_Raw_Page> pages;
    mupdf_session session;
    int page_count = 0;
    int needs_password = 0;
    std::string failure;

    if (bytes.empty()) {
        throw unreadable_document_error(name + ": empty file");
    }

    /* Create a context to hold the exception stack and various caches. */
    session.ctx = fz_new_context(nullptr, nullptr, FZ_STORE_UNLIMITED);
    if (!session.ctx) {
        throw unreadable_document_error(name + ": cannot create mupdf context");
    }
    fz_context* ctx = session.ctx;

    /* Register the default file types and open the document from memory. */
    fz_try(ctx) {
        fz_register_document_handlers(ctx);
        session.stream = fz_open_memory(ctx, reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
        session.doc = fz_open_document_with_stream(ctx, "application/pdf", session.stream);
        needs_password = fz_needs_password(ctx, session.doc);
        if (!needs_password) {
            page_count = fz_count_pages(ctx, session.doc);
        }
    } fz_catch(ctx) {
        failure = fz_caught_message(ctx);
    }

    if (!failure.empty()) {
        throw unreadable_document_error(name + ": cannot open document: " + failure);
    }
    if (needs_password) {
        throw unreadable_document_error(name + ": document is encrypted");
    }
    if (page_count <= 0) {
        throw unreadable_document_error(name + ": document has no pages");
    }

    LOG_CHANNEL_DEBUG("pdf") << name << ": " << page_count << " page(s)";

    for (int page_number = 0; page_number < page_count; ++page_number) {
        if (deadline) {
            deadline->check("text extraction");
        }

        fz_page* page = nullptr;
        fz_device* dev = nullptr;
        fz_stext_page* text = nullptr;
        fz_rect mediabox = fz_empty_rect;
        fz_var(page);
        fz_var(dev);
        fz_var(text);

        fz_cookie* cookie = deadline ? deadline->cookie() : nullptr;

        fz_try(ctx) {
            fz_stext_options stext_options;
            std::memset(&stext_options, 0, sizeof(stext_options));
            page = fz_load_page(ctx, session.doc, page_number);
            mediabox = fz_bound_page(ctx, page);
            text = fz_new_stext_page(ctx, mediabox);
            dev = fz_new_stext_device(ctx, text, &stext_options);
            fz_run_page(ctx, page, dev, fz_identity, cookie);
            fz_close_device(ctx, dev);
        } fz_always(ctx) {
            fz_drop_device(ctx, dev);
            fz_drop_page(ctx, page);
        } fz_catch(ctx) {
            failure = fz_caught_message(ctx);
        }

        stext_page_guard text_guard(ctx, text);

        if (deadline) {
            deadline->check("text extraction");
        }

        if (!failure.empty()) {
            LOG_CHANNEL_WARNING("pdf") << name << ": skipping page " << (page_number + 1) << ": " << failure;
            failure.clear();
            continue;
        }

        PDF_Raw_Page raw_page;
        raw_page.page_number = static_cast<unsigned int>(page_number + 1);
        double width = mediabox.x1 - mediabox.x0;
        double height = mediabox.y1 - mediabox.y0;
        if (width > 0) {
            raw_page.geometry.width = width;
        }
        if (height > 0) {
            raw_page.geometry.height = height;
        }

        collect_page_spans(ctx, text, mediabox, raw_page);
        pages.push_back(std::move(raw_page));
    }

    return pages;
}

std::vector<PDF_Raw_Page> parse_pdf_file(const std::string& file_path, document_deadline* deadline) {
    std::string bytes;
    {
        std::ifstream in(file_path, std::ios::binary);
        if (!in) {
            throw unreadable_document_error(file_path + ": cannot open file");
        }
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw unreadable_document_error(file_path + ": read error");
        }
    }
    return parse_pdf_bytes(bytes, file_path, deadline);
}
