#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include <mupdf/fitz.h>

// Wall-clock budget of a single document. The watchdog timer of the batch
// calls expire() from its own thread; MuPDF polls the cookie while
// interpreting a page and the pipeline calls check() between stages.
class document_deadline {
    public:
        // disable copy constructor and copy assignment (non-copyable)
        document_deadline(document_deadline const&) = delete;
        document_deadline& operator=(document_deadline const&) = delete;

        explicit document_deadline(std::chrono::steady_clock::duration budget);

        void expire();

        bool expired() const;

        // throws document_timeout_error naming the stage that noticed
        void check(const std::string& stage) const;

        // cookie handed to fz_run_page
        fz_cookie* cookie() { return &cookie_; }

        std::chrono::steady_clock::duration budget() const { return budget_; }

    private:
        std::chrono::steady_clock::duration budget_;
        std::chrono::steady_clock::time_point expiry_;
        std::atomic<bool> expired_{false};
        fz_cookie cookie_;
};
