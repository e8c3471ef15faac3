#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "configuration.hpp"
#include "outline_types.hpp"

#ifndef PDF_OUTLINE_MAX_WORKERS
#define PDF_OUTLINE_MAX_WORKERS 256
#endif

enum class Document_Status { SUCCEEDED, UNREADABLE, NO_TEXT, TIMED_OUT, WRITE_FAILED, FAILED };

const char* document_status_name(Document_Status status);

struct Document_Result {
    boost::filesystem::path input;
    boost::filesystem::path output;
    Document_Status status = Document_Status::FAILED;
    std::string message;
    std::size_t headings = 0;
};

struct Batch_Summary {
    std::vector<Document_Result> results;

    std::size_t succeeded() const;
    std::size_t failed() const;

    // 0 when at least one document succeeded or there was nothing to do, 1 otherwise
    int exit_code() const;
};

// Parses a --workers value: a decimal integer in [0, PDF_OUTLINE_MAX_WORKERS],
// 0 meaning the hardware concurrency. Throws configuration_error otherwise.
unsigned int parse_worker_count(const std::string& value);

// *.pdf files (any case) directly inside `directory`, sorted by file name.
std::vector<boost::filesystem::path> find_pdf_files(const boost::filesystem::path& directory);

// "report.PDF" -> "report.json"
boost::filesystem::path output_file_for(const boost::filesystem::path& pdf_file, const boost::filesystem::path& output_directory);

// Writes to a sibling temporary file and renames it into place, so a
// failed write never leaves a truncated JSON behind. Throws output_error.
void write_outline_file(const PDF_Outline_Record& record, const boost::filesystem::path& output_file);

// Processes every PDF of a directory on a worker pool. Each document runs
// end to end on one worker under its own wall-clock deadline; failures are
// logged and recorded, never propagated.
class batch_processor {
    public:
        // disable copy constructor and copy assignment (non-copyable)
        batch_processor(batch_processor const&) = delete;
        batch_processor& operator=(batch_processor const&) = delete;

        // workers == 0 selects the hardware concurrency
        batch_processor(const Outline_Configuration& config, unsigned int workers = 0);

        // Throws configuration_error when input_directory is not a directory
        // and output_error when output_directory cannot be created.
        Batch_Summary run(const boost::filesystem::path& input_directory, const boost::filesystem::path& output_directory);

        unsigned int workers() const { return workers_; }

    private:
        Outline_Configuration config_;

        // number of threads in the document pool
        unsigned int workers_;
};
