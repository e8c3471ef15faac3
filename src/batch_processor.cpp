#include "batch_processor.hpp"
#include "deadline.hpp"
#include "logging.hpp"
#include "outline_errors.hpp"
#include "outline_extractor.hpp"
#include "string_utils.hpp"

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <thread>

const char* document_status_name(Document_Status status) {
    switch (status) {
        case Document_Status::SUCCEEDED: return "succeeded";
        case Document_Status::UNREADABLE: return "unreadable";
        case Document_Status::NO_TEXT: return "no text";
        case Document_Status::TIMED_OUT: return "timed out";
        case Document_Status::WRITE_FAILED: return "write failed";
        case Document_Status::FAILED: return "failed";
    }
    return "failed";
}

std::size_t Batch_Summary::succeeded() const {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(), [](const Document_Result& result) {
        return result.status == Document_Status::SUCCEEDED;
    }));
}

std::size_t Batch_Summary::failed() const {
    return results.size() - succeeded();
}

int Batch_Summary::exit_code() const {
    if (results.empty() || succeeded() > 0) {
        return EXIT_SUCCESS;
    }
    return EXIT_FAILURE;
}

unsigned int parse_worker_count(const std::string& value) {
    std::string digits = trim_copy(value);
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        throw configuration_error("invalid worker count '" + value + "'");
    }
    // more digits than the cap can have is out of range without converting
    if (digits.size() > std::to_string(PDF_OUTLINE_MAX_WORKERS).size() ||
        std::stoul(digits) > PDF_OUTLINE_MAX_WORKERS) {
        throw configuration_error("worker count " + value + " exceeds the maximum of " + std::to_string(PDF_OUTLINE_MAX_WORKERS));
    }
    return static_cast<unsigned int>(std::stoul(digits));
}

std::vector<boost::filesystem::path> find_pdf_files(const boost::filesystem::path& directory) {
    std::vector<boost::filesystem::path> files;
    for (boost::filesystem::directory_iterator it(directory), end; it != end; ++it) {
        if (!boost::filesystem::is_regular_file(it->status())) {
            continue;
        }
        if (to_lower_copy(it->path().extension().string()) == ".pdf") {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end(), [](const boost::filesystem::path& a, const boost::filesystem::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

boost::filesystem::path output_file_for(const boost::filesystem::path& pdf_file, const boost::filesystem::path& output_directory) {
    return output_directory / (pdf_file.stem().string() + ".json");
}

void write_outline_file(const PDF_Outline_Record& record, const boost::filesystem::path& output_file) {
    std::string content = format_outline_record(record);
    boost::filesystem::path temporary = output_file;
    temporary += ".tmp";

    {
        std::ofstream out(temporary.string(), std::ios::binary | std::ios::trunc);
        if (!out) {
            throw output_error("cannot create " + temporary.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            boost::system::error_code ignored;
            boost::filesystem::remove(temporary, ignored);
            throw output_error("cannot write " + temporary.string());
        }
    }

    boost::system::error_code ec;
    boost::filesystem::rename(temporary, output_file, ec);
    if (ec) {
        boost::system::error_code ignored;
        boost::filesystem::remove(temporary, ignored);
        throw output_error("cannot move " + temporary.string() + " to " + output_file.string() + ": " + ec.message());
    }
}

namespace {

std::chrono::steady_clock::duration budget_of(const Outline_Configuration& config) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(config.document_timeout_seconds));
}

void process_document(const Outline_Configuration& config,
                      boost::asio::io_context& timer_context,
                      Document_Result& result) {
    auto deadline = std::make_shared<document_deadline>(budget_of(config));

    // The watchdog expires the deadline from the timer thread; MuPDF sees it through the cookie.
    auto timer = std::make_shared<boost::asio::steady_timer>(timer_context, deadline->budget());
    timer->async_wait([deadline](const boost::system::error_code& ec) {
        if (!ec) {
            deadline->expire();
        }
    });

    LOG_CHANNEL_INFO("batch") << "Processing " << result.input.string();

    try {
        PDF_Outline_Record record = extract_outline_from_file(result.input.string(), config, deadline.get());
        deadline->check("output");
        write_outline_file(record, result.output);
        result.status = Document_Status::SUCCEEDED;
        result.headings = record.outline.size();
        LOG_CHANNEL_INFO("batch") << "Saved outline to " << result.output.string();
    } catch (const unreadable_document_error& e) {
        result.status = Document_Status::UNREADABLE;
        result.message = e.what();
    } catch (const parse_error& e) {
        result.status = Document_Status::NO_TEXT;
        result.message = e.what();
    } catch (const document_timeout_error& e) {
        result.status = Document_Status::TIMED_OUT;
        result.message = e.what();
    } catch (const output_error& e) {
        result.status = Document_Status::WRITE_FAILED;
        result.message = e.what();
    } catch (const std::exception& e) {
        result.status = Document_Status::FAILED;
        result.message = e.what();
    }

    // timers are not thread-safe, cancel on the timer thread
    boost::asio::post(timer_context, [timer]() {
        timer->cancel();
    });

    if (result.status != Document_Status::SUCCEEDED) {
        LOG_CHANNEL_ERROR("batch") << "Error processing " << result.input.filename().string()
                                   << " (" << document_status_name(result.status) << "): " << result.message;
    }
}

} // namespace

batch_processor::batch_processor(const Outline_Configuration& config, unsigned int workers) :
    config_(config),
    workers_(workers ? workers : std::max(1u, std::thread::hardware_concurrency())) {
    validate_configuration(config_);
    if (workers > PDF_OUTLINE_MAX_WORKERS) {
        throw configuration_error("worker count " + std::to_string(workers) + " exceeds the maximum of " + std::to_string(PDF_OUTLINE_MAX_WORKERS));
    }
}

Batch_Summary batch_processor::run(const boost::filesystem::path& input_directory, const boost::filesystem::path& output_directory) {
    Batch_Summary summary;

    if (!boost::filesystem::is_directory(input_directory)) {
        throw configuration_error("input directory " + input_directory.string() + " does not exist");
    }

    boost::system::error_code ec;
    boost::filesystem::create_directories(output_directory, ec);
    if (ec) {
        throw output_error("cannot create output directory " + output_directory.string() + ": " + ec.message());
    }

    std::vector<boost::filesystem::path> files = find_pdf_files(input_directory);
    if (files.empty()) {
        LOG_CHANNEL_WARNING("batch") << "No PDF files found in " << input_directory.string();
        return summary;
    }

    LOG_CHANNEL_INFO("batch") << "Found " << files.size() << " PDF file(s) to process with " << workers_ << " worker(s)";

    // one slot per document, each written by exactly one worker
    summary.results.resize(files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        summary.results[i].input = files[i];
        summary.results[i].output = output_file_for(files[i], output_directory);
    }

    boost::asio::io_context timer_context{1};
    auto timer_work = boost::asio::make_work_guard(timer_context);
    std::thread timer_thread([&timer_context]() { timer_context.run(); });

    {
        boost::asio::thread_pool pool(workers_);
        for (Document_Result& result : summary.results) {
            boost::asio::post(pool, [this, &timer_context, &result]() {
                process_document(config_, timer_context, result);
            });
        }
        pool.join();
    }

    timer_work.reset();
    timer_thread.join();

    LOG_CHANNEL_INFO("batch") << "Processed " << summary.results.size() << " file(s): "
                              << summary.succeeded() << " succeeded, " << summary.failed() << " failed";
    return summary;
}
