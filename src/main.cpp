#include <cstdlib>
#include <iostream>
#include <string>
#include "batch_processor.hpp"
#include "configuration.hpp"
#include "logging.hpp"
#include "outline_errors.hpp"

namespace {

const int EXIT_USAGE = 2;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <input_dir> <output_dir>\n";
    std::cerr << "  Writes <output_dir>/<name>.json for every <input_dir>/<name>.pdf\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <file>     JSON configuration file\n";
    std::cerr << "  --workers <n>       number of worker threads, at most " << PDF_OUTLINE_MAX_WORKERS << " (default: CPU count)\n";
    std::cerr << "  --timeout <sec>     per-document time budget (default: " << PDF_OUTLINE_DOCUMENT_TIMEOUT_SECONDS << ")\n";
    std::cerr << "  --threshold <r>     heading size threshold over body text (default: " << PDF_OUTLINE_HEADING_SIZE_THRESHOLD << ")\n";
    std::cerr << "  --log-level <lvl>   trace, debug, info, warning, error, fatal (default: info)\n";
    std::cerr << "  --log-file <patt>   also log to a rotating file\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string input_dir;
    std::string output_dir;
    std::string workers_arg;
    std::string timeout_arg;
    std::string threshold_arg;
    Log_Sink_Options log_options;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&](const std::string& option) -> std::string {
                if (i + 1 >= argc) {
                    throw configuration_error("missing value for " + option);
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            } else if (arg == "--config") {
                config_file = value(arg);
            } else if (arg == "--workers") {
                workers_arg = value(arg);
            } else if (arg == "--timeout") {
                timeout_arg = value(arg);
            } else if (arg == "--threshold") {
                threshold_arg = value(arg);
            } else if (arg == "--log-level") {
                log_options.threshold = parse_severity_level(value(arg));
            } else if (arg == "--log-file") {
                log_options.file_pattern = value(arg);
            } else if (arg.rfind("--", 0) == 0) {
                throw configuration_error("unknown option " + arg);
            } else if (input_dir.empty()) {
                input_dir = arg;
            } else if (output_dir.empty()) {
                output_dir = arg;
            } else {
                throw configuration_error("unexpected argument " + arg);
            }
        }

        if (input_dir.empty() || output_dir.empty()) {
            print_usage(argv[0]);
            return EXIT_USAGE;
        }

        setup_log_sinks(log_options);

        Outline_Configuration config = config_file.empty() ? Outline_Configuration() : load_configuration_file(config_file);
        unsigned int workers = 0;
        try {
            if (!timeout_arg.empty()) {
                config.document_timeout_seconds = std::stod(timeout_arg);
            }
            if (!threshold_arg.empty()) {
                config.heading_size_threshold = std::stod(threshold_arg);
            }
        } catch (const std::logic_error& e) {
            throw configuration_error(std::string("invalid numeric option: ") + e.what());
        }
        if (!workers_arg.empty()) {
            workers = parse_worker_count(workers_arg);
        }
        validate_configuration(config);

        batch_processor processor(config, workers);
        Batch_Summary summary = processor.run(input_dir, output_dir);
        return summary.exit_code();
    } catch (const configuration_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        LOG_FATAL << e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
