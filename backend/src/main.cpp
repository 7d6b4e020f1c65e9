#include <iostream>
#include <stdexcept>
#include <string>
#include "core/corpus_driver.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " --input <manifest> --output <manifest> [options]\n"
              << "Splits long multi-speaker cuts into sub-segments of bounded duration.\n"
              << "Manifests are lhotse cut lists in .jsonl or .json form.\n"
              << "Options:\n"
              << "  --input <path>        Input cut manifest\n"
              << "  --output <path>       Output cut manifest\n"
              << "  --max_len <seconds>   Maximum sub-segment duration (default: 30)\n"
              << "  --num_jobs <n>        Number of worker threads (default: 8)\n"
              << "  --config <path>       JSON configuration file\n"
              << "  --log_level <level>   DEBUG, INFO, WARN or ERROR (default: INFO)\n"
              << "  --no_overlap_carry    Do not copy overlapping speech after a rollback\n"
              << "  --help, -h            Show this help message\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace overlapseg;

    try {
        utils::Logger::initialize();

        std::string input_path;
        std::string output_path;
        std::string config_path;
        std::string max_len_arg;
        std::string num_jobs_arg;
        std::string log_level_arg;
        bool no_overlap_carry = false;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--no_overlap_carry") {
                no_overlap_carry = true;
            } else if (i + 1 < argc && arg == "--input") {
                input_path = argv[++i];
            } else if (i + 1 < argc && arg == "--output") {
                output_path = argv[++i];
            } else if (i + 1 < argc && arg == "--config") {
                config_path = argv[++i];
            } else if (i + 1 < argc && arg == "--max_len") {
                max_len_arg = argv[++i];
            } else if (i + 1 < argc && arg == "--num_jobs") {
                num_jobs_arg = argv[++i];
            } else if (i + 1 < argc && arg == "--log_level") {
                log_level_arg = argv[++i];
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        if (input_path.empty() || output_path.empty()) {
            std::cerr << "Both --input and --output are required\n";
            printUsage(argv[0]);
            return 1;
        }

        utils::SegmenterConfigManager configManager;
        if (!config_path.empty() && !configManager.loadFromFile(config_path)) {
            throw utils::ConfigurationException("Cannot use configuration file", config_path);
        }

        // Command line values override the configuration file
        utils::SegmenterConfig config = configManager.getConfig();
        if (!max_len_arg.empty()) {
            config.maxSegmentDuration = std::stod(max_len_arg);
        }
        if (!num_jobs_arg.empty()) {
            config.numJobs = std::stoi(num_jobs_arg);
        }
        if (!log_level_arg.empty()) {
            config.logLevel = log_level_arg;
        }
        if (no_overlap_carry) {
            config.carryOverlaps = false;
        }

        auto validation = configManager.updateConfig(config);
        if (!validation.isValid) {
            for (const auto& error : validation.errors) {
                std::cerr << "Invalid option: " << error << "\n";
            }
            return 1;
        }
        for (const auto& warning : validation.warnings) {
            utils::Logger::warn(warning);
        }

        utils::LogLevel level = utils::LogLevel::INFO;
        if (utils::Logger::parseLevel(config.logLevel, level)) {
            utils::Logger::setLevel(level);
        }

        core::CorpusDriver driver(core::DriverOptions::fromConfig(config));
        utils::Logger::info("Splitting " + input_path + " into segments of at most " +
                            std::to_string(config.maxSegmentDuration) + "s with " +
                            std::to_string(config.numJobs) + " jobs");

        auto report = driver.run(input_path, output_path);
        if (!report.succeeded()) {
            std::cerr << report.failures.size() << " of " << report.input_segments
                      << " segments failed:\n";
            for (const auto& failure : report.failures) {
                std::cerr << "  " << failure.segment_id << ": " << failure.message << "\n";
            }
            return 2;
        }

    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << std::endl;
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Numeric argument out of range: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "main");
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
