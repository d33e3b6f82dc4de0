#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdlib>
#include "damage.hpp"
#include "engine_config.hpp"
#include "logger.hpp"
#include "session.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/session_reader.hpp"
#include "io/text_report.hpp"

namespace {

struct CLIArgs {
    std::string input_path;
    std::string config_path;
    std::string output_path;
    std::string parquet_path;
    std::string system_label;
    std::string log_level = "INFO";
    int horizon_year = 0;            // 0 = no horizon drill-down
    size_t top_systems = repaircast::DEFAULT_TOP_SYSTEMS;
    bool print_tables = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "RepairCast Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --input <path>              JSON session snapshot (photos, detections, analyses)\n";
    std::cerr << "  --config <path>             JSON engine config (fallback, portfolio, schedule, logging)\n\n";
    std::cerr << "Report options:\n";
    std::cerr << "  --horizon <year>            Add a drill-down of years 1..<year> (1-15)\n";
    std::cerr << "  --system <label>            Add a drill-down of one system across photos\n";
    std::cerr << "  --top <n>                   Number of top cost drivers (default: 3)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --table                     Print cost tables to stderr\n";
    std::cerr << "  --parquet <path>            Write all yearly rows to a Parquet file\n";
    std::cerr << "                              (requires a build with Apache Arrow)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Portfolio report for a session:\n";
    std::cerr << "     " << program_name << " --input data/sample_session.json \\\n";
    std::cerr << "         --output report.json\n\n";
    std::cerr << "  2. Drill into the first 10 years and the roof, with tables:\n";
    std::cerr << "     " << program_name << " --input data/sample_session.json \\\n";
    std::cerr << "         --config data/sample_config.json \\\n";
    std::cerr << "         --horizon 10 --system \"Roof leak\" --table\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--input" && i + 1 < argc) {
                args.input_path = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--parquet" && i + 1 < argc) {
                args.parquet_path = argv[++i];
            } else if (arg == "--horizon" && i + 1 < argc) {
                args.horizon_year = std::stoi(argv[++i]);
            } else if (arg == "--system" && i + 1 < argc) {
                args.system_label = argv[++i];
            } else if (arg == "--top" && i + 1 < argc) {
                args.top_systems = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--table") {
                args.print_tables = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n\n";
        return false;
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.input_path.empty()) {
        std::cerr << "Error: --input is required\n";
        valid = false;
    } else if (!file_exists(args.input_path)) {
        std::cerr << "Error: Input file not found: " << args.input_path << "\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.horizon_year != 0 &&
        (args.horizon_year < 1 || args.horizon_year > repaircast::MAX_YEAR)) {
        std::cerr << "Error: --horizon must be between 1 and " << repaircast::MAX_YEAR << "\n";
        valid = false;
    }

    if (args.top_systems == 0) {
        std::cerr << "Error: --top must be greater than 0\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

void configure_logger(const repaircast::LoggingSettings& settings) {
    repaircast::LoggerConfig logger_config;
    logger_config.min_level = repaircast::string_to_level(settings.level);
    logger_config.enable_json = settings.json;
    if (!settings.file.empty()) {
        logger_config.enable_file = true;
        logger_config.log_file_path = settings.file;
    }
    repaircast::Logger::get_instance().configure(logger_config);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    repaircast::Logger& logger = repaircast::Logger::get_instance();

    try {
        repaircast::EngineConfig config;
        if (!args.config_path.empty()) {
            config = repaircast::parse_engine_config_from_file(args.config_path);
        }

        // Flags override the config file when set away from their defaults
        if (args.top_systems != repaircast::DEFAULT_TOP_SYSTEMS) config.top_systems = args.top_systems;
        if (args.log_level != "INFO") config.logging.level = args.log_level;
        repaircast::validate_engine_config(config);

        configure_logger(config.logging);

        std::map<std::string, std::string> settings;
        settings["input"] = args.input_path;
        settings["config"] = args.config_path.empty() ? "(defaults)" : args.config_path;
        settings["output"] = args.output_path.empty() ? "stdout" : args.output_path;
        settings["top_systems"] = std::to_string(config.top_systems);
        settings["min_detections"] = std::to_string(config.fallback.min_detections);
        settings["target_items"] = std::to_string(config.fallback.target_items);
        settings["schedule_years"] = std::to_string(config.schedule.years);
        if (args.horizon_year != 0) settings["horizon"] = std::to_string(args.horizon_year);
        if (!args.system_label.empty()) settings["system"] = args.system_label;
        logger.log_run_start(settings);

        std::vector<repaircast::PhotoInput> inputs =
            repaircast::io::read_session_from_file(args.input_path, config.schedule);

        std::optional<int> horizon;
        if (args.horizon_year != 0) horizon = args.horizon_year;
        std::optional<std::string> system;
        if (!args.system_label.empty()) system = args.system_label;

        repaircast::SessionReport report =
            repaircast::build_session_report(inputs, config, horizon, system);

        if (args.print_tables) {
            for (const auto& photo : report.photos) {
                std::cerr << "\nPhoto " << photo.id << " (" << photo.file_name << ")\n";
                for (const auto& profile : photo.cost_profiles) {
                    repaircast::io::write_cost_table(std::cerr, profile);
                }
            }
            if (report.portfolio) {
                repaircast::io::write_portfolio_summary(std::cerr, *report.portfolio);
            }
        }

        if (!args.parquet_path.empty()) {
            repaircast::ParquetWriter::write_profiles(report.photos, args.parquet_path);
            std::cerr << "Parquet written to: " << args.parquet_path << "\n";
        }

        if (args.output_path.empty()) {
            repaircast::io::write_session_report_json(std::cout, report);
        } else {
            repaircast::io::write_session_report_json(args.output_path, report);
            std::cerr << "Output written to: " << args.output_path << "\n";
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(repaircast::LogContext("", "run"), e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
