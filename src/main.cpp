#include "hsdsync/config.hpp"
#include "hsdsync/curl_sftp_transport.hpp"
#include "hsdsync/errors.hpp"
#include "hsdsync/logging.hpp"
#include "hsdsync/sync_orchestrator.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#ifndef HSDSYNC_VERSION
#define HSDSYNC_VERSION "unknown"
#endif

namespace {

struct CommandLine {
    std::string config_path{"hsdsync.json"};
    std::optional<std::string> base_path;
    std::optional<int> threads;
    std::optional<std::vector<std::string>> bands;
    std::optional<std::string> start;
    std::optional<std::string> end;
    bool no_audit{false};
    bool init_config{false};
};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-c <config.json>] [-d <directory>] [-t <threads>] [-b <B01,B02,...>]"
                 " [--start <time>] [--end <time>] [--no-audit] [--init-config]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -c <file>        Configuration file (default: hsdsync.json)\n"
              << "  -d <directory>   Local storage directory\n"
              << "  -t <threads>     Number of concurrent SFTP sessions\n"
              << "  -b <bands>       Comma separated bands, \"all\" for every band\n"
              << "  --start <time>   First observation time, YYYY-MM-DD HH:MM (UTC)\n"
              << "  --end <time>     Last observation time, YYYY-MM-DD HH:MM (UTC)\n"
              << "  --no-audit       Skip the local completeness report\n"
              << "  --init-config    Write a default configuration file and exit\n"
              << "  -h, --help       Show this message" << std::endl;
}

std::vector<std::string> splitBands(const std::string& text) {
    std::vector<std::string> bands;
    if (text == "all") {
        return bands;
    }
    std::istringstream stream(text);
    std::string band;
    while (std::getline(stream, band, ',')) {
        if (!band.empty()) {
            bands.push_back(band);
        }
    }
    return bands;
}

// Returns false when the arguments are malformed.
bool parseCommandLine(int argc, char** argv, CommandLine& cli, bool& help) {
    int arg_index = 1;
    while (arg_index < argc) {
        const std::string option = argv[arg_index];
        const bool has_value = arg_index + 1 < argc;

        if (option == "-h" || option == "--help") {
            help = true;
            return true;
        } else if (option == "--no-audit") {
            cli.no_audit = true;
            arg_index += 1;
        } else if (option == "--init-config") {
            cli.init_config = true;
            arg_index += 1;
        } else if (!has_value) {
            return false;
        } else if (option == "-c") {
            cli.config_path = argv[arg_index + 1];
            arg_index += 2;
        } else if (option == "-d") {
            cli.base_path = argv[arg_index + 1];
            arg_index += 2;
        } else if (option == "-t") {
            try {
                cli.threads = std::stoi(argv[arg_index + 1]);
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid thread count: " + std::string(argv[arg_index + 1]));
            }
            if (*cli.threads <= 0 || *cli.threads > static_cast<int>(hsdsync::kMaxWorkerThreads)) {
                throw std::runtime_error("Thread count is invalid.");
            }
            arg_index += 2;
        } else if (option == "-b") {
            cli.bands = splitBands(argv[arg_index + 1]);
            arg_index += 2;
        } else if (option == "--start") {
            cli.start = argv[arg_index + 1];
            arg_index += 2;
        } else if (option == "--end") {
            cli.end = argv[arg_index + 1];
            arg_index += 2;
        } else {
            return false;
        }
    }
    return true;
}

void applyOverrides(const CommandLine& cli, hsdsync::AppConfig& config) {
    if (cli.base_path) {
        config.sync.storage.base_path = *cli.base_path;
    }
    if (cli.threads) {
        config.sync.num_threads = static_cast<std::size_t>(*cli.threads);
    }
    if (cli.bands) {
        config.sync.selection.bands = *cli.bands;
    }
    if (cli.start) {
        config.window.start = *cli.start;
    }
    if (cli.end) {
        config.window.end = *cli.end;
    }
    if (cli.no_audit) {
        config.sync.audit = false;
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        CommandLine cli;
        bool help = false;
        if (!parseCommandLine(argc, argv, cli, help)) {
            printUsage(argv[0]);
            return 1;
        }
        if (help) {
            printUsage(argv[0]);
            return 0;
        }

        if (cli.init_config) {
            hsdsync::AppConfig::writeDefault(cli.config_path);
            std::cout << "Wrote default configuration to " << cli.config_path << std::endl;
            return 0;
        }

        auto config = hsdsync::AppConfig::loadOrCreate(cli.config_path);
        applyOverrides(cli, config);
        config.validate();

        hsdsync::initLogging(config.logging.level, config.logging.directory);
        spdlog::info("---------- Himawari HSD downloader {} ----------", HSDSYNC_VERSION);

        const auto times = config.timeList();
        spdlog::info("{} observation time(s) from {} to {}", times.size(), config.window.start, config.window.end);
        if (config.sync.selection.bands.empty()) {
            spdlog::info("Downloading every {} band", config.sync.naming.scope);
        } else {
            spdlog::info("Bands: {}", fmt::join(config.sync.selection.bands, ", "));
        }

        hsdsync::CurlSftpTransport transport;
        hsdsync::SyncOrchestrator orchestrator(transport, config.sync);
        const auto stats = orchestrator.synchronize(times);

        std::cout << stats.summary() << std::flush;
        hsdsync::shutdownLogging();
        return stats.hasFailures() ? 2 : 0;

    } catch (const hsdsync::ConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
