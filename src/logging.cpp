#include "hsdsync/logging.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace hsdsync {

void initLogging(const std::string& level, const std::string& directory) {
    const auto log_level = spdlog::level::from_str(level);

    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console);

    if (!directory.empty()) {
        try {
            const auto log_path = std::filesystem::path(directory) / "hsdsync.log";
            std::filesystem::create_directories(log_path.parent_path());
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(), 10 * 1024 * 1024, 5);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file);
        } catch (const std::exception& ex) {
            file_error = ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("hsdsync", sinks.begin(), sinks.end());
    logger->set_level(log_level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled: {}", file_error);
    }
}

void shutdownLogging() {
    spdlog::shutdown();
}

} // namespace hsdsync
