#pragma once

#include "sync_orchestrator.hpp"
#include "timestamp.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hsdsync {

inline constexpr std::size_t kMaxWorkerThreads = 64;
inline constexpr unsigned kMaxAttempts = 100;

struct LoggingConfig {
    std::string level{"info"};
    std::string directory;
};

struct TimeWindow {
    std::string start;
    std::string end;
    int step_minutes{10};
};

struct AppConfig {
    SyncOptions sync;
    TimeWindow window;
    LoggingConfig logging;

    // Throws ConfigError on unreadable files, malformed JSON or wrong types.
    [[nodiscard]] static AppConfig fromFile(const std::string& path);
    [[nodiscard]] static AppConfig fromJson(const nlohmann::json& json);

    // Writes a default file and throws ConfigError asking the operator to
    // fill it in when `path` does not exist yet.
    [[nodiscard]] static AppConfig loadOrCreate(const std::string& path);
    static void writeDefault(const std::string& path);

    [[nodiscard]] nlohmann::json toJson() const;
    void save(const std::string& path) const;

    // Throws ConfigError describing the first problem found.
    void validate() const;

    [[nodiscard]] std::vector<Timestamp> timeList() const;
};

} // namespace hsdsync
