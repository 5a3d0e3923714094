#include "hsdsync/config.hpp"

#include "hsdsync/errors.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>

#include <fmt/format.h>

namespace hsdsync {

using json = nlohmann::json;

namespace {

template <typename T>
void readValue(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

// Counts are read signed so that a negative value is reported instead of
// wrapping around in the unsigned target.
template <typename T>
void readCount(const json& section, const char* section_name, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    const auto value = section.at(key).get<long long>();
    if (value < 0) {
        throw ConfigError(fmt::format("{}.{} must be greater than 0, got {}", section_name, key, value));
    }
    if (static_cast<unsigned long long>(value) > std::numeric_limits<T>::max()) {
        throw ConfigError(fmt::format("{}.{} is out of range: {}", section_name, key, value));
    }
    target = static_cast<T>(value);
}

Timestamp parseTime(const std::string& text, const char* field) {
    const auto ts = Timestamp::parse(text);
    if (!ts) {
        throw ConfigError(fmt::format("selection.{} is not a valid time (expected YYYY-MM-DD HH:MM): '{}'",
                                      field, text));
    }
    return *ts;
}

} // namespace

AppConfig AppConfig::fromJson(const json& root) {
    AppConfig config;
    SyncOptions& sync = config.sync;

    try {
        if (root.contains("server")) {
            const auto& server = root.at("server");
            readValue(server, "host", sync.endpoint.host);
            readValue(server, "port", sync.endpoint.port);
            readValue(server, "username", sync.credentials.username);
            readValue(server, "password", sync.credentials.password);
            readValue(server, "remote_root", sync.remote_root);
            readValue(server, "known_hosts", sync.endpoint.known_hosts);
            readValue(server, "connect_timeout_seconds", sync.endpoint.connect_timeout_seconds);
            readValue(server, "low_speed_time_seconds", sync.endpoint.low_speed_time_seconds);
        }

        if (root.contains("download")) {
            const auto& download = root.at("download");
            std::string base_path = sync.storage.base_path.string();
            readValue(download, "base_path", base_path);
            sync.storage.base_path = base_path;
            readCount(download, "download", "num_threads", sync.num_threads);
            readValue(download, "organize_by_time", sync.storage.organize_by_time);
            readValue(download, "organize_by_band", sync.storage.organize_by_band);
            readValue(download, "keep_original_structure", sync.storage.keep_original_structure);
            readValue(download, "temp_suffix", sync.storage.temp_suffix);
            readCount(download, "download", "max_attempts", sync.retry.max_attempts);
            readValue(download, "chunk_size", sync.transfer.chunk_size);
            readValue(download, "audit", sync.audit);
            readValue(download, "clean_incomplete", sync.clean_incomplete);

            if (download.contains("retry_delay_ms")) {
                sync.retry.delay = std::chrono::milliseconds(download.at("retry_delay_ms").get<long>());
            }
            if (download.contains("progress_interval_seconds")) {
                sync.transfer.progress_interval =
                    std::chrono::seconds(download.at("progress_interval_seconds").get<long>());
            }
        }

        if (root.contains("selection")) {
            const auto& selection = root.at("selection");
            readValue(selection, "bands", sync.selection.bands);
            readValue(selection, "segments", sync.selection.segments);
            readValue(selection, "start", config.window.start);
            readValue(selection, "end", config.window.end);
            readValue(selection, "step_minutes", config.window.step_minutes);
        }

        if (root.contains("naming")) {
            const auto& naming = root.at("naming");
            readValue(naming, "prefix", sync.naming.prefix);
            readValue(naming, "satellite", sync.naming.satellite);
            readValue(naming, "scope", sync.naming.scope);
            readValue(naming, "audit_segment", sync.naming.audit_segment);
        }

        if (root.contains("logging")) {
            const auto& logging = root.at("logging");
            readValue(logging, "level", config.logging.level);
            readValue(logging, "directory", config.logging.directory);
        }
    } catch (const json::exception& ex) {
        throw ConfigError(fmt::format("Invalid configuration: {}", ex.what()));
    }

    return config;
}

AppConfig AppConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("Cannot open configuration file {}", path));
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& ex) {
        throw ConfigError(fmt::format("Cannot parse {}: {}", path, ex.what()));
    }
    return fromJson(root);
}

AppConfig AppConfig::loadOrCreate(const std::string& path) {
    if (std::filesystem::exists(path)) {
        return fromFile(path);
    }
    writeDefault(path);
    throw ConfigError(fmt::format("Created default configuration {}; edit the server settings and run again",
                                  path));
}

void AppConfig::writeDefault(const std::string& path) {
    AppConfig config;
    config.sync.endpoint.host = "your_server.com";
    config.sync.credentials.username = "your_username";
    config.sync.credentials.password = "your_password";
    config.sync.storage.base_path = "./himawari_data";
    config.sync.selection.bands = {"B01", "B02", "B03"};
    config.window.start = "2025-07-17 09:00";
    config.window.end = "2025-07-17 10:00";
    config.save(path);
}

json AppConfig::toJson() const {
    const SyncOptions& s = sync;
    return json{
        {"server", {
            {"host", s.endpoint.host},
            {"port", s.endpoint.port},
            {"username", s.credentials.username},
            {"password", s.credentials.password},
            {"remote_root", s.remote_root},
            {"known_hosts", s.endpoint.known_hosts},
            {"connect_timeout_seconds", s.endpoint.connect_timeout_seconds},
            {"low_speed_time_seconds", s.endpoint.low_speed_time_seconds},
        }},
        {"download", {
            {"num_threads", s.num_threads},
            {"base_path", s.storage.base_path.string()},
            {"organize_by_time", s.storage.organize_by_time},
            {"organize_by_band", s.storage.organize_by_band},
            {"keep_original_structure", s.storage.keep_original_structure},
            {"temp_suffix", s.storage.temp_suffix},
            {"max_attempts", s.retry.max_attempts},
            {"retry_delay_ms", s.retry.delay.count()},
            {"chunk_size", s.transfer.chunk_size},
            {"progress_interval_seconds",
             std::chrono::duration_cast<std::chrono::seconds>(s.transfer.progress_interval).count()},
            {"audit", s.audit},
            {"clean_incomplete", s.clean_incomplete},
        }},
        {"selection", {
            {"bands", s.selection.bands},
            {"segments", s.selection.segments},
            {"start", window.start},
            {"end", window.end},
            {"step_minutes", window.step_minutes},
        }},
        {"naming", {
            {"prefix", s.naming.prefix},
            {"satellite", s.naming.satellite},
            {"scope", s.naming.scope},
            {"audit_segment", s.naming.audit_segment},
        }},
        {"logging", {
            {"level", logging.level},
            {"directory", logging.directory},
        }},
    };
}

void AppConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("Cannot write configuration file {}", path));
    }
    file << toJson().dump(4) << '\n';
    if (!file) {
        throw ConfigError(fmt::format("Failed writing configuration file {}", path));
    }
}

void AppConfig::validate() const {
    if (sync.endpoint.host.empty()) {
        throw ConfigError("server.host must not be empty");
    }
    if (sync.credentials.username.empty()) {
        throw ConfigError("server.username must not be empty");
    }
    if (sync.credentials.password.empty()) {
        throw ConfigError("server.password must not be empty");
    }
    if (sync.num_threads == 0 || sync.num_threads > kMaxWorkerThreads) {
        throw ConfigError(fmt::format("download.num_threads must be between 1 and {}", kMaxWorkerThreads));
    }
    if (sync.retry.max_attempts == 0 || sync.retry.max_attempts > kMaxAttempts) {
        throw ConfigError(fmt::format("download.max_attempts must be between 1 and {}", kMaxAttempts));
    }
    if (sync.transfer.chunk_size == 0) {
        throw ConfigError("download.chunk_size must be greater than 0");
    }
    if (sync.storage.temp_suffix.empty()) {
        throw ConfigError("download.temp_suffix must not be empty");
    }
    static const std::vector<std::string> levels{"trace", "debug", "info", "warn", "warning", "err", "error",
                                                 "critical", "off"};
    if (std::find(levels.begin(), levels.end(), logging.level) == levels.end()) {
        throw ConfigError(fmt::format("logging.level '{}' is not a known level", logging.level));
    }
    if (window.step_minutes <= 0) {
        throw ConfigError("selection.step_minutes must be greater than 0");
    }
    if (parseTime(window.end, "end") < parseTime(window.start, "start")) {
        throw ConfigError("selection.end is before selection.start");
    }
}

std::vector<Timestamp> AppConfig::timeList() const {
    return makeTimeList(parseTime(window.start, "start"), parseTime(window.end, "end"),
                        std::chrono::minutes(window.step_minutes));
}

} // namespace hsdsync
