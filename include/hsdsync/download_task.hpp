#pragma once

#include "errors.hpp"
#include "hsd_filename.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace hsdsync {

struct DownloadTask {
    std::string remote_path;

    [[nodiscard]] std::string filename() const { return basenameOf(remote_path); }
    [[nodiscard]] std::optional<HsdFilename> parsed() const { return HsdFilename::parse(filename()); }

    friend bool operator==(const DownloadTask& a, const DownloadTask& b) {
        return a.remote_path == b.remote_path;
    }
};

enum class TransferStatus {
    NotStarted,
    Downloading,
    Completed,
    Failed
};

[[nodiscard]] const char* toString(TransferStatus status) noexcept;

struct FileTransferRecord {
    std::string remote_path;
    std::filesystem::path final_path;
    std::filesystem::path temp_path;
    std::optional<std::uint64_t> expected_size;
    std::optional<std::time_t> remote_modified;
    std::uint64_t downloaded_size{0};
    TransferStatus status{TransferStatus::NotStarted};
    unsigned retry_count{0};
    std::optional<ErrorKind> last_error_kind;
    std::string last_error;
};

} // namespace hsdsync
