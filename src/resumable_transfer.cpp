#include "hsdsync/resumable_transfer.hpp"

#include "hsdsync/errors.hpp"
#include "hsdsync/progress.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace hsdsync {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

[[noreturn]] void throwLocalIO(const std::string& what, const std::filesystem::path& path,
                               const std::string& reason) {
    throw TransferError(ErrorKind::LocalIO,
                        fmt::format("{} {}: {}", what, path.string(), reason));
}

std::string lastErrno() {
    return std::strerror(errno);
}

} // namespace

const char* toString(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::NotStarted:  return "NotStarted";
        case TransferStatus::Downloading: return "Downloading";
        case TransferStatus::Completed:   return "Completed";
        case TransferStatus::Failed:      return "Failed";
    }
    return "Unknown";
}

ResumableTransfer::ResumableTransfer(const PathResolver& resolver, TransferOptions options)
    : resolver_(resolver), options_(options) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = TransferOptions{}.chunk_size;
    }
}

FileTransferRecord ResumableTransfer::prepare(const DownloadTask& task) const {
    const auto paths = resolver_.resolve(task.remote_path);

    FileTransferRecord record;
    record.remote_path = task.remote_path;
    record.final_path = paths.final_path;
    record.temp_path = paths.temp_path;
    return record;
}

TransferResult ResumableTransfer::transfer(RemoteFilesystem& filesystem,
                                           FileTransferRecord& record) const {
    std::error_code ec;
    if (std::filesystem::is_regular_file(record.final_path, ec)) {
        const auto size = std::filesystem::file_size(record.final_path, ec);
        if (!ec && size > 0) {
            spdlog::info("Already present, skipping: {} ({} bytes)", record.final_path.string(), size);
            record.downloaded_size = size;
            record.status = TransferStatus::Completed;
            return {true, 0};
        }
    }

    record.status = TransferStatus::Downloading;

    const RemoteStat remote = filesystem.stat(record.remote_path);
    record.expected_size = remote.size;
    record.remote_modified = remote.modified;
    if (!remote.size) {
        spdlog::warn("Remote size unknown for {}, size check disabled", record.remote_path);
    }

    const std::uint64_t offset = resumeOffset(record);

    const auto parent = record.final_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throwLocalIO("Cannot create directory", parent, ec.message());
        }
    }

    auto stream = filesystem.openRead(record.remote_path, offset);
    const std::uint64_t total = streamToTemp(*stream, record, offset);

    if (record.expected_size && total != *record.expected_size) {
        throw TransferError(ErrorKind::SizeMismatch,
                            fmt::format("Size mismatch for {}: expected {} bytes, got {}",
                                        record.remote_path, *record.expected_size, total));
    }

    std::filesystem::rename(record.temp_path, record.final_path, ec);
    if (ec) {
        throwLocalIO("Cannot rename into", record.final_path, ec.message());
    }

    record.status = TransferStatus::Completed;
    return {false, total};
}

std::uint64_t ResumableTransfer::resumeOffset(const FileTransferRecord& record) const {
    std::error_code ec;
    if (!std::filesystem::exists(record.temp_path, ec)) {
        return 0;
    }

    const auto temp_size = std::filesystem::file_size(record.temp_path, ec);
    if (ec) {
        throwLocalIO("Cannot stat", record.temp_path, ec.message());
    }

    if (record.expected_size && temp_size < *record.expected_size) {
        spdlog::info("Resuming {} from byte {}", record.remote_path, temp_size);
        return temp_size;
    }

    // A temp file at or beyond the remote size means the remote file shrank
    // or was replaced; its bytes cannot be trusted.
    spdlog::info("Discarding temp file {} ({} bytes), restarting from 0",
                 record.temp_path.string(), temp_size);
    std::filesystem::remove(record.temp_path, ec);
    if (ec) {
        throwLocalIO("Cannot remove", record.temp_path, ec.message());
    }
    return 0;
}

std::uint64_t ResumableTransfer::streamToTemp(RemoteStream& stream, FileTransferRecord& record,
                                              std::uint64_t offset) const {
    FilePtr file{std::fopen(record.temp_path.c_str(), offset > 0 ? "ab" : "wb")};
    if (!file) {
        throwLocalIO("Cannot open", record.temp_path, lastErrno());
    }

    std::vector<char> buffer(options_.chunk_size);
    std::uint64_t total = offset;
    std::uint64_t unflushed = 0;
    record.downloaded_size = total;

    using clock = std::chrono::steady_clock;
    const auto started = clock::now();
    auto last_report = started;

    while (true) {
        const std::size_t read = stream.read(buffer.data(), buffer.size());
        if (read == 0) {
            break;
        }

        if (std::fwrite(buffer.data(), 1, read, file.get()) != read) {
            throwLocalIO("Cannot write", record.temp_path, lastErrno());
        }
        total += read;
        unflushed += read;
        record.downloaded_size = total;

        if (unflushed >= options_.flush_interval_bytes) {
            if (std::fflush(file.get()) != 0) {
                throwLocalIO("Cannot flush", record.temp_path, lastErrno());
            }
            unflushed = 0;
        }

        if (record.expected_size && total > *record.expected_size) {
            throw TransferError(ErrorKind::SizeMismatch,
                                fmt::format("Remote {} delivered more than its {} bytes",
                                            record.remote_path, *record.expected_size));
        }

        const auto now = clock::now();
        if (now - last_report >= options_.progress_interval) {
            const double seconds = std::chrono::duration<double>(now - started).count();
            Progress progress;
            progress.filename = basenameOf(record.remote_path);
            progress.downloaded_bytes = total;
            progress.total_bytes = record.expected_size;
            progress.bytes_per_second = seconds > 0.0 ? static_cast<double>(total - offset) / seconds : 0.0;
            spdlog::info("{}", formatProgressLine(progress));
            last_report = now;
        }
    }

    if (std::fflush(file.get()) != 0) {
        throwLocalIO("Cannot flush", record.temp_path, lastErrno());
    }
    if (::fsync(fileno(file.get())) != 0) {
        throwLocalIO("Cannot sync", record.temp_path, lastErrno());
    }
    if (std::fclose(file.release()) != 0) {
        throwLocalIO("Cannot close", record.temp_path, lastErrno());
    }
    return total;
}

} // namespace hsdsync
