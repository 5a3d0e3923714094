#pragma once

#include "download_task.hpp"
#include "path_resolver.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace hsdsync {

struct TransferOptions {
    std::size_t chunk_size{32 * 1024};
    std::uint64_t flush_interval_bytes{1024 * 1024};
    std::chrono::milliseconds progress_interval{std::chrono::seconds(5)};
};

struct TransferResult {
    bool already_complete{false};
    std::uint64_t bytes{0};
};

// Moves one remote file to its temp path and promotes it to the final path
// with a rename once the byte count matches the remote size. Errors leave
// the temp file in place so the next attempt can resume from it.
class ResumableTransfer {
public:
    explicit ResumableTransfer(const PathResolver& resolver, TransferOptions options = {});

    [[nodiscard]] FileTransferRecord prepare(const DownloadTask& task) const;

    // Throws TransferError. `bytes` counts the resumed prefix too.
    TransferResult transfer(RemoteFilesystem& filesystem, FileTransferRecord& record) const;

    [[nodiscard]] const PathResolver& resolver() const noexcept { return resolver_; }

private:
    [[nodiscard]] std::uint64_t resumeOffset(const FileTransferRecord& record) const;
    std::uint64_t streamToTemp(RemoteStream& stream, FileTransferRecord& record,
                               std::uint64_t offset) const;

    const PathResolver& resolver_;
    TransferOptions options_;
};

} // namespace hsdsync
