#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace hsdsync {

struct DownloadStats {
    std::size_t total_files{0};
    std::size_t downloaded_files{0};
    std::size_t skipped_files{0};
    std::size_t failed_files{0};
    std::size_t failed_listings{0};
    std::uint64_t total_bytes{0};
    std::chrono::steady_clock::duration elapsed{};

    void merge(const DownloadStats& other);

    [[nodiscard]] bool hasFailures() const noexcept { return failed_files > 0 || failed_listings > 0; }

    // Bytes per second, absent when no time has elapsed.
    [[nodiscard]] std::optional<double> throughput() const;
    [[nodiscard]] std::string summary() const;
};

// The only state shared between workers. The lock is held for the merge
// alone, never across I/O.
class StatsAggregator {
public:
    void merge(const DownloadStats& worker_stats);

    // Call only after every contributing worker has been joined.
    [[nodiscard]] DownloadStats snapshot() const;

private:
    mutable std::mutex mutex_;
    DownloadStats stats_;
};

} // namespace hsdsync
