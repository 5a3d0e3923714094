#include "hsdsync/download_stats.hpp"

#include "hsdsync/progress.hpp"

#include <fmt/format.h>

namespace hsdsync {

void DownloadStats::merge(const DownloadStats& other) {
    total_files += other.total_files;
    downloaded_files += other.downloaded_files;
    skipped_files += other.skipped_files;
    failed_files += other.failed_files;
    failed_listings += other.failed_listings;
    total_bytes += other.total_bytes;
}

std::optional<double> DownloadStats::throughput() const {
    const double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(total_bytes) / seconds;
}

std::string DownloadStats::summary() const {
    std::string text;
    text.append("==================================================\n");
    text.append("Download summary\n");
    text.append("--------------------------------------------------\n");
    text += fmt::format("Total files:      {}\n", total_files);
    text += fmt::format("Downloaded:       {}\n", downloaded_files);
    text += fmt::format("Skipped:          {}\n", skipped_files);
    text += fmt::format("Failed:           {}\n", failed_files);
    if (failed_listings > 0) {
        text += fmt::format("Failed listings:  {}\n", failed_listings);
    }
    text += fmt::format("Transferred:      {}\n", formatSize(total_bytes));
    text += fmt::format("Elapsed:          {:.1f} s\n", std::chrono::duration<double>(elapsed).count());
    if (const auto rate = throughput()) {
        text += fmt::format("Average speed:    {:.2f} MB/s\n", *rate / 1024.0 / 1024.0);
    }
    text.append("==================================================\n");
    return text;
}

void StatsAggregator::merge(const DownloadStats& worker_stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.merge(worker_stats);
}

DownloadStats StatsAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace hsdsync
