#include "hsdsync/progress.hpp"

#include <fmt/format.h>

namespace hsdsync {

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string formatProgressLine(const Progress& progress) {
    std::string name = progress.filename.empty() ? std::string{"(unnamed)"} : progress.filename;

    if (!progress.total_bytes || *progress.total_bytes == 0) {
        return fmt::format("{} {} ({}/s)", name, formatSize(progress.downloaded_bytes),
                           formatSize(static_cast<std::uint64_t>(progress.bytes_per_second)));
    }

    const double ratio = static_cast<double>(progress.downloaded_bytes) /
                         static_cast<double>(*progress.total_bytes);
    return fmt::format("{} {:>5.1f}% ({}/{}, {}/s)",
                       name,
                       ratio * 100.0,
                       formatSize(progress.downloaded_bytes),
                       formatSize(*progress.total_bytes),
                       formatSize(static_cast<std::uint64_t>(progress.bytes_per_second)));
}

} // namespace hsdsync
