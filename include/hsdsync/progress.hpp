#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace hsdsync {

struct Progress {
    std::string filename;
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    double bytes_per_second{0.0};
};

[[nodiscard]] std::string formatSize(std::uint64_t bytes);
[[nodiscard]] std::string formatProgressLine(const Progress& progress);

} // namespace hsdsync
