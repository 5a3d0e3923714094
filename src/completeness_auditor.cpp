#include "hsdsync/completeness_auditor.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace hsdsync {

std::size_t CompletenessReport::entryCount() const {
    std::size_t count = 0;
    for (const auto& slot : time_slots) {
        count += slot.bands.size();
    }
    return count;
}

std::size_t CompletenessReport::presentCount() const {
    std::size_t count = 0;
    for (const auto& slot : time_slots) {
        for (const auto& band : slot.bands) {
            count += band.exists ? 1 : 0;
        }
    }
    return count;
}

std::string CompletenessReport::format() const {
    std::string text;
    text += fmt::format("Band completeness: {}/{} present\n", presentCount(), entryCount());
    for (const auto& slot : time_slots) {
        text += fmt::format("{}\n", slot.time.display());
        for (const auto& band : slot.bands) {
            text += fmt::format("  [{}] {}: {} bytes\n", band.exists ? "x" : " ", band.band, band.size);
        }
    }
    return text;
}

CompletenessAuditor::CompletenessAuditor(const PathResolver& resolver, NamingScheme naming)
    : resolver_(resolver), naming_(std::move(naming)) {}

CompletenessReport CompletenessAuditor::audit(const std::vector<Timestamp>& times,
                                              const std::vector<std::string>& bands) const {
    CompletenessReport report;
    report.time_slots.reserve(times.size());

    for (const auto& time : times) {
        TimeSlotReport slot{time, {}};
        slot.bands.reserve(bands.size());

        for (const auto& band : bands) {
            BandStatus status;
            status.band = band;
            status.path = resolver_.finalPath(naming_.expectedFilename(time, band));

            std::error_code ec;
            status.exists = std::filesystem::is_regular_file(status.path, ec);
            if (status.exists) {
                const auto size = std::filesystem::file_size(status.path, ec);
                status.size = ec ? 0 : size;
            }
            slot.bands.push_back(std::move(status));
        }
        report.time_slots.push_back(std::move(slot));
    }
    return report;
}

} // namespace hsdsync
