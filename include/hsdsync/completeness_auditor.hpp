#pragma once

#include "hsd_filename.hpp"
#include "path_resolver.hpp"
#include "timestamp.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hsdsync {

struct BandStatus {
    std::string band;
    bool exists{false};
    std::uint64_t size{0};
    std::filesystem::path path;
};

struct TimeSlotReport {
    Timestamp time;
    std::vector<BandStatus> bands;
};

struct CompletenessReport {
    std::vector<TimeSlotReport> time_slots;

    [[nodiscard]] std::size_t entryCount() const;
    [[nodiscard]] std::size_t presentCount() const;
    [[nodiscard]] std::string format() const;
};

// Inspects local storage only.
class CompletenessAuditor {
public:
    CompletenessAuditor(const PathResolver& resolver, NamingScheme naming);

    [[nodiscard]] CompletenessReport audit(const std::vector<Timestamp>& times,
                                           const std::vector<std::string>& bands) const;

private:
    const PathResolver& resolver_;
    NamingScheme naming_;
};

} // namespace hsdsync
