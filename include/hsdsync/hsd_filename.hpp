#pragma once

#include "timestamp.hpp"

#include <optional>
#include <string>

namespace hsdsync {

// PREFIX_SATID_YYYYMMDD_HHMM_BAND_SCOPE_RES_SEGMENT.ext
// e.g. HS_H09_20250717_0900_B03_FLDK_R05_S0110.DAT.bz2
struct HsdFilename {
    std::string prefix;
    std::string satellite;
    std::string date;
    std::string time;
    std::string band;
    std::string scope;
    std::string resolution;
    std::string segment;
    std::string extension;      // without the leading dot, e.g. "DAT.bz2"

    [[nodiscard]] static std::optional<HsdFilename> parse(const std::string& basename);

    [[nodiscard]] std::optional<Timestamp> timestamp() const;
    [[nodiscard]] std::string str() const;
};

inline constexpr const char* kDataFileExtension = "DAT.bz2";

struct NamingScheme {
    std::string prefix{"HS"};
    std::string satellite{"H09"};
    std::string scope{"FLDK"};
    std::string audit_segment{"S0110"};

    // Native AHI resolutions: 0.5 km for B03, 1 km for B01, B02 and B04,
    // 2 km for the infrared bands.
    [[nodiscard]] static std::string resolutionFor(const std::string& band);

    [[nodiscard]] std::string expectedFilename(const Timestamp& time, const std::string& band) const;
};

[[nodiscard]] bool isAllDigits(const std::string& text) noexcept;

[[nodiscard]] std::string basenameOf(const std::string& remote_path);

// "/<root>/<YYYYMM>/<DD>/<HH>/"
[[nodiscard]] std::string remoteDirectoryFor(const std::string& root, const Timestamp& time);

} // namespace hsdsync
