#include "hsdsync/hsd_filename.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include <fmt/format.h>

namespace hsdsync {

namespace {

std::vector<std::string> splitTokens(const std::string& text, char separator) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream stream(text);
    while (std::getline(stream, token, separator)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trimSlashes(const std::string& text) {
    const auto first = text.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of('/');
    return text.substr(first, last - first + 1);
}

} // namespace

bool isAllDigits(const std::string& text) noexcept {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

std::string basenameOf(const std::string& remote_path) {
    const auto slash = remote_path.find_last_of('/');
    return slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
}

std::optional<HsdFilename> HsdFilename::parse(const std::string& basename) {
    const auto tokens = splitTokens(basename, '_');
    if (tokens.size() != 8) {
        return std::nullopt;
    }

    HsdFilename name;
    name.prefix = tokens[0];
    name.satellite = tokens[1];
    name.date = tokens[2];
    name.time = tokens[3];
    name.band = tokens[4];
    name.scope = tokens[5];
    name.resolution = tokens[6];

    const auto dot = tokens[7].find('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    name.segment = tokens[7].substr(0, dot);
    name.extension = tokens[7].substr(dot + 1);

    if (name.date.size() != 8 || !isAllDigits(name.date) ||
        name.time.size() != 4 || !isAllDigits(name.time)) {
        return std::nullopt;
    }
    if (name.band.empty() || name.segment.empty() || name.extension.empty()) {
        return std::nullopt;
    }
    return name;
}

std::optional<Timestamp> HsdFilename::timestamp() const {
    const std::string text = fmt::format("{}-{}-{} {}:{}",
                                         date.substr(0, 4), date.substr(4, 2), date.substr(6, 2),
                                         time.substr(0, 2), time.substr(2, 2));
    return Timestamp::parse(text);
}

std::string HsdFilename::str() const {
    return fmt::format("{}_{}_{}_{}_{}_{}_{}_{}.{}",
                       prefix, satellite, date, time, band, scope, resolution, segment, extension);
}

std::string NamingScheme::resolutionFor(const std::string& band) {
    if (band == "B03") {
        return "R05";
    }
    if (band == "B01" || band == "B02" || band == "B04") {
        return "R10";
    }
    return "R20";
}

std::string NamingScheme::expectedFilename(const Timestamp& time, const std::string& band) const {
    HsdFilename name;
    name.prefix = prefix;
    name.satellite = satellite;
    name.date = time.dateToken();
    name.time = time.timeToken();
    name.band = band;
    name.scope = scope;
    name.resolution = resolutionFor(band);
    name.segment = audit_segment;
    name.extension = kDataFileExtension;
    return name.str();
}

std::string remoteDirectoryFor(const std::string& root, const Timestamp& time) {
    const std::string trimmed = trimSlashes(root);
    if (trimmed.empty()) {
        return fmt::format("/{}/{}/{}/", time.yearMonth(), time.dayToken(), time.hourToken());
    }
    return fmt::format("/{}/{}/{}/{}/", trimmed, time.yearMonth(), time.dayToken(), time.hourToken());
}

} // namespace hsdsync
