#include "hsdsync/path_resolver.hpp"

#include "hsdsync/hsd_filename.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace hsdsync {

namespace {

struct TimeDirectories {
    std::string year;
    std::string month;
    std::string day;
    std::string hour;
    std::string band;
};

// Only the date and time tokens are required here, so names that carry a
// partial grammar still get a dated directory.
bool parseDirectories(const std::string& filename, TimeDirectories& out) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream stream(filename);
    while (std::getline(stream, token, '_')) {
        tokens.push_back(token);
    }
    if (tokens.size() < 4) {
        return false;
    }

    const std::string& date = tokens[2];
    const std::string& time = tokens[3];
    if (date.size() != 8 || !isAllDigits(date) || time.size() != 4 || !isAllDigits(time)) {
        return false;
    }

    out.year = date.substr(0, 4);
    out.month = date.substr(4, 2);
    out.day = date.substr(6, 2);
    out.hour = time.substr(0, 2);
    if (tokens.size() > 4) {
        out.band = tokens[4];
    }
    return true;
}

} // namespace

PathResolver::PathResolver(StoragePolicy policy)
    : policy_(std::move(policy)) {}

std::filesystem::path PathResolver::finalPath(const std::string& remote_path) const {
    if (policy_.keep_original_structure) {
        const auto first = remote_path.find_first_not_of('/');
        const std::string relative = first == std::string::npos ? std::string{} : remote_path.substr(first);
        return policy_.base_path / relative;
    }

    const std::string filename = basenameOf(remote_path);
    TimeDirectories dirs;
    if (!parseDirectories(filename, dirs)) {
        return policy_.base_path / filename;
    }

    std::filesystem::path dir = policy_.base_path;
    if (policy_.organize_by_band && !dirs.band.empty()) {
        dir /= dirs.band;
    }
    if (policy_.organize_by_time) {
        dir = dir / dirs.year / dirs.month / dirs.day / dirs.hour;
    }
    return dir / filename;
}

std::filesystem::path PathResolver::tempPath(const std::filesystem::path& final_path) const {
    std::filesystem::path temp = final_path;
    temp += policy_.temp_suffix;
    return temp;
}

LocalPaths PathResolver::resolve(const std::string& remote_path) const {
    auto final_path = finalPath(remote_path);
    auto temp_path = tempPath(final_path);
    return {std::move(final_path), std::move(temp_path)};
}

bool PathResolver::isTempFile(const std::filesystem::path& path) const {
    const std::string name = path.filename().string();
    const std::string& suffix = policy_.temp_suffix;
    return !suffix.empty() && name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace hsdsync
