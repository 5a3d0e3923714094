#include "hsdsync/task_collector.hpp"

#include "hsdsync/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace hsdsync {

namespace {

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool selected(const std::vector<std::string>& selection, const std::string& value) {
    return selection.empty() || std::find(selection.begin(), selection.end(), value) != selection.end();
}

} // namespace

TaskCollector::TaskCollector(const PathResolver& resolver, NamingScheme naming, std::string remote_root)
    : resolver_(resolver), naming_(std::move(naming)), remote_root_(std::move(remote_root)) {}

TaskCollection TaskCollector::collect(RemoteFilesystem& filesystem,
                                      const std::vector<Timestamp>& times,
                                      const TaskSelection& selection) const {
    TaskCollection collection;

    for (const auto& time : times) {
        const std::string directory = remoteDirectoryFor(remote_root_, time);

        std::vector<RemoteEntry> entries;
        try {
            entries = filesystem.listDir(directory);
        } catch (const TransferError& ex) {
            spdlog::error("Cannot list {} ({}): {}", directory, toString(ex.kind()), ex.what());
            ++collection.failed_listings;
            continue;
        }

        std::size_t matched = 0;
        for (const auto& entry : entries) {
            if (!matches(entry.name, time, selection)) {
                continue;
            }
            ++matched;

            std::string remote_path = directory + entry.name;
            if (isCompleteLocally(remote_path)) {
                ++collection.already_present;
                continue;
            }
            collection.tasks.push_back(DownloadTask{std::move(remote_path)});
        }
        spdlog::info("Found {} matching file(s) in {}", matched, directory);
    }

    spdlog::info("Already present: {}, to download: {}", collection.already_present, collection.tasks.size());
    return collection;
}

bool TaskCollector::matches(const std::string& filename, const Timestamp& time,
                            const TaskSelection& selection) const {
    if (!endsWith(filename, std::string{"."} + kDataFileExtension)) {
        return false;
    }
    if (filename.find(naming_.scope) == std::string::npos ||
        filename.find(time.compact()) == std::string::npos) {
        return false;
    }

    const auto parsed = HsdFilename::parse(filename);
    if (!parsed) {
        return false;
    }
    return selected(selection.bands, parsed->band) && selected(selection.segments, parsed->segment);
}

bool TaskCollector::isCompleteLocally(const std::string& remote_path) const {
    const auto path = resolver_.finalPath(remote_path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    const auto size = std::filesystem::file_size(path, ec);
    return !ec && size > 0;
}

} // namespace hsdsync
