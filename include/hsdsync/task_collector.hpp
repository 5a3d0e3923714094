#pragma once

#include "download_task.hpp"
#include "hsd_filename.hpp"
#include "path_resolver.hpp"
#include "timestamp.hpp"
#include "transport.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace hsdsync {

struct TaskSelection {
    std::vector<std::string> bands;     // empty selects every band
    std::vector<std::string> segments;  // empty selects every segment
};

struct TaskCollection {
    std::vector<DownloadTask> tasks;
    std::size_t already_present{0};
    std::size_t failed_listings{0};
};

// Turns observation times into download tasks by listing the remote
// directory of each time. Files already complete locally are counted but not
// turned into tasks.
class TaskCollector {
public:
    TaskCollector(const PathResolver& resolver, NamingScheme naming, std::string remote_root);

    [[nodiscard]] TaskCollection collect(RemoteFilesystem& filesystem,
                                         const std::vector<Timestamp>& times,
                                         const TaskSelection& selection) const;

    [[nodiscard]] bool matches(const std::string& filename, const Timestamp& time,
                               const TaskSelection& selection) const;

private:
    [[nodiscard]] bool isCompleteLocally(const std::string& remote_path) const;

    const PathResolver& resolver_;
    NamingScheme naming_;
    std::string remote_root_;
};

} // namespace hsdsync
