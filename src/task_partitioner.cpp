#include "hsdsync/task_partitioner.hpp"

#include "hsdsync/errors.hpp"

namespace hsdsync {

std::vector<std::vector<DownloadTask>> partitionTasks(const std::vector<DownloadTask>& tasks,
                                                      std::size_t num_partitions) {
    if (num_partitions == 0) {
        throw TransferError(ErrorKind::PartitionConfig, "Worker count must be at least 1");
    }

    std::vector<std::vector<DownloadTask>> partitions(num_partitions);
    for (auto& partition : partitions) {
        partition.reserve(tasks.size() / num_partitions + 1);
    }
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        partitions[i % num_partitions].push_back(tasks[i]);
    }
    return partitions;
}

} // namespace hsdsync
