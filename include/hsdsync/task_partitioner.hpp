#pragma once

#include "download_task.hpp"

#include <cstddef>
#include <vector>

namespace hsdsync {

// Round-robin: task i goes to partition i % num_partitions, so partition
// sizes differ by at most one and each keeps the input order. Always returns
// exactly num_partitions partitions, trailing ones possibly empty.
// Throws TransferError(ErrorKind::PartitionConfig) when num_partitions is 0.
[[nodiscard]] std::vector<std::vector<DownloadTask>> partitionTasks(
    const std::vector<DownloadTask>& tasks, std::size_t num_partitions);

} // namespace hsdsync
