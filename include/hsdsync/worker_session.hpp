#pragma once

#include "download_stats.hpp"
#include "download_task.hpp"
#include "resumable_transfer.hpp"
#include "retry_policy.hpp"
#include "transport.hpp"

#include <cstddef>
#include <vector>

namespace hsdsync {

// One connection, one partition, strictly in partition order. The
// credentials are borrowed for the lifetime of the session and the
// connection is released when run() returns.
class WorkerSession {
public:
    WorkerSession(std::size_t worker_id,
                  Transport& transport,
                  const ServerEndpoint& endpoint,
                  const Credentials& credentials,
                  const ResumableTransfer& transfer,
                  const RetryPolicy& retry,
                  std::vector<DownloadTask> tasks);

    WorkerSession(const WorkerSession&) = delete;
    WorkerSession& operator=(const WorkerSession&) = delete;

    // Processes every task and merges the worker's stats into `aggregator`
    // exactly once.
    void run(StatsAggregator& aggregator);

    [[nodiscard]] const DownloadStats& stats() const noexcept { return stats_; }

private:
    void processTask(RemoteFilesystem& filesystem, const DownloadTask& task);

    std::size_t worker_id_;
    Transport& transport_;
    const ServerEndpoint& endpoint_;
    const Credentials& credentials_;
    const ResumableTransfer& transfer_;
    const RetryPolicy& retry_;
    std::vector<DownloadTask> tasks_;
    DownloadStats stats_;
};

} // namespace hsdsync
