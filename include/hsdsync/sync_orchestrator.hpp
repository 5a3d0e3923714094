#pragma once

#include "completeness_auditor.hpp"
#include "download_stats.hpp"
#include "download_task.hpp"
#include "hsd_filename.hpp"
#include "path_resolver.hpp"
#include "resumable_transfer.hpp"
#include "retry_policy.hpp"
#include "task_collector.hpp"
#include "timestamp.hpp"
#include "transport.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace hsdsync {

struct SyncOptions {
    ServerEndpoint endpoint;
    Credentials credentials;
    std::string remote_root{"jma/hsd"};
    StoragePolicy storage;
    NamingScheme naming;
    TaskSelection selection;
    std::size_t num_threads{4};
    RetryOptions retry;
    TransferOptions transfer;
    bool audit{true};
    bool clean_incomplete{true};
};

class SyncOrchestrator {
public:
    SyncOrchestrator(Transport& transport, SyncOptions options);

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    // Deletes every file under the base directory whose name ends with the
    // temp suffix. Returns how many were removed; failures are logged.
    std::size_t cleanupIncompleteDownloads() const;

    [[nodiscard]] CompletenessReport audit(const std::vector<Timestamp>& times) const;

    // Opens one connection for the directory listings. Throws TransferError
    // when that session cannot be connected or authenticated.
    [[nodiscard]] TaskCollection collectTasks(const std::vector<Timestamp>& times);

    // Cleanup, partition, one worker per nonempty partition, join.
    // Throws TransferError(ErrorKind::PartitionConfig) for zero workers.
    DownloadStats download(const std::vector<DownloadTask>& tasks);

    // Cleanup, optional audit, collection, download. Files found complete
    // during collection count as skipped, failed directory listings are
    // reported in `failed_listings`. Listing session failures propagate.
    DownloadStats synchronize(const std::vector<Timestamp>& times);

    [[nodiscard]] const SyncOptions& options() const noexcept { return options_; }

private:
    void requireWorkers() const;
    DownloadStats runWorkers(const std::vector<DownloadTask>& tasks);

    Transport& transport_;
    SyncOptions options_;
    PathResolver resolver_;
    ResumableTransfer transfer_;
    RetryPolicy retry_;
};

} // namespace hsdsync
