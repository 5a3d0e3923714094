#include "hsdsync/worker_session.hpp"

#include "hsdsync/errors.hpp"

#include <chrono>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace hsdsync {

WorkerSession::WorkerSession(std::size_t worker_id,
                             Transport& transport,
                             const ServerEndpoint& endpoint,
                             const Credentials& credentials,
                             const ResumableTransfer& transfer,
                             const RetryPolicy& retry,
                             std::vector<DownloadTask> tasks)
    : worker_id_(worker_id),
      transport_(transport),
      endpoint_(endpoint),
      credentials_(credentials),
      transfer_(transfer),
      retry_(retry),
      tasks_(std::move(tasks)) {}

void WorkerSession::run(StatsAggregator& aggregator) {
    const auto started = std::chrono::steady_clock::now();
    stats_ = DownloadStats{};
    stats_.total_files = tasks_.size();
    spdlog::info("Worker {} starting with {} file(s)", worker_id_, tasks_.size());

    std::unique_ptr<Connection> connection;
    std::unique_ptr<RemoteFilesystem> filesystem;
    try {
        connection = transport_.connect(endpoint_);
        connection->authenticate(credentials_);
        filesystem = connection->openFilesystem();
    } catch (const TransferError& ex) {
        spdlog::error("Worker {} could not establish a session ({}): {}; {} file(s) failed",
                      worker_id_, toString(ex.kind()), ex.what(), tasks_.size());
        stats_.failed_files = tasks_.size();
    }

    if (filesystem) {
        for (const auto& task : tasks_) {
            processTask(*filesystem, task);
        }
    }

    // The filesystem handle depends on the connection.
    filesystem.reset();
    connection.reset();

    stats_.elapsed = std::chrono::steady_clock::now() - started;
    spdlog::info("Worker {} finished: downloaded {}, skipped {}, failed {}, {} bytes",
                 worker_id_, stats_.downloaded_files, stats_.skipped_files,
                 stats_.failed_files, stats_.total_bytes);
    aggregator.merge(stats_);
}

void WorkerSession::processTask(RemoteFilesystem& filesystem, const DownloadTask& task) {
    FileTransferRecord record = transfer_.prepare(task);
    const TransferResult result = retry_.run(transfer_, filesystem, record);

    if (record.status != TransferStatus::Completed) {
        ++stats_.failed_files;
        return;
    }
    if (result.already_complete) {
        ++stats_.skipped_files;
        return;
    }

    ++stats_.downloaded_files;
    stats_.total_bytes += result.bytes;
    spdlog::info("Downloaded {} ({} bytes)", record.final_path.string(), result.bytes);
}

} // namespace hsdsync
