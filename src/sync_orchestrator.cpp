#include "hsdsync/sync_orchestrator.hpp"

#include "hsdsync/errors.hpp"
#include "hsdsync/task_partitioner.hpp"
#include "hsdsync/worker_session.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace hsdsync {

namespace {

// Joins every started worker on scope exit, including when starting a later
// one throws.
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~ThreadJoiner() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;

private:
    std::vector<std::thread>& threads_;
};

} // namespace

SyncOrchestrator::SyncOrchestrator(Transport& transport, SyncOptions options)
    : transport_(transport),
      options_(std::move(options)),
      resolver_(options_.storage),
      transfer_(resolver_, options_.transfer),
      retry_(options_.retry) {}

void SyncOrchestrator::requireWorkers() const {
    if (options_.num_threads == 0) {
        throw TransferError(ErrorKind::PartitionConfig, "Worker count must be at least 1");
    }
}

std::size_t SyncOrchestrator::cleanupIncompleteDownloads() const {
    namespace fs = std::filesystem;

    const fs::path& base = options_.storage.base_path;
    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        return 0;
    }

    std::vector<fs::path> incomplete;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::error("Cannot scan {}: {}", base.string(), ec.message());
        return 0;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::error("Error while scanning {}: {}", base.string(), ec.message());
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && resolver_.isTempFile(it->path())) {
            incomplete.push_back(it->path());
        }
    }

    std::size_t removed = 0;
    for (const auto& path : incomplete) {
        std::error_code remove_ec;
        if (fs::remove(path, remove_ec)) {
            spdlog::info("Removed incomplete download {}", path.string());
            ++removed;
        } else if (remove_ec) {
            spdlog::error("Cannot remove incomplete download {}: {}", path.string(), remove_ec.message());
        }
    }
    if (removed > 0) {
        spdlog::info("Cleaned up {} incomplete download(s)", removed);
    }
    return removed;
}

CompletenessReport SyncOrchestrator::audit(const std::vector<Timestamp>& times) const {
    const CompletenessAuditor auditor(resolver_, options_.naming);
    return auditor.audit(times, options_.selection.bands);
}

TaskCollection SyncOrchestrator::collectTasks(const std::vector<Timestamp>& times) {
    const TaskCollector collector(resolver_, options_.naming, options_.remote_root);

    std::unique_ptr<Connection> connection;
    std::unique_ptr<RemoteFilesystem> filesystem;
    try {
        connection = transport_.connect(options_.endpoint);
        connection->authenticate(options_.credentials);
        filesystem = connection->openFilesystem();
    } catch (const TransferError& ex) {
        spdlog::error("Cannot open listing session ({}): {}", toString(ex.kind()), ex.what());
        throw;
    }

    return collector.collect(*filesystem, times, options_.selection);
}

DownloadStats SyncOrchestrator::download(const std::vector<DownloadTask>& tasks) {
    requireWorkers();
    const auto started = std::chrono::steady_clock::now();

    if (options_.clean_incomplete) {
        cleanupIncompleteDownloads();
    }

    DownloadStats stats = runWorkers(tasks);
    stats.elapsed = std::chrono::steady_clock::now() - started;
    return stats;
}

DownloadStats SyncOrchestrator::synchronize(const std::vector<Timestamp>& times) {
    requireWorkers();
    const auto started = std::chrono::steady_clock::now();

    if (times.empty()) {
        spdlog::info("Time list is empty, nothing to download");
        return {};
    }

    if (options_.clean_incomplete) {
        cleanupIncompleteDownloads();
    }

    if (options_.audit && !options_.selection.bands.empty()) {
        const auto report = audit(times);
        spdlog::info("{}", report.format());
    }

    const TaskCollection collection = collectTasks(times);

    DownloadStats stats = runWorkers(collection.tasks);
    stats.total_files += collection.already_present;
    stats.skipped_files += collection.already_present;
    stats.failed_listings += collection.failed_listings;
    stats.elapsed = std::chrono::steady_clock::now() - started;
    return stats;
}

DownloadStats SyncOrchestrator::runWorkers(const std::vector<DownloadTask>& tasks) {
    if (tasks.empty()) {
        spdlog::info("No files to download");
        return {};
    }

    auto partitions = partitionTasks(tasks, options_.num_threads);

    StatsAggregator aggregator;
    std::vector<std::unique_ptr<WorkerSession>> sessions;
    std::vector<std::thread> threads;
    sessions.reserve(partitions.size());
    threads.reserve(partitions.size());

    for (std::size_t i = 0; i < partitions.size(); ++i) {
        if (partitions[i].empty()) {
            continue;
        }
        sessions.push_back(std::make_unique<WorkerSession>(
            i, transport_, options_.endpoint, options_.credentials,
            transfer_, retry_, std::move(partitions[i])));
    }

    spdlog::info("Downloading {} file(s) with {} worker(s)", tasks.size(), sessions.size());
    {
        ThreadJoiner joiner(threads);
        for (auto& session : sessions) {
            WorkerSession* worker = session.get();
            threads.emplace_back([worker, &aggregator]() { worker->run(aggregator); });
        }
    }

    return aggregator.snapshot();
}

} // namespace hsdsync
