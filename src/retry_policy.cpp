#include "hsdsync/retry_policy.hpp"

#include "hsdsync/errors.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

namespace hsdsync {

RetryPolicy::RetryPolicy(RetryOptions options)
    : options_(options) {
    options_.max_attempts = std::max(1u, options_.max_attempts);
}

TransferResult RetryPolicy::run(const ResumableTransfer& transfer, RemoteFilesystem& filesystem,
                                FileTransferRecord& record) const {
    for (unsigned attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        record.retry_count = attempt - 1;
        try {
            return transfer.transfer(filesystem, record);
        } catch (const TransferError& ex) {
            record.status = TransferStatus::Failed;
            record.last_error_kind = ex.kind();
            record.last_error = ex.what();

            if (!isRetryable(ex.kind())) {
                spdlog::error("{} on {}, not retrying: {}", toString(ex.kind()), record.remote_path, ex.what());
                break;
            }
            if (attempt == options_.max_attempts) {
                break;
            }

            spdlog::warn("Attempt {}/{} failed for {} ({}): {}",
                         attempt, options_.max_attempts, record.remote_path, toString(ex.kind()), ex.what());
            std::this_thread::sleep_for(options_.delay);
        }
    }

    spdlog::error("Giving up on {} after {} attempt(s): {}",
                  record.remote_path, record.retry_count + 1, record.last_error);
    return {};
}

} // namespace hsdsync
