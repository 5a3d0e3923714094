#pragma once

#include "download_task.hpp"
#include "resumable_transfer.hpp"
#include "transport.hpp"

#include <chrono>

namespace hsdsync {

struct RetryOptions {
    unsigned max_attempts{3};
    std::chrono::milliseconds delay{std::chrono::seconds(2)};
};

class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions options = {});

    // Never throws TransferError: when the attempts are used up, or the error
    // is not retryable, the record ends in TransferStatus::Failed carrying the
    // last error. `record.retry_count` holds the attempts made beyond the first.
    TransferResult run(const ResumableTransfer& transfer, RemoteFilesystem& filesystem,
                       FileTransferRecord& record) const;

    [[nodiscard]] const RetryOptions& options() const noexcept { return options_; }

private:
    RetryOptions options_;
};

} // namespace hsdsync
