#pragma once

#include <stdexcept>
#include <string>

namespace hsdsync {

enum class ErrorKind {
    Connection,
    Auth,
    List,
    Stat,
    Open,
    Read,
    SizeMismatch,
    LocalIO,
    PartitionConfig
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

// Local filesystem problems point at the environment, not at a flaky link,
// so another attempt would only repeat them.
[[nodiscard]] bool isRetryable(ErrorKind kind) noexcept;

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace hsdsync
