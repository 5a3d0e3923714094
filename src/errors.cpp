#include "hsdsync/errors.hpp"

namespace hsdsync {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection:      return "ConnectionError";
        case ErrorKind::Auth:            return "AuthError";
        case ErrorKind::List:            return "ListError";
        case ErrorKind::Stat:            return "StatError";
        case ErrorKind::Open:            return "OpenError";
        case ErrorKind::Read:            return "ReadError";
        case ErrorKind::SizeMismatch:    return "SizeMismatch";
        case ErrorKind::LocalIO:         return "LocalIOError";
        case ErrorKind::PartitionConfig: return "PartitionConfigError";
    }
    return "UnknownError";
}

bool isRetryable(ErrorKind kind) noexcept {
    return kind != ErrorKind::LocalIO && kind != ErrorKind::PartitionConfig;
}

} // namespace hsdsync
