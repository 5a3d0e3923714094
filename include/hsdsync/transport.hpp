#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hsdsync {

struct ServerEndpoint {
    std::string host;
    std::uint16_t port{22};
    std::string known_hosts;
    long connect_timeout_seconds{30};
    long low_speed_time_seconds{60};
};

struct Credentials {
    std::string username;
    std::string password;
};

struct RemoteStat {
    std::optional<std::uint64_t> size;
    std::optional<std::time_t> modified;
};

struct RemoteEntry {
    std::string name;
    RemoteStat stat;
};

// All operations below report failures as TransferError with the matching
// ErrorKind (Stat, List, Open, Read).
class RemoteStream {
public:
    virtual ~RemoteStream() = default;

    // Returns 0 at end of stream.
    virtual std::size_t read(char* buffer, std::size_t size) = 0;
};

class RemoteFilesystem {
public:
    virtual ~RemoteFilesystem() = default;

    [[nodiscard]] virtual RemoteStat stat(const std::string& path) = 0;
    [[nodiscard]] virtual std::vector<RemoteEntry> listDir(const std::string& path) = 0;
    [[nodiscard]] virtual std::unique_ptr<RemoteStream> openRead(const std::string& path,
                                                                 std::uint64_t offset) = 0;
};

class Connection {
public:
    virtual ~Connection() = default;

    virtual void authenticate(const Credentials& credentials) = 0;
    [[nodiscard]] virtual std::unique_ptr<RemoteFilesystem> openFilesystem() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::unique_ptr<Connection> connect(const ServerEndpoint& endpoint) = 0;
};

} // namespace hsdsync
