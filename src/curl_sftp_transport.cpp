#include "hsdsync/curl_sftp_transport.hpp"

#include "hsdsync/detail/curl_utils.hpp"
#include "hsdsync/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>

namespace hsdsync {

namespace {

using detail::CurlHandle;
using detail::CurlMultiHandle;
using detail::CurlShareHandle;

constexpr std::size_t kMaxBufferedBytes = 1024 * 1024;
constexpr int kWaitTimeoutMs = 1000;

struct SessionState {
    ServerEndpoint endpoint;
    const Credentials* credentials{nullptr};
    CurlShareHandle share{nullptr, &curl_share_cleanup};
    std::string base_url;
};

using SessionPtr = std::shared_ptr<SessionState>;

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

[[noreturn]] void throwCurl(CURLcode code, ErrorKind fallback, const std::string& what) {
    throw TransferError(detail::classifyCurlError(code, fallback),
                        fmt::format("{}: {}", what, curl_easy_strerror(code)));
}

CurlHandle makeRequest(const SessionState& session, const std::string& path) {
    auto curl = detail::makeEasyHandle();
    const std::string url = session.base_url + path;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SHARE, session.share.get());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSH_AUTH_TYPES,
                     static_cast<long>(CURLSSH_AUTH_PASSWORD | CURLSSH_AUTH_KEYBOARD));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, session.endpoint.connect_timeout_seconds);
    if (session.endpoint.low_speed_time_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, session.endpoint.low_speed_time_seconds);
    }
    if (!session.endpoint.known_hosts.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_SSH_KNOWNHOSTS, session.endpoint.known_hosts.c_str());
    }
    if (session.credentials) {
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, session.credentials->username.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, session.credentials->password.c_str());
    }
    return curl;
}

// Pull-style reader over curl's push-style write callback: the transfer runs
// inside a multi handle and is paused whenever the local buffer is full.
class CurlSftpStream final : public RemoteStream {
public:
    CurlSftpStream(SessionPtr session, std::string path, std::uint64_t offset)
        : session_(std::move(session)),
          path_(std::move(path)),
          curl_(makeRequest(*session_, path_)),
          multi_(curl_multi_init(), &curl_multi_cleanup) {
        if (!multi_) {
            throw TransferError(ErrorKind::Open, "Failed to allocate curl multi handle");
        }

        curl_easy_setopt(curl_.get(), CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, &CurlSftpStream::writeCallback);
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, this);

        if (curl_multi_add_handle(multi_.get(), curl_.get()) != CURLM_OK) {
            throw TransferError(ErrorKind::Open, fmt::format("Cannot start transfer of {}", path_));
        }
    }

    ~CurlSftpStream() override {
        curl_multi_remove_handle(multi_.get(), curl_.get());
    }

    CurlSftpStream(const CurlSftpStream&) = delete;
    CurlSftpStream& operator=(const CurlSftpStream&) = delete;

    std::size_t read(char* buffer, std::size_t size) override {
        while (available() == 0 && !finished_) {
            pump();
        }

        if (available() == 0) {
            if (result_ != CURLE_OK) {
                const ErrorKind kind = (result_ == CURLE_REMOTE_FILE_NOT_FOUND && received_ == 0)
                                           ? ErrorKind::Open
                                           : ErrorKind::Read;
                throwCurl(result_, kind, fmt::format("Reading {}", path_));
            }
            return 0;
        }

        const std::size_t count = std::min(size, available());
        std::memcpy(buffer, buffer_.data() + position_, count);
        position_ += count;
        if (position_ == buffer_.size()) {
            buffer_.clear();
            position_ = 0;
        }
        return count;
    }

private:
    [[nodiscard]] std::size_t available() const { return buffer_.size() - position_; }

    void pump() {
        if (paused_) {
            paused_ = false;
            curl_easy_pause(curl_.get(), CURLPAUSE_CONT);
        }

        int running = 0;
        const CURLMcode mc = curl_multi_perform(multi_.get(), &running);
        if (mc != CURLM_OK) {
            throw TransferError(ErrorKind::Read,
                                fmt::format("Reading {}: {}", path_, curl_multi_strerror(mc)));
        }

        if (running == 0) {
            int queued = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
                if (msg->msg == CURLMSG_DONE) {
                    result_ = msg->data.result;
                }
            }
            finished_ = true;
            return;
        }

        if (available() == 0 && !paused_) {
            const CURLMcode wc = curl_multi_wait(multi_.get(), nullptr, 0, kWaitTimeoutMs, nullptr);
            if (wc != CURLM_OK) {
                throw TransferError(ErrorKind::Read,
                                    fmt::format("Waiting on {}: {}", path_, curl_multi_strerror(wc)));
            }
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlSftpStream*>(userdata);
        const size_t total = size * nmemb;
        if (self->available() >= kMaxBufferedBytes) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }

        self->buffer_.insert(self->buffer_.end(), ptr, ptr + total);
        self->received_ += total;
        return total;
    }

    SessionPtr session_;
    std::string path_;
    CurlHandle curl_;
    CurlMultiHandle multi_;

    std::vector<char> buffer_;
    std::size_t position_{0};
    std::uint64_t received_{0};
    bool paused_{false};
    bool finished_{false};
    CURLcode result_{CURLE_OK};
};

class CurlSftpFilesystem final : public RemoteFilesystem {
public:
    explicit CurlSftpFilesystem(SessionPtr session)
        : session_(std::move(session)) {}

    RemoteStat stat(const std::string& path) override {
        auto curl = makeRequest(*session_, path);
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FILETIME, 1L);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throwCurl(res, ErrorKind::Stat, fmt::format("Stat {}", path));
        }

        RemoteStat result;
        curl_off_t length = -1;
        if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
            length >= 0) {
            result.size = static_cast<std::uint64_t>(length);
        }
        curl_off_t filetime = -1;
        if (curl_easy_getinfo(curl.get(), CURLINFO_FILETIME_T, &filetime) == CURLE_OK && filetime >= 0) {
            result.modified = static_cast<std::time_t>(filetime);
        }
        return result;
    }

    std::vector<RemoteEntry> listDir(const std::string& path) override {
        std::string directory = path;
        if (directory.empty() || directory.back() != '/') {
            directory.push_back('/');
        }

        auto curl = makeRequest(*session_, directory);
        std::string listing;
        curl_easy_setopt(curl.get(), CURLOPT_DIRLISTONLY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &appendToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &listing);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throwCurl(res, ErrorKind::List, fmt::format("List {}", directory));
        }

        std::vector<RemoteEntry> entries;
        std::istringstream lines(listing);
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() || line == "." || line == "..") {
                continue;
            }
            entries.push_back(RemoteEntry{line, {}});
        }
        return entries;
    }

    std::unique_ptr<RemoteStream> openRead(const std::string& path, std::uint64_t offset) override {
        return std::make_unique<CurlSftpStream>(session_, path, offset);
    }

private:
    SessionPtr session_;
};

class CurlSftpConnection final : public Connection {
public:
    explicit CurlSftpConnection(SessionPtr session)
        : session_(std::move(session)) {}

    // libcurl connects lazily, so the first request both opens the SSH
    // connection and logs in. Stat of the login directory also brings up the
    // SFTP subsystem.
    void authenticate(const Credentials& credentials) override {
        session_->credentials = &credentials;

        auto curl = makeRequest(*session_, "/~/");
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            session_->credentials = nullptr;
            throwCurl(res, ErrorKind::Connection,
                      fmt::format("Login to {}:{}", session_->endpoint.host, session_->endpoint.port));
        }
        authenticated_ = true;
    }

    std::unique_ptr<RemoteFilesystem> openFilesystem() override {
        if (!authenticated_) {
            throw TransferError(ErrorKind::Connection, "SFTP session is not authenticated");
        }
        return std::make_unique<CurlSftpFilesystem>(session_);
    }

private:
    SessionPtr session_;
    bool authenticated_{false};
};

} // namespace

CurlSftpTransport::CurlSftpTransport() {
    detail::ensureCurlInitialized();
}

std::unique_ptr<Connection> CurlSftpTransport::connect(const ServerEndpoint& endpoint) {
    if (endpoint.host.empty()) {
        throw TransferError(ErrorKind::Connection, "No SFTP host configured");
    }

    auto session = std::make_shared<SessionState>();
    session->endpoint = endpoint;
    session->share.reset(curl_share_init());
    if (!session->share) {
        throw TransferError(ErrorKind::Connection, "Failed to allocate curl share handle");
    }
    if (curl_share_setopt(session->share.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT) != CURLSHE_OK) {
        throw TransferError(ErrorKind::Connection, "libcurl does not support connection sharing");
    }
    session->base_url = fmt::format("sftp://{}:{}", endpoint.host, endpoint.port);

    return std::make_unique<CurlSftpConnection>(std::move(session));
}

} // namespace hsdsync
