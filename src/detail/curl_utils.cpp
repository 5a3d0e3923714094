#include "hsdsync/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace hsdsync::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeEasyHandle() {
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransferError(ErrorKind::Connection, "Failed to allocate curl handle");
    }
    return curl;
}

ErrorKind classifyCurlError(CURLcode code, ErrorKind fallback) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSH:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_FAILED_INIT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorKind::Connection;
        case CURLE_LOGIN_DENIED:
            return ErrorKind::Auth;
        default:
            return fallback;
    }
}

} // namespace hsdsync::detail
