#pragma once

#include "hsdsync/errors.hpp"

#include <memory>

#include <curl/curl.h>

namespace hsdsync::detail {

// Safe to call from any thread, any number of times.
void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlMultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;
using CurlShareHandle = std::unique_ptr<CURLSH, decltype(&curl_share_cleanup)>;

[[nodiscard]] CurlHandle makeEasyHandle();

// Maps a failed transfer to the kind of error it represents. `fallback` is
// used for every code that is not about reaching or logging into the host.
[[nodiscard]] ErrorKind classifyCurlError(CURLcode code, ErrorKind fallback) noexcept;

} // namespace hsdsync::detail
