#pragma once

#include "errors.h"
#include <string>
#include <functional>
#include <atomic>

namespace parley {

struct HttpRequest {
    std::string url;
    std::string body;                 ///< JSON payload (POST)
    int timeout_ms = 30000;
    int connect_timeout_ms = 2000;
    const std::atomic<bool>* cancelled = nullptr;   ///< Abort the transfer when set

    /// When set, receives body bytes as they arrive; return false to abort
    std::function<bool(const char* data, size_t size)> on_data;
};

struct HttpResponse {
    long status = 0;
    std::string body;                 ///< Empty when on_data consumed the stream
};

/**
 * @brief Blocking JSON POST over libcurl
 *
 * Transport failures come back as errors: timeouts and connection problems
 * as retryable TransientProvider errors, caller aborts as Cancelled.
 * HTTP error statuses are returned as responses for the caller to classify.
 */
Result<HttpResponse> http_post(const HttpRequest& request);

} // namespace parley
