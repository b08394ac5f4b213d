#include "http_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <mutex>

namespace parley {

namespace {

struct TransferState {
    const HttpRequest* request = nullptr;
    std::string buffer;
    bool aborted_by_caller = false;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    size_t total_size = size * nmemb;
    if (state->request->cancelled && state->request->cancelled->load()) {
        state->aborted_by_caller = true;
        return 0;
    }
    if (state->request->on_data) {
        if (!state->request->on_data(static_cast<const char*>(contents), total_size)) {
            state->aborted_by_caller = true;
            return 0;
        }
    } else {
        state->buffer.append(static_cast<char*>(contents), total_size);
    }
    return total_size;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(clientp);
    if (state->request->cancelled && state->request->cancelled->load()) {
        state->aborted_by_caller = true;
        return 1;
    }
    return 0;
}

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

Result<HttpResponse> http_post(const HttpRequest& request) {
    ensure_curl_initialized();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_provider_error("Failed to initialize CURL");
    }

    TransferState state;
    state.request = &request;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms));

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (state.aborted_by_caller) {
        return make_cancelled_error("Request to " + request.url + " cancelled");
    }

    switch (res) {
        case CURLE_OK:
            break;
        case CURLE_OPERATION_TIMEDOUT:
            return make_transient_error("Request to " + request.url + " timed out after " +
                                        std::to_string(request.timeout_ms) + "ms");
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return make_transient_error(std::string("Connection problem: ") + curl_easy_strerror(res));
        default:
            return make_provider_error(std::string("HTTP transfer failed: ") + curl_easy_strerror(res));
    }

    HttpResponse response;
    response.status = status;
    response.body = std::move(state.buffer);
    return response;
}

} // namespace parley
