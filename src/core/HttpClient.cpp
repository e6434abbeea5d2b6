/**
 * @file HttpClient.cpp
 * @brief Implementation of the curl transport and retrying client
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "HttpClient.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <thread>

namespace quadfetch {

namespace {

std::once_flag curl_init_flag;

struct CurlEasyDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

struct CurlUrlDeleter {
    void operator()(CURLU* url) const {
        if (url) {
            curl_url_cleanup(url);
        }
    }
};

struct CurlStringDeleter {
    void operator()(char* text) const {
        curl_free(text);
    }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlStringPtr = std::unique_ptr<char, CurlStringDeleter>;

// Per-transfer state seen by the write callback
struct TransferContext {
    CURL* curl = nullptr;
    const ChunkSink* sink = nullptr;
    std::string* body = nullptr;
    bool sink_aborted = false;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total_size = size * nmemb;
    auto* context = static_cast<TransferContext*>(userp);

    long status = 0;
    curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status);

    // Error bodies never reach the sink
    if (context->sink && *context->sink && is_success_status(status)) {
        if (!(*context->sink)(static_cast<const char*>(contents), total_size)) {
            context->sink_aborted = true;
            return 0;
        }
        return total_size;
    }

    context->body->append(static_cast<const char*>(contents), total_size);
    return total_size;
}

bool is_malformed_url_code(CURLcode code) {
    return code == CURLE_URL_MALFORMAT || code == CURLE_UNSUPPORTED_PROTOCOL;
}

std::string escape_query_component(const std::string& text) {
    CurlStringPtr escaped(curl_easy_escape(nullptr, text.c_str(), static_cast<int>(text.size())));
    if (!escaped) {
        throw FetchError(ErrorKind::TRANSIENT_NETWORK, "Failed to encode query parameter '" + text + "'");
    }
    return std::string(escaped.get());
}

} // namespace

// ============================================================================
// CurlTransport
// ============================================================================

CurlTransport::CurlTransport(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string CurlTransport::build_url(const std::string& base_url, const QueryParams& query) {
    if (query.empty()) {
        return base_url;
    }

    std::string url = base_url;
    url += (base_url.find('?') == std::string::npos) ? '?' : '&';

    bool first = true;
    for (const auto& [key, value] : query) {
        if (!first) {
            url += '&';
        }
        first = false;

        url += escape_query_component(key);
        url += '=';
        url += escape_query_component(value);
    }
    return url;
}

HttpResponse CurlTransport::perform(const HttpRequest& request, const ChunkSink& sink) {
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        throw FetchError(ErrorKind::TRANSIENT_NETWORK, "Failed to initialize curl");
    }

    const std::string url = build_url(request.url, request.query);

    CurlSlistPtr header_list;
    for (const auto& header : request.headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            throw FetchError(ErrorKind::TRANSIENT_NETWORK, "Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    HttpResponse response;
    TransferContext context;
    context.curl = curl.get();
    context.sink = &sink;
    context.body = &response.body;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.timeout_seconds));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);  // required with worker threads
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());

    const CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);

    if (context.sink_aborted) {
        throw FetchError(ErrorKind::FILESYSTEM, "Write aborted while receiving " + url);
    }
    if (res != CURLE_OK) {
        const std::string reason = std::string(curl_easy_strerror(res)) + " (" + url + ")";
        if (is_malformed_url_code(res)) {
            throw FetchError(ErrorKind::PERMANENT_REQUEST, reason);
        }
        throw FetchError(ErrorKind::TRANSIENT_NETWORK, reason);
    }

    return response;
}

// ============================================================================
// Classification helpers
// ============================================================================

bool is_well_formed_url(const std::string& url) {
    if (url.empty()) {
        return false;
    }

    CurlUrlPtr handle(curl_url());
    if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return false;
    }

    char* scheme = nullptr;
    char* host = nullptr;
    bool ok = curl_url_get(handle.get(), CURLUPART_SCHEME, &scheme, 0) == CURLUE_OK &&
              curl_url_get(handle.get(), CURLUPART_HOST, &host, 0) == CURLUE_OK;
    if (ok) {
        const std::string scheme_str(scheme);
        ok = (scheme_str == "http" || scheme_str == "https") && host[0] != '\0';
    }
    curl_free(scheme);
    curl_free(host);
    return ok;
}

bool is_transient_status(long status_code) {
    return status_code >= 500 || status_code == 408 || status_code == 429;
}

// ============================================================================
// RetryingHttpClient
// ============================================================================

RetryingHttpClient::RetryingHttpClient(HttpTransport& transport, std::string api_key, Sleeper sleeper)
    : transport_(transport),
      api_key_(std::move(api_key)),
      sleeper_(std::move(sleeper)),
      logger_("HttpClient") {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

HttpRequest RetryingHttpClient::make_request(const std::string& url, const QueryParams& query,
                                             int timeout_seconds) const {
    HttpRequest request;
    request.url = url;
    request.query = query;
    request.timeout_seconds = timeout_seconds;
    if (!api_key_.empty()) {
        request.headers.push_back("Authorization: api-key " + api_key_);
    }
    return request;
}

void RetryingHttpClient::validate(const std::string& url, int timeout_seconds) const {
    if (timeout_seconds <= 0) {
        throw FetchError(ErrorKind::CONFIGURATION,
                         "Timeout must be positive, got " + std::to_string(timeout_seconds));
    }
    if (!is_well_formed_url(url)) {
        throw FetchError(ErrorKind::PERMANENT_REQUEST, "Malformed URL: '" + url + "'");
    }
}

HttpResponse RetryingHttpClient::get(const std::string& url, const QueryParams& query,
                                     int timeout_seconds, const RetryPolicy& policy) {
    validate(url, timeout_seconds);

    const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    const HttpRequest request = make_request(url, query, timeout_seconds);
    std::string last_error;

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        logger_.debug("GET " + url + " (attempt " + std::to_string(attempt + 1) + "/" +
                      std::to_string(max_attempts) + ")");

        try {
            HttpResponse response = transport_.perform(request, ChunkSink{});
            if (is_success_status(response.status_code)) {
                return response;
            }
            if (!is_transient_status(response.status_code)) {
                throw FetchError(ErrorKind::PERMANENT_REQUEST,
                                 "HTTP " + std::to_string(response.status_code) + " for " + url);
            }
            last_error = "HTTP " + std::to_string(response.status_code);
        } catch (const FetchError& e) {
            if (e.kind() != ErrorKind::TRANSIENT_NETWORK) {
                throw;
            }
            last_error = e.what();
        }

        if (attempt + 1 < max_attempts) {
            const auto delay = policy.delay_after(attempt);
            logger_.warning("Request to " + url + " failed (" + last_error + "); retry " +
                            std::to_string(attempt + 2) + "/" + std::to_string(max_attempts) +
                            " in " + std::to_string(delay.count()) + " ms");
            sleeper_(delay);
        }
    }

    throw FetchError(ErrorKind::RETRY_EXHAUSTED,
                     "Giving up on " + url + " after " + std::to_string(max_attempts) +
                     " attempts; last error: " + last_error);
}

HttpResponse RetryingHttpClient::stream(const std::string& url, int timeout_seconds,
                                        const ChunkSink& sink) {
    validate(url, timeout_seconds);

    HttpResponse response = transport_.perform(make_request(url, {}, timeout_seconds), sink);
    if (!is_success_status(response.status_code)) {
        const ErrorKind kind = is_transient_status(response.status_code)
            ? ErrorKind::TRANSIENT_NETWORK
            : ErrorKind::PERMANENT_REQUEST;
        throw FetchError(kind, "HTTP " + std::to_string(response.status_code) + " for " + url);
    }
    return response;
}

} // namespace quadfetch
