/**
 * @file HttpClient.hpp
 * @brief HTTP GET with bounded retries over a pluggable transport
 *
 * HttpTransport performs exactly one request. CurlTransport is the libcurl
 * implementation used at run time; tests substitute a scripted transport.
 * RetryingHttpClient layers authentication, timeout checks, error
 * classification and the retry/backoff schedule on top.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "quadfetch.hpp"
#include "Logger.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace quadfetch {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Receives body chunks of a streamed response; return false to abort
 */
using ChunkSink = std::function<bool(const char* data, std::size_t size)>;

struct HttpRequest {
    std::string url;
    QueryParams query;                 // appended URL-encoded; empty for next-links
    std::vector<std::string> headers;  // "Name: value"
    int timeout_seconds = 60;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;  // empty for successful streamed responses
};

/**
 * @brief One-shot HTTP GET
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform a single GET
     *
     * With a sink, a 2xx body is delivered chunk by chunk and not buffered;
     * non-2xx bodies are always buffered into the response.
     *
     * @throws FetchError TRANSIENT_NETWORK on transport failure,
     *         PERMANENT_REQUEST on a malformed URL, FILESYSTEM when the sink aborts
     */
    virtual HttpResponse perform(const HttpRequest& request, const ChunkSink& sink) = 0;
};

/**
 * @brief libcurl-backed transport; safe to share between threads
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string user_agent = "QuadFetch/1.0");

    HttpResponse perform(const HttpRequest& request, const ChunkSink& sink) override;

    /**
     * @brief Append URL-encoded query parameters to a base URL
     *
     * @throws FetchError TRANSIENT_NETWORK if a parameter cannot be encoded
     */
    static std::string build_url(const std::string& base_url, const QueryParams& query);

private:
    std::string user_agent_;
};

/**
 * @brief True for absolute http(s) URLs with a host
 */
bool is_well_formed_url(const std::string& url);

/**
 * @brief 5xx, 408 and 429 are worth retrying
 */
bool is_transient_status(long status_code);

inline bool is_success_status(long status_code) {
    return status_code >= 200 && status_code < 300;
}

/**
 * @brief Authenticated GET with retry/backoff
 *
 * Sleeps between attempts happen on the calling thread; the client holds no
 * locks, so concurrent callers never wait on each other's backoff.
 */
class RetryingHttpClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param transport Transport used for every attempt (not owned)
     * @param api_key Token sent as "Authorization: api-key <token>"
     * @param sleeper Backoff sleep; defaults to std::this_thread::sleep_for
     */
    RetryingHttpClient(HttpTransport& transport, std::string api_key, Sleeper sleeper = {});

    /**
     * @brief GET with retries per policy
     *
     * @return Response with a 2xx status
     * @throws FetchError PERMANENT_REQUEST (4xx, bad URL), RETRY_EXHAUSTED,
     *         CONFIGURATION (timeout_seconds <= 0)
     */
    HttpResponse get(const std::string& url, const QueryParams& query,
                     int timeout_seconds, const RetryPolicy& policy);

    /**
     * @brief Single-attempt streamed GET; failures are reported, never retried
     *
     * @throws FetchError on any failure, including non-2xx status
     */
    HttpResponse stream(const std::string& url, int timeout_seconds, const ChunkSink& sink);

private:
    HttpTransport& transport_;
    std::string api_key_;
    Sleeper sleeper_;
    Logger logger_;

    HttpRequest make_request(const std::string& url, const QueryParams& query,
                             int timeout_seconds) const;
    void validate(const std::string& url, int timeout_seconds) const;
};

} // namespace quadfetch
