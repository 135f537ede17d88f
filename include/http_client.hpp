/*
 * The MIT License (MIT)
 *
 * Copyright (c) 2025 Yaroslav Riabtsev <yaroslav.riabtsev@rwth-aachen.de>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NON-INFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef LEXIS_HTTP_CLIENT_HPP
#define LEXIS_HTTP_CLIENT_HPP

#include "utils.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace corespace {
/**
 * @brief Receiver for streamed response bytes.
 *
 * Called once per network chunk in arrival order. Returning false aborts
 * the transfer.
 */
using chunk_sink = std::function<bool(std::string_view)>;

/**
 * @class transport
 * @brief Abstract HTTP exchange used by the backend client.
 *
 * Implementations return every HTTP-level outcome (any status code) as an
 * `http_response` and throw `lexis_error(network)` only when no HTTP
 * response could be obtained.
 */
class transport {
public:
    virtual ~transport() = default;

    /**
     * @brief Perform @p request and return the buffered response.
     * @throws lexis_error(network) on terminal transport failure.
     */
    virtual http_response send(const http_request& request) = 0;

    /**
     * @brief Perform @p request, forwarding body bytes to @p sink as they
     * arrive instead of buffering them.
     * @throws lexis_error(network) on transport failure.
     */
    virtual http_response
    stream(const http_request& request, const chunk_sink& sink)
        = 0;
};

/**
 * @class http_client
 * @brief HTTP client built on libcurl.
 *
 * Responsibilities:
 *  - Build request URLs with encoded query parameters.
 *  - Issue GET and JSON POST requests with redirect following enabled.
 *  - Apply bounded exponential backoff with jitter for retryable outcomes
 *    when `http_request::retry` is set: network errors, 408 (Request
 *    Timeout), 429 (Too Many Requests), and 5xx.
 *  - Forward streamed bodies chunk by chunk (Server-Sent Events).
 *  - Aggregate lightweight, thread-safe network metrics.
 *
 * Lifetime and thread-safety:
 *  - Every call uses its own easy handle, so one instance may be shared by
 *    concurrent callers. Only the metrics are shared state (atomics).
 *  - `curl_global_init` is performed once per process via `std::call_once`.
 */
class http_client final : public transport {
public:
    /**
     * @brief Construct a client and initialize libcurl.
     *
     * @param opt Fixed options (timeouts, retry policy, identity headers).
     * @throws std::runtime_error if libcurl global initialization fails.
     */
    explicit http_client(network_options opt = {});

    /**
     * @brief Perform @p request with the retry policy.
     *
     * On non-2xx or transport errors the request is retried up to
     * `opt.max_retries` times when `request.retry` is set and the outcome
     * is retryable; the server `Retry-After` hint raises the sleep.
     *
     * @return Final response, whatever its HTTP status.
     * @throws lexis_error(network) if the last attempt failed in libcurl.
     */
    http_response send(const http_request& request) override;

    /**
     * @brief Perform @p request once, streaming the body into @p sink.
     *
     * Streams are never retried: bytes may already have been consumed.
     *
     * @throws lexis_error(network) on libcurl failure (other than an abort
     *         requested by the sink).
     */
    http_response
    stream(const http_request& request, const chunk_sink& sink) override;

    /**
     * @brief Access aggregated network metrics.
     * @return Const reference to the metrics snapshot.
     */
    [[nodiscard]] const network_metrics& metrics_info() const;

private:
    /// Unique pointer type for `CURLU` with proper deleter.
    using curl_url_ptr = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;
    using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using slist_ptr
        = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    /**
     * @brief Construct a `CURLU` handle from @p url and append @p params.
     *
     * Each parameter is URL-encoded and appended via `CURLU_APPENDQUERY`.
     *
     * @throws std::runtime_error if allocation or URL assembly fails.
     */
    static curl_url_ptr
    build_url(std::string_view url, const parameter_list& params);

    /**
     * @brief Create an easy handle with the fixed options installed.
     * @throws std::runtime_error if libcurl cannot allocate a handle.
     */
    curl_ptr make_handle(long timeout_ms) const;

    /**
     * @brief Build the request header list (Accept, Content-Type, auth).
     */
    slist_ptr build_headers(const http_request& request) const;

    /**
     * @brief Execute a single transfer for @p request.
     *
     * Body bytes go to @p sink when given, otherwise to `response.text`.
     * Measures elapsed steady-clock time and returns it via @p elapsed.
     */
    http_response perform(
        CURL* handle, const http_request& request, const chunk_sink* sink,
        std::chrono::milliseconds& elapsed
    );

    /**
     * @brief Refresh the header multimap from the last transfer.
     */
    static void update_headers(CURL* handle, http_response& response);

    /**
     * @brief Update counters and histograms after an attempt.
     */
    void update_metrics(
        const http_response& response, std::chrono::milliseconds elapsed
    );

    /**
     * @brief Retry predicate for transient outcomes.
     *
     * Retries on any libcurl error, HTTP 408, HTTP 429 and HTTP 5xx.
     */
    [[nodiscard]] static bool status_retry(const http_response& response);

    /**
     * @brief Compute the next backoff delay for @p attempt (1-based).
     *
     * Strategy: exponential backoff with full jitter. The base grows as
     * `retry_base_ms * 2^(attempt-1)` and a uniform random component in
     * `[0, base]` is added; the result is capped at `retry_max_ms`.
     */
    [[nodiscard]] long long next_delay(int attempt) const;

    /**
     * @brief Raise @p sleep_ms to the server `Retry-After` hint, if any.
     */
    static void apply_server_retry_hint(CURL* handle, long long& sleep_ms);

    static size_t
    write_callback(const char* ptr, size_t size, size_t n, void* data);
    static size_t
    stream_callback(const char* ptr, size_t size, size_t n, void* data);

    const network_options opt; ///< Fixed options installed at construction.
    network_metrics metrics; ///< Aggregated metrics (atomic counters).
};
}
#endif // LEXIS_HTTP_CLIENT_HPP
