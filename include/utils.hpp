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

#ifndef LEXIS_UTILS_HPP
#define LEXIS_UTILS_HPP
#include <array>
#include <atomic>
#include <curl/curl.h>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace corespace {

/// @brief Single query parameter: key=value (pre-encoding is handled by
/// libcurl).
using parameter = std::pair<std::string, std::string>;
/// @brief Ordered list of query parameters appended to the URL.
using parameter_list = std::vector<parameter>;

enum class http_method { get, post };

/**
 * @struct network_metrics
 * @brief Thread-safe counters describing client-side networking activity.
 *
 * Semantics:
 *  - `requests` counts finished transfer attempts (successful or not).
 *  - `retries` counts retry cycles triggered by retryable outcomes.
 *  - `sleep_ms` is the total backoff time slept between attempts.
 *  - `network_ms` is the accumulated wall-clock duration spent inside
 *    libcurl for performed requests (sum over attempts).
 *  - `bytes_received` sums body sizes appended via the write callback,
 *    streamed bodies included.
 *  - `statuses[i]` counts responses with HTTP status `i` (0..599). Values
 *    outside the array bounds are ignored.
 */
struct network_metrics final {
    std::atomic<unsigned> requests {
        0
    }; ///< Finished attempts (success or failure).
    std::atomic<unsigned> retries { 0 }; ///< Number of retry cycles triggered.
    std::atomic<long long> sleep_ms {
        0
    }; ///< Total backoff duration slept (ms).
    std::atomic<long long> network_ms {
        0
    }; ///< Total time spent in libcurl (ms).
    std::atomic<size_t> bytes_received {
        0
    }; ///< Sum of response body sizes (bytes).
    std::array<std::atomic<unsigned>, 600>
        statuses; ///< Per-code histogram for HTTP 0..599.

    /**
     * @brief Zero-initialize per-status counters.
     */
    network_metrics();
};

/**
 * @struct http_request
 * @brief Transport-neutral description of one HTTP call.
 *
 * `retry` selects whether the transport may apply its own backoff policy.
 * Status polling turns it off because the poller classifies 404 and 429
 * itself.
 */
struct http_request {
    http_method method = http_method::get;
    std::string url;
    parameter_list query;
    std::string body;
    std::string content_type = "application/json";
    std::string accept;
    bool retry = true;
};

/**
 * @struct http_response
 * @brief Result object for an HTTP transfer.
 *
 * Invariants:
 *  - `error_code == CURLE_OK` means libcurl completed without a transport
 * error.
 *  - `status_code` carries the HTTP status (2xx denotes success).
 *  - `header` contains response headers from the final transfer attempt.
 *  - `text` accumulates the response body as received (empty for streamed
 *    transfers, whose bytes go to the caller's sink).
 *  - When `error_code != CURLE_OK`, `error_message` contains a stable
 *    human-readable description (from `curl_easy_strerror`).
 */
struct http_response {
    /// Case-preserving multimap of response headers (as returned by libcurl).
    using header_map = std::multimap<std::string, std::string, std::less<>>;

    size_t status_code = 0; ///< HTTP status code (e.g., 200, 404).
    header_map header; ///< Response headers from the final attempt.
    std::string text; ///< Response body accumulated across callbacks.
    CURLcode error_code = CURLE_OK; ///< libcurl transport/result code.
    std::string error_message; ///< Non-empty on libcurl error.

    /// @return true if the transport succeeded and the status is 2xx.
    [[nodiscard]] bool ok() const noexcept;
};

/**
 * @struct network_options
 * @brief Fixed runtime options for the HTTP client.
 *
 * Timeouts and retry policy:
 *  - `timeout_ms`: total operation timeout (libcurl `CURLOPT_TIMEOUT_MS`).
 *    Streamed transfers use `stream_timeout_ms` instead.
 *  - `connect_ms`: connect timeout (libcurl `CURLOPT_CONNECTTIMEOUT_MS`).
 *  - `max_retries`: maximum number of retries after the first attempt.
 *  - `retry_base_ms`: base delay for exponential backoff with jitter.
 *  - `retry_max_ms`: hard cap for a single backoff sleep.
 *
 * Headers and identity:
 *  - `accept`: default value for the `Accept:` request header.
 *  - `user_agent`: value for the `User-Agent:` request header.
 *  - `bearer_token`: sent as `Authorization: Bearer <token>` when set.
 */
struct network_options {
    int timeout_ms = 30000; ///< Total request timeout (ms).
    int stream_timeout_ms = 120000; ///< Total streamed transfer timeout (ms).
    int connect_ms = 3000; ///< Connect timeout (ms).
    int max_retries = 3; ///< Max retry attempts after the first try.
    int retry_base_ms = 200; ///< Base for exponential backoff (ms).
    long long retry_max_ms = 3000; ///< Max per-attempt backoff (ms).

    std::string accept = "application/json"; ///< Default Accept header.
    std::string user_agent = "lexis/client"; ///< Default User-Agent.
    std::string bearer_token; ///< Optional API token.
};

/**
 * @brief Normalize a search query for use in cache keys.
 *
 * Trims surrounding whitespace, lowercases ASCII letters, replaces the
 * ideographic space (U+3000) with a plain space and collapses whitespace
 * runs to a single space. Non-ASCII bytes are kept verbatim.
 *
 * @param text Raw user input.
 * @return Normalized query.
 */
std::string normalize_query(std::string_view text);

/**
 * @brief Strip leading and trailing ASCII whitespace.
 */
std::string_view trim(std::string_view text) noexcept;

/**
 * @brief Number of code points in UTF-8 encoded @p text.
 *
 * Continuation bytes are not counted; malformed sequences are counted byte
 * by byte.
 */
std::size_t utf8_length(std::string_view text) noexcept;

/**
 * @brief Join a span of strings with a separator (no encoding or
 *        validation).
 *
 * @param parts      Input strings to join.
 * @param separator  Separator between elements (default: ", ").
 * @return Concatenated string; empty input yields an empty string.
 */
std::string
join_str(std::span<const std::string> parts, std::string_view separator = ", ");

}
#endif // LEXIS_UTILS_HPP
