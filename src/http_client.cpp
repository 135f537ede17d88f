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

#include "http_client.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "rng.hpp"

#include <algorithm>
#include <mutex>
#include <thread>

namespace corespace {
namespace {
    std::once_flag global_curl;

    void curl_inited() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != 0) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    struct stream_target {
        const chunk_sink* sink;
        size_t received = 0;
    };
}

http_client::http_client(network_options opt)
    : opt(std::move(opt)) {
    std::call_once(global_curl, curl_inited);
}

const network_metrics& http_client::metrics_info() const { return metrics; }

http_response http_client::send(const http_request& request) {
    const auto handle = make_handle(opt.timeout_ms);
    for (int attempt = 1;; ++attempt) {
        std::chrono::milliseconds elapsed { 0l };
        http_response response
            = perform(handle.get(), request, nullptr, elapsed);
        update_metrics(response, elapsed);

        const bool net_ok = (response.error_code == CURLE_OK);
        if (response.ok()) {
            return response;
        }
        if (request.retry && attempt <= opt.max_retries
            && status_retry(response)) {
            ++metrics.retries;
            long long sleep_ms = next_delay(attempt);
            apply_server_retry_hint(handle.get(), sleep_ms);
            metrics.sleep_ms += sleep_ms;
            logger()->debug(
                "retrying {} after {} ms (attempt {}, status {})", request.url,
                sleep_ms, attempt, response.status_code
            );
            std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
            continue;
        }
        if (!net_ok) {
            throw lexis_error(
                error_kind::network, "curl error: " + response.error_message
            );
        }
        return response;
    }
}

http_response
http_client::stream(const http_request& request, const chunk_sink& sink) {
    const auto handle = make_handle(opt.stream_timeout_ms);
    std::chrono::milliseconds elapsed { 0l };
    http_response response = perform(handle.get(), request, &sink, elapsed);
    update_metrics(response, elapsed);
    if (response.error_code == CURLE_WRITE_ERROR) {
        // the sink asked to stop; what arrived so far is the result
        response.error_code = CURLE_OK;
        response.error_message.clear();
    }
    if (response.error_code != CURLE_OK) {
        throw lexis_error(
            error_kind::network, "curl error: " + response.error_message
        );
    }
    return response;
}

http_client::curl_url_ptr http_client::build_url(
    const std::string_view url, const parameter_list& params
) {
    curl_url_ptr url_handle(curl_url(), &curl_url_cleanup);
    if (!url_handle) {
        throw std::runtime_error("curl_url failed");
    }

    const std::string url_copy(url);
    if (curl_url_set(url_handle.get(), CURLUPART_URL, url_copy.c_str(), 0)
        != CURLUE_OK) {
        throw std::runtime_error("failed to set request url");
    }

    for (const auto& [key, value] : params) {
        std::string parameter = key + "=" + std::string(value);
        if (curl_url_set(
                url_handle.get(), CURLUPART_QUERY, parameter.c_str(),
                CURLU_APPENDQUERY | CURLU_URLENCODE
            )
            != CURLUE_OK) {
            throw std::runtime_error("failed to append query parameter");
        }
    }

    return url_handle;
}

http_client::curl_ptr http_client::make_handle(const long timeout_ms) const {
    curl_ptr handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        throw std::runtime_error("curl_easy_init failed");
    }
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, opt.user_agent.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(
        handle.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(opt.connect_ms)
    );
    return handle;
}

http_client::slist_ptr
http_client::build_headers(const http_request& request) const {
    slist_ptr headers(nullptr, &curl_slist_free_all);
    const auto append = [&headers](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (!next) {
            throw std::runtime_error("failed to allocate curl headers");
        }
        headers.release();
        headers.reset(next);
    };

    append("Accept: " + (request.accept.empty() ? opt.accept : request.accept));
    if (request.method == http_method::post) {
        append("Content-Type: " + request.content_type);
    }
    if (!opt.bearer_token.empty()) {
        append("Authorization: Bearer " + opt.bearer_token);
    }
    return headers;
}

http_response http_client::perform(
    CURL* const handle, const http_request& request, const chunk_sink* sink,
    std::chrono::milliseconds& elapsed
) {
    using namespace std::chrono;

    http_response response;
    const auto url_handle = build_url(request.url, request.query);
    const auto headers = build_headers(request);
    stream_target target { sink };

    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_CURLU, url_handle.get());
    if (request.method == http_method::post) {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(
            handle, CURLOPT_POSTFIELDSIZE,
            static_cast<long>(request.body.size())
        );
    } else {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    }
    if (sink) {
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, stream_callback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &target);
    } else {
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.text);
    }

    const auto t0 = steady_clock::now();
    response.error_code = curl_easy_perform(handle);
    const auto t1 = steady_clock::now();
    elapsed = duration_cast<milliseconds>(t1 - t0);

    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, nullptr);
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, 0L);
    curl_easy_setopt(handle, CURLOPT_CURLU, nullptr);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, nullptr);

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<size_t>(status);
    update_headers(handle, response);

    if (response.error_code != CURLE_OK) {
        response.error_message = curl_easy_strerror(response.error_code);
    }
    if (sink) {
        metrics.bytes_received += target.received;
    }
    return response;
}

void http_client::update_headers(CURL* const handle, http_response& response) {
    response.header.clear();
    for (curl_header* header = nullptr;;) {
        header = curl_easy_nextheader(handle, CURLH_HEADER, 0, header);
        if (!header) {
            break;
        }
        response.header.emplace(header->name, header->value);
    }
}

void http_client::update_metrics(
    const http_response& response, const std::chrono::milliseconds elapsed
) {
    ++metrics.requests;
    metrics.network_ms += elapsed.count();

    if (response.status_code < metrics.statuses.size()) {
        ++metrics.statuses[response.status_code];
    }
    metrics.bytes_received += response.text.size();
}

bool http_client::status_retry(const http_response& response) {
    return response.error_code != CURLE_OK || response.status_code == 429
        || response.status_code == 408
        || (response.status_code >= 500 && response.status_code < 600);
}

long long http_client::next_delay(const int attempt) const {
    const long long base = opt.retry_base_ms * (1LL << (attempt - 1));
    return std::min(base + random_between(0, base), opt.retry_max_ms);
}

void http_client::apply_server_retry_hint(
    CURL* const handle, long long& sleep_ms
) {
    curl_off_t retry_after = -1;
    if (curl_easy_getinfo(handle, CURLINFO_RETRY_AFTER, &retry_after)
            == CURLE_OK
        && retry_after >= 0) {
        const long long server_hint_ms
            = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::seconds(retry_after)
            )
                  .count();
        sleep_ms = std::max(sleep_ms, server_hint_ms);
    }
}

size_t http_client::write_callback(
    const char* ptr, const size_t size, const size_t n, void* data
) {
    const size_t total = size * n;
    auto* text = static_cast<std::string*>(data);
    text->append(ptr, total);
    return total;
}

size_t http_client::stream_callback(
    const char* ptr, const size_t size, const size_t n, void* data
) {
    const size_t total = size * n;
    auto* target = static_cast<stream_target*>(data);
    target->received += total;
    if (!(*target->sink)(std::string_view(ptr, total))) {
        return 0;
    }
    return total;
}
}
