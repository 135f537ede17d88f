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

#ifndef LEXIS_BACKEND_CLIENT_HPP
#define LEXIS_BACKEND_CLIENT_HPP

#include "content.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "sse_parser.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace lexispace {
/**
 * @struct backend_options
 * @brief Location of the generation service and the model configuration
 * sent with every prompt.
 *
 * Generation endpoints live under `base_url + api_prefix`; translation uses
 * `base_url + translate_path`.
 */
struct backend_options {
    std::string base_url = "http://localhost:3000";
    std::string api_prefix = "/api/gemini";
    std::string translate_path = "/api/translate";
    nlohmann::json model_config = {
        { "model", "gemini-2.5-flash" },
        { "temperature", 0.3 },
        { "maxOutputTokens", 8192 },
    };
};

/// Payload and token count of a finished generation.
struct generation_result {
    nlohmann::json data;
    long tokens_used = 0;
};

enum class task_state { queued, running, completed, error };

/**
 * @brief Parse a task status name.
 * @throws lexis_error(malformed_response) for an unknown name.
 */
task_state parse_task_state(std::string_view name);

/**
 * @struct generation_task
 * @brief Snapshot of a server-side generation task as reported by
 * `GET /task/{id}`.
 */
struct generation_task {
    std::string id;
    task_state status = task_state::queued;
    int progress = 0; ///< 0..100 as reported by the server.
    nlohmann::json partial_result; ///< Null until the server has content.
    long tokens_used = 0;
    std::string error;
};

/**
 * @struct task_poll_response
 * @brief Outcome of one status poll.
 *
 * `task` is set only for 2xx responses. Non-2xx statuses are returned, not
 * thrown, so that the poller can apply its own 404/429 policy.
 */
struct task_poll_response {
    long http_status = 0;
    std::optional<generation_task> task;
    std::string message;
};

/// Receiver for decoded stream events.
using event_sink = std::function<void(const stream_event&)>;

/**
 * @class backend_client
 * @brief Typed access to every endpoint of the generation service.
 *
 * Error mapping for non-2xx responses: 429 raises `rate_limited`, 404 raises
 * `not_found`, anything else raises `http_status`; the message is taken from
 * the JSON body (`message`, then `error`) or is `"API Error: <status>"`.
 * Bodies that are not the expected JSON raise `malformed_response`.
 *
 * The client holds no mutable state beyond the transport and may be shared
 * by concurrent callers when the transport can.
 */
class backend_client {
public:
    explicit backend_client(
        corespace::transport& link, backend_options opt = {}
    );

    /// `POST /generate` -> `{text}`.
    std::string generate_text(const std::string& prompt);

    /// `POST /generate-json` -> `{data, tokensUsed}`.
    generation_result generate_json(const std::string& prompt);

    /// `POST /generate-basic-info`: headword and senses only, fast.
    generation_result generate_basic(const std::string& prompt);

    /**
     * @brief `POST /generate-json-progressive`: start a polled task.
     * @return The task id.
     */
    std::string start_task(const std::string& prompt);

    /**
     * @brief `GET /task/{id}` without transport-level retries.
     */
    task_poll_response task_status(const std::string& task_id);

    /**
     * @brief `POST /generate-additional-stream` (hint, metrics, examples).
     *
     * Every decoded event is passed to @p on_event as it arrives; the
     * `complete` event's payload is returned.
     *
     * @throws lexis_error(remote_failure) on an `error` event,
     *         lexis_error(malformed_response) if the stream ends without a
     *         terminal event, lexis_error(cancelled) once @p stop is
     *         requested.
     */
    generation_result stream_additional(
        const std::string& prompt, const event_sink& on_event,
        std::stop_token stop = {}
    );

    /**
     * @brief `POST /generate-suggestions-stream`.
     *
     * Each suggestion arrives as a `section` event whose data is one item;
     * the `complete` payload is the full list. Same error contract as
     * `stream_additional`.
     */
    generation_result stream_suggestions(
        const std::string& prompt, const event_sink& on_event,
        std::stop_token stop = {}
    );

    /**
     * @brief `POST /generate-usage-hint` for one lemma.
     *
     * Usage hints are decoration: any failure is logged and yields an
     * empty string.
     */
    std::string generate_usage_hint(
        const std::string& lemma, const std::string& query,
        const std::string& native_lang
    ) noexcept;

    /**
     * @brief `POST /api/translate`.
     * @throws lexis_error(invalid_input) if @p text is empty or longer than
     *         `max_translation_length` characters.
     */
    translation translate(
        const std::string& text, const std::string& source_lang,
        const std::string& target_lang
    );

    /**
     * @brief `GET /status` availability probe.
     * @return The server's `configured` flag; false on any failure.
     */
    bool configured() noexcept;

    [[nodiscard]] const backend_options& options() const noexcept;

private:
    [[nodiscard]] std::string endpoint(std::string_view path) const;
    [[nodiscard]] std::string prompt_body(const std::string& prompt) const;

    corespace::http_response
    post_json(const std::string& url, const std::string& body);

    generation_result
    post_generation(std::string_view path, const std::string& prompt);

    generation_result stream_generation(
        std::string_view path, const std::string& prompt,
        const event_sink& on_event, std::stop_token stop
    );

    corespace::transport& link;
    const backend_options opt;
};

/**
 * @brief Build the typed error for a non-2xx @p response.
 */
corespace::lexis_error
status_error(const corespace::http_response& response);

/**
 * @brief Parse the body of a 2xx @p response as JSON.
 * @throws lexis_error(malformed_response) if it is not valid JSON.
 */
nlohmann::json parse_body(const corespace::http_response& response);
}
#endif // LEXIS_BACKEND_CLIENT_HPP
