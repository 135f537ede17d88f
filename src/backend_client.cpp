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

#include "backend_client.hpp"
#include "logging.hpp"

#include <exception>

namespace lexispace {
namespace {
    constexpr std::size_t error_body_limit = 4096;

    std::string body_message(const std::string& text) {
        const auto body = nlohmann::json::parse(text, nullptr, false);
        if (!body.is_object()) {
            return {};
        }
        for (const char* name : { "message", "error" }) {
            const auto it = body.find(name);
            if (it != body.end() && it->is_string() && !it->empty()) {
                return it->get<std::string>();
            }
        }
        return {};
    }

    long tokens_of(const nlohmann::json& body) {
        const auto it = body.find("tokensUsed");
        if (it == body.end() || !it->is_number()) {
            return 0;
        }
        return it->get<long>();
    }

    generation_task decode_task(
        const std::string& task_id, const nlohmann::json& body
    ) {
        if (!body.is_object()) {
            throw corespace::lexis_error(
                corespace::error_kind::malformed_response,
                "task status is not a JSON object"
            );
        }
        generation_task task;
        task.id = task_id;
        task.status = parse_task_state(body.at("status").get<std::string>());
        task.progress = body.value("progress", 0);
        task.partial_result = body.value("partialData", nlohmann::json());
        task.tokens_used = tokens_of(body);
        if (const auto it = body.find("error"); it != body.end() && it->is_string()) {
            task.error = it->get<std::string>();
        }
        return task;
    }
}

task_state parse_task_state(const std::string_view name) {
    if (name == "queued") {
        return task_state::queued;
    }
    if (name == "running") {
        return task_state::running;
    }
    if (name == "completed") {
        return task_state::completed;
    }
    if (name == "error") {
        return task_state::error;
    }
    throw corespace::lexis_error(
        corespace::error_kind::malformed_response,
        "unknown task status: " + std::string(name)
    );
}

corespace::lexis_error status_error(const corespace::http_response& response) {
    using corespace::error_kind;
    const long status = static_cast<long>(response.status_code);
    std::string message = body_message(response.text);
    if (message.empty()) {
        message = "API Error: " + std::to_string(status);
    }
    error_kind kind = error_kind::http_status;
    if (status == 429) {
        kind = error_kind::rate_limited;
    } else if (status == 404) {
        kind = error_kind::not_found;
    }
    return { kind, message, status };
}

nlohmann::json parse_body(const corespace::http_response& response) {
    auto body = nlohmann::json::parse(response.text, nullptr, false);
    if (body.is_discarded()) {
        throw corespace::lexis_error(
            corespace::error_kind::malformed_response,
            "response body is not valid JSON",
            static_cast<long>(response.status_code)
        );
    }
    return body;
}

backend_client::backend_client(corespace::transport& link, backend_options opt)
    : link(link)
    , opt(std::move(opt)) { }

const backend_options& backend_client::options() const noexcept { return opt; }

std::string backend_client::endpoint(const std::string_view path) const {
    return opt.base_url + opt.api_prefix + std::string(path);
}

std::string backend_client::prompt_body(const std::string& prompt) const {
    return nlohmann::json { { "prompt", prompt }, { "config", opt.model_config } }
        .dump();
}

corespace::http_response
backend_client::post_json(const std::string& url, const std::string& body) {
    corespace::http_request request;
    request.method = corespace::http_method::post;
    request.url = url;
    request.body = body;
    auto response = link.send(request);
    if (!response.ok()) {
        throw status_error(response);
    }
    return response;
}

generation_result backend_client::post_generation(
    const std::string_view path, const std::string& prompt
) {
    const auto body = parse_body(post_json(endpoint(path), prompt_body(prompt)));
    if (!body.is_object() || !body.contains("data")) {
        throw corespace::lexis_error(
            corespace::error_kind::malformed_response,
            "generation response has no data member"
        );
    }
    return { body["data"], tokens_of(body) };
}

std::string backend_client::generate_text(const std::string& prompt) {
    const auto body
        = parse_body(post_json(endpoint("/generate"), prompt_body(prompt)));
    const auto it = body.find("text");
    if (it == body.end() || !it->is_string()) {
        throw corespace::lexis_error(
            corespace::error_kind::malformed_response,
            "generation response has no text member"
        );
    }
    return it->get<std::string>();
}

generation_result backend_client::generate_json(const std::string& prompt) {
    return post_generation("/generate-json", prompt);
}

generation_result backend_client::generate_basic(const std::string& prompt) {
    return post_generation("/generate-basic-info", prompt);
}

std::string backend_client::start_task(const std::string& prompt) {
    const auto body = parse_body(
        post_json(endpoint("/generate-json-progressive"), prompt_body(prompt))
    );
    const auto it = body.find("taskId");
    if (it == body.end() || !it->is_string() || it->empty()) {
        throw corespace::lexis_error(
            corespace::error_kind::malformed_response,
            "task start response has no taskId"
        );
    }
    corespace::logger()->info("generation task {} started", it->get<std::string>());
    return it->get<std::string>();
}

task_poll_response backend_client::task_status(const std::string& task_id) {
    corespace::http_request request;
    request.url = endpoint("/task/" + task_id);
    request.retry = false;
    const auto response = link.send(request);

    task_poll_response result;
    result.http_status = static_cast<long>(response.status_code);
    if (!response.ok()) {
        result.message = status_error(response).what();
        return result;
    }
    result.task = decode_task(task_id, parse_body(response));
    return result;
}

generation_result backend_client::stream_additional(
    const std::string& prompt, const event_sink& on_event,
    const std::stop_token stop
) {
    return stream_generation(
        "/generate-additional-stream", prompt, on_event, stop
    );
}

generation_result backend_client::stream_suggestions(
    const std::string& prompt, const event_sink& on_event,
    const std::stop_token stop
) {
    return stream_generation(
        "/generate-suggestions-stream", prompt, on_event, stop
    );
}

generation_result backend_client::stream_generation(
    const std::string_view path, const std::string& prompt,
    const event_sink& on_event, const std::stop_token stop
) {
    using corespace::error_kind;
    using corespace::lexis_error;

    sse_parser parser;
    std::optional<generation_result> result;
    std::optional<std::string> failure;
    std::exception_ptr sink_error;
    std::string head;

    // runs inside the libcurl callback: nothing may escape it
    const auto deliver = [&](std::vector<stream_event> events) {
        for (auto& event : events) {
            if (auto* complete = std::get_if<complete_event>(&event)) {
                result = generation_result { complete->data, complete->tokens_used };
            } else if (auto* error = std::get_if<error_event>(&event)) {
                failure = error->message;
            }
            if (on_event) {
                on_event(event);
            }
        }
    };

    corespace::http_request request;
    request.method = corespace::http_method::post;
    request.url = endpoint(path);
    request.body = prompt_body(prompt);
    request.accept = "text/event-stream";

    const auto response = link.stream(
        request, [&](const std::string_view bytes) {
            if (stop.stop_requested()) {
                return false;
            }
            if (head.size() < error_body_limit) {
                head.append(bytes.substr(0, error_body_limit - head.size()));
            }
            try {
                deliver(parser.feed(bytes));
            } catch (...) {
                // rethrown below, after curl has unwound
                sink_error = std::current_exception();
                return false;
            }
            return true;
        }
    );

    if (sink_error) {
        std::rethrow_exception(sink_error);
    }
    if (stop.stop_requested()) {
        throw lexis_error(error_kind::cancelled, "stream cancelled");
    }
    if (!response.ok()) {
        corespace::http_response failed = response;
        failed.text = head;
        throw status_error(failed);
    }
    deliver(parser.finish());
    if (parser.skipped_frames() > 0) {
        corespace::logger()->warn(
            "{}: {} malformed frames skipped", path, parser.skipped_frames()
        );
    }
    if (failure) {
        throw lexis_error(error_kind::remote_failure, *failure);
    }
    if (!result) {
        throw lexis_error(
            error_kind::malformed_response, "stream ended without a result"
        );
    }
    return std::move(*result);
}

std::string backend_client::generate_usage_hint(
    const std::string& lemma, const std::string& query,
    const std::string& native_lang
) noexcept {
    try {
        const nlohmann::json payload { { "lemma", lemma },
                                       { "japaneseQuery", query },
                                       { "nativeLanguage", native_lang } };
        const auto body = parse_body(
            post_json(endpoint("/generate-usage-hint"), payload.dump())
        );
        const auto data = body.value("data", nlohmann::json::object());
        if (data.is_object()) {
            return data.value("usageHint", std::string());
        }
        return {};
    } catch (const std::exception& e) {
        corespace::logger()->error("usage hint for '{}' failed: {}", lemma, e.what());
        return {};
    }
}

translation backend_client::translate(
    const std::string& text, const std::string& source_lang,
    const std::string& target_lang
) {
    check_translation_input(text);

    const nlohmann::json payload { { "text", text },
                                   { "sourceLang", source_lang },
                                   { "targetLang", target_lang } };
    const auto body
        = parse_body(post_json(opt.base_url + opt.translate_path, payload.dump()));
    if (!usable_translation(body)) {
        throw corespace::lexis_error(
            corespace::error_kind::malformed_response,
            "translation response has no text"
        );
    }
    auto result = body.get<translation>();
    if (result.original_text.empty()) {
        result.original_text = text;
    }
    return result;
}

bool backend_client::configured() noexcept {
    try {
        corespace::http_request request;
        request.url = endpoint("/status");
        request.retry = false;
        const auto response = link.send(request);
        if (!response.ok()) {
            corespace::logger()->warn(
                "status probe answered {}", response.status_code
            );
            return false;
        }
        const auto body = parse_body(response);
        return body.is_object() && body.value("configured", false);
    } catch (const std::exception& e) {
        corespace::logger()->info("backend not available: {}", e.what());
        return false;
    }
}
}
