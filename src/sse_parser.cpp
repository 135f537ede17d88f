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

#include "sse_parser.hpp"
#include "logging.hpp"

namespace lexispace {
namespace {
    constexpr std::string_view data_tag = "data:";
    constexpr std::string_view done_sentinel = "[DONE]";

    std::string string_member(
        const nlohmann::json& payload,
        const std::initializer_list<const char*> names
    ) {
        for (const char* name : names) {
            const auto it = payload.find(name);
            if (it != payload.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
        return {};
    }
}

bool is_terminal(const stream_event& event) noexcept {
    return std::holds_alternative<complete_event>(event)
        || std::holds_alternative<error_event>(event);
}

std::vector<stream_event> sse_parser::feed(const std::string_view bytes) {
    std::vector<stream_event> out;
    pending.append(bytes);

    std::size_t start = 0;
    for (std::size_t nl = pending.find('\n', start); nl != std::string::npos;
         nl = pending.find('\n', start)) {
        std::string_view line(pending.data() + start, nl - start);
        consume_line(line, out);
        start = nl + 1;
    }
    pending.erase(0, start);
    return out;
}

std::vector<stream_event> sse_parser::finish() {
    std::vector<stream_event> out;
    if (!pending.empty()) {
        const std::string line = std::move(pending);
        pending.clear();
        consume_line(line, out);
    }
    return out;
}

bool sse_parser::closed() const noexcept { return done; }

bool sse_parser::terminated() const noexcept { return terminal_seen; }

std::size_t sse_parser::skipped_frames() const noexcept { return skipped; }

void sse_parser::consume_line(
    std::string_view line, std::vector<stream_event>& out
) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (done || !line.starts_with(data_tag)) {
        return;
    }
    line.remove_prefix(data_tag.size());
    if (line.starts_with(' ')) {
        line.remove_prefix(1);
    }
    if (line == done_sentinel) {
        done = true;
        return;
    }

    nlohmann::json payload = nlohmann::json::parse(line, nullptr, false);
    if (payload.is_discarded()) {
        ++skipped;
        corespace::logger()->warn(
            "skipping malformed SSE frame ({} bytes)", line.size()
        );
        return;
    }

    auto event = decode(payload);
    if (!event) {
        return;
    }
    if (is_terminal(*event)) {
        terminal_seen = true;
        done = true;
    }
    out.push_back(std::move(*event));
}

std::optional<stream_event>
sse_parser::decode(const nlohmann::json& payload) const {
    if (!payload.is_object()) {
        corespace::logger()->debug("ignoring non-object SSE payload");
        return std::nullopt;
    }
    const std::string type = string_member(payload, { "type" });
    if (type == "section") {
        return section_event {
            string_member(payload, { "section", "name" }),
            payload.value("data", nlohmann::json())
        };
    }
    if (type == "chunk" || (type.empty() && payload.contains("text"))) {
        return chunk_event { string_member(payload, { "text", "content" }) };
    }
    if (type == "complete") {
        complete_event complete { payload.value("data", nlohmann::json()) };
        if (const auto it = payload.find("tokensUsed");
            it != payload.end() && it->is_number_integer()) {
            complete.tokens_used = it->get<long>();
        }
        return complete;
    }
    if (type == "error") {
        std::string message = string_member(payload, { "message", "error" });
        if (message.empty()) {
            message = "stream reported an error";
        }
        return error_event { std::move(message) };
    }
    corespace::logger()->debug("ignoring SSE payload of type '{}'", type);
    return std::nullopt;
}
}
