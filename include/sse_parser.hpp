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

#ifndef LEXIS_SSE_PARSER_HPP
#define LEXIS_SSE_PARSER_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lexispace {
/// A named section of a structured result became available.
struct section_event {
    std::string section;
    nlohmann::json data;
};

/// A piece of free text (plain-text generation streams).
struct chunk_event {
    std::string text;
};

/// The stream finished successfully with the full result.
struct complete_event {
    nlohmann::json data;
    long tokens_used = 0;
};

/// The stream finished with a generation failure.
struct error_event {
    std::string message;
};

using stream_event
    = std::variant<section_event, chunk_event, complete_event, error_event>;

/**
 * @brief Whether @p event ends a stream (`complete` or `error`).
 */
bool is_terminal(const stream_event& event) noexcept;

/**
 * @class sse_parser
 * @brief Incremental decoder for `data: <json>` Server-Sent Event lines.
 *
 * Bytes are fed as they arrive from the network. A line is decoded only once
 * its terminating newline has been seen, so chunk boundaries never need to
 * coincide with line boundaries; an optional `\r` before the newline is
 * dropped.
 *
 * Decoding rules:
 *  - Only lines tagged `data:` carry payloads; `event:`, `id:`, comments
 *    and blank lines are ignored.
 *  - The payload `[DONE]` closes the stream and is not emitted.
 *  - JSON objects are mapped by their `type` member: `section`, `chunk`,
 *    `complete`, `error`. An untyped object with a string `text` member is a
 *    chunk. `progress` and unknown types are skipped.
 *  - A payload that is not valid JSON is logged and skipped; the stream
 *    continues.
 *  - After the first terminal event (or `[DONE]`) every further line is
 *    ignored, so a stream yields at most one terminal event.
 *
 * One parser instance serves exactly one stream.
 */
class sse_parser {
public:
    /**
     * @brief Consume the next network chunk.
     * @return Events completed by this chunk, in stream order.
     */
    std::vector<stream_event> feed(std::string_view bytes);

    /**
     * @brief Signal end of input; decodes a trailing line that lacks its
     * newline.
     */
    std::vector<stream_event> finish();

    /// @return true once a terminal event or `[DONE]` was seen.
    [[nodiscard]] bool closed() const noexcept;
    /// @return true once a terminal event was emitted.
    [[nodiscard]] bool terminated() const noexcept;
    /// @return Number of payloads dropped because they were not valid JSON.
    [[nodiscard]] std::size_t skipped_frames() const noexcept;

private:
    void consume_line(std::string_view line, std::vector<stream_event>& out);
    std::optional<stream_event> decode(const nlohmann::json& payload) const;

    std::string pending;
    bool done = false;
    bool terminal_seen = false;
    std::size_t skipped = 0;
};
}
#endif // LEXIS_SSE_PARSER_HPP
