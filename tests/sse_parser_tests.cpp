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

#include <gtest/gtest.h>

using namespace lexispace;

namespace {
const std::string stream_text
    = "data: {\"type\":\"section\",\"section\":\"hint\",\"data\":{\"text\":\"h\"}}\n"
      "\n"
      "data: {\"type\":\"chunk\",\"text\":\"abc\"}\n"
      "data: {\"type\":\"complete\",\"data\":{\"ok\":true},\"tokensUsed\":12}\n";

std::vector<stream_event> parse_in_pieces(std::size_t piece) {
    sse_parser parser;
    std::vector<stream_event> events;
    for (std::size_t i = 0; i < stream_text.size(); i += piece) {
        auto more = parser.feed(std::string_view(stream_text).substr(i, piece));
        events.insert(events.end(), more.begin(), more.end());
    }
    auto rest = parser.finish();
    events.insert(events.end(), rest.begin(), rest.end());
    return events;
}
}

TEST(SseParser, DecodesEventKinds) {
    const auto events = parse_in_pieces(stream_text.size());
    ASSERT_EQ(events.size(), 3u);

    const auto& section = std::get<section_event>(events[0]);
    EXPECT_EQ(section.section, "hint");
    EXPECT_EQ(section.data["text"], "h");
    EXPECT_EQ(std::get<chunk_event>(events[1]).text, "abc");
    const auto& complete = std::get<complete_event>(events[2]);
    EXPECT_EQ(complete.data["ok"], true);
    EXPECT_EQ(complete.tokens_used, 12);
}

TEST(SseParser, ChunkBoundariesDoNotMatter) {
    const auto whole = parse_in_pieces(stream_text.size());
    for (std::size_t piece : { 1u, 2u, 3u, 7u, 16u, 61u }) {
        const auto split = parse_in_pieces(piece);
        ASSERT_EQ(split.size(), whole.size()) << "piece " << piece;
        for (std::size_t i = 0; i < whole.size(); ++i) {
            EXPECT_EQ(split[i].index(), whole[i].index()) << "piece " << piece;
        }
        EXPECT_EQ(std::get<complete_event>(split[2]).data["ok"], true);
    }
}

TEST(SseParser, CarriageReturnsAreStripped) {
    sse_parser parser;
    const auto events = parser.feed(
        "data: {\"type\":\"error\",\"message\":\"quota\"}\r\n\r\n"
    );
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<error_event>(events[0]).message, "quota");
    EXPECT_TRUE(parser.terminated());
}

TEST(SseParser, MalformedFrameIsSkipped) {
    sse_parser parser;
    auto events = parser.feed("data: {not json\n");
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(parser.skipped_frames(), 1u);

    events = parser.feed("data: {\"type\":\"chunk\",\"text\":\"x\"}\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(parser.closed());
}

TEST(SseParser, IgnoresNonDataLinesAndProgress) {
    sse_parser parser;
    const auto events = parser.feed(
        ": keep-alive\n"
        "event: message\n"
        "id: 4\n"
        "data: {\"type\":\"progress\",\"progress\":40}\n"
        "data: {\"type\":\"mystery\"}\n"
    );
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(parser.skipped_frames(), 0u);
}

TEST(SseParser, UntypedTextIsChunk) {
    sse_parser parser;
    const auto events = parser.feed("data: {\"text\":\"hola\"}\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<chunk_event>(events[0]).text, "hola");
}

TEST(SseParser, NothingAfterTerminalEvent) {
    sse_parser parser;
    const auto events = parser.feed(
        "data: {\"type\":\"complete\",\"data\":1}\n"
        "data: {\"type\":\"error\",\"message\":\"late\"}\n"
        "data: {\"type\":\"chunk\",\"text\":\"late\"}\n"
    );
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(is_terminal(events[0]));
    EXPECT_TRUE(parser.closed());
}

TEST(SseParser, DoneSentinelClosesWithoutEvent) {
    sse_parser parser;
    EXPECT_TRUE(parser.feed("data: [DONE]\n").empty());
    EXPECT_TRUE(parser.closed());
    EXPECT_FALSE(parser.terminated());
    EXPECT_TRUE(parser.feed("data: {\"text\":\"x\"}\n").empty());
}

TEST(SseParser, FinishDecodesUnterminatedLine) {
    sse_parser parser;
    EXPECT_TRUE(parser.feed("data: {\"type\":\"complete\",\"data\":[]}").empty());
    const auto events = parser.finish();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<complete_event>(events[0]));
}
