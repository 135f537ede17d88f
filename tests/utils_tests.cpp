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

#include "utils.hpp"

#include <gtest/gtest.h>

using namespace corespace;

TEST(NormalizeQuery, TrimsLowercasesAndCollapses) {
    EXPECT_EQ(normalize_query("  Hello   World \t"), "hello world");
    EXPECT_EQ(normalize_query("GATO"), "gato");
    EXPECT_EQ(normalize_query(""), "");
    EXPECT_EQ(normalize_query(" \n\t "), "");
}

TEST(NormalizeQuery, IdeographicSpaceIsPlainSpace) {
    EXPECT_EQ(normalize_query("　食べる　　もの"),
              "食べる もの");
}

TEST(NormalizeQuery, NonAsciiBytesKept) {
    EXPECT_EQ(normalize_query("ÉTÉ"), "ÉtÉ");
}

TEST(Utf8Length, CountsCodePoints) {
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("こんにちは"), 5u);
    EXPECT_EQ(utf8_length("aé\U0001F600"), 3u);
}

TEST(Trim, AsciiWhitespace) {
    EXPECT_EQ(trim("  x y \r\n"), "x y");
    EXPECT_EQ(trim(""), "");
}

TEST(JoinStr, Separator) {
    const std::vector<std::string> parts { "a", "b", "c" };
    EXPECT_EQ(join_str(parts), "a, b, c");
    EXPECT_EQ(join_str(parts, "/"), "a/b/c");
    EXPECT_EQ(join_str({}), "");
}

TEST(HttpResponse, OkMeansTransportAndStatus) {
    http_response response;
    response.status_code = 204;
    EXPECT_TRUE(response.ok());
    response.status_code = 404;
    EXPECT_FALSE(response.ok());
    response.status_code = 200;
    response.error_code = CURLE_COULDNT_CONNECT;
    EXPECT_FALSE(response.ok());
}
