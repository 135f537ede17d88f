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

#include <cctype>

namespace corespace {
namespace {
    constexpr std::string_view ideographic_space = "\xE3\x80\x80";

    bool is_space(const char c) noexcept {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

network_metrics::network_metrics() {
    for (auto& status : statuses) {
        status.store(0, std::memory_order_relaxed);
    }
}

bool http_response::ok() const noexcept {
    return error_code == CURLE_OK && status_code >= 200 && status_code < 300;
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string normalize_query(const std::string_view text) {
    std::string spaced;
    spaced.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        if (text.substr(i, ideographic_space.size()) == ideographic_space) {
            spaced.push_back(' ');
            i += ideographic_space.size();
            continue;
        }
        spaced.push_back(text[i]);
        ++i;
    }

    std::string out;
    out.reserve(spaced.size());
    bool in_space = false;
    for (const char c : trim(spaced)) {
        if (is_space(c)) {
            in_space = true;
            continue;
        }
        if (in_space) {
            out.push_back(' ');
            in_space = false;
        }
        const auto uc = static_cast<unsigned char>(c);
        out.push_back(uc < 0x80 ? static_cast<char>(std::tolower(uc)) : c);
    }
    return out;
}

std::size_t utf8_length(const std::string_view text) noexcept {
    std::size_t count = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string
join_str(std::span<const std::string> parts, const std::string_view separator) {
    if (parts.empty()) {
        return {};
    }
    auto it = parts.begin();
    std::string result = *it;
    for (++it; it != parts.end(); ++it) {
        result.append(separator);
        result.append(*it);
    }
    return result;
}
}
