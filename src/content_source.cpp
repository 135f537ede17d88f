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

#include "content_source.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <fstream>

namespace lexispace {
static_dataset::static_dataset(
    nlohmann::json entries, std::string lang, const bool substring
)
    : lang(std::move(lang))
    , substring(substring) {
    if (!entries.is_object()) {
        throw corespace::lexis_error(
            corespace::error_kind::invalid_input,
            "dataset must be a JSON object"
        );
    }
    this->entries = nlohmann::json::object();
    for (auto& [key, value] : entries.items()) {
        this->entries[corespace::normalize_query(key)] = std::move(value);
    }
}

static_dataset static_dataset::load(
    const std::filesystem::path& path, std::string lang, const bool substring
) {
    std::ifstream in(path);
    if (!in) {
        throw corespace::lexis_error(
            corespace::error_kind::invalid_input,
            "cannot open dataset " + path.string()
        );
    }
    auto entries = nlohmann::json::parse(in, nullptr, false);
    if (entries.is_discarded()) {
        throw corespace::lexis_error(
            corespace::error_kind::malformed_response,
            "dataset " + path.string() + " is not valid JSON"
        );
    }
    return { std::move(entries), std::move(lang), substring };
}

std::optional<nlohmann::json> static_dataset::find(
    const std::string_view query, const std::string_view lang
) const {
    if (!this->lang.empty() && this->lang != lang) {
        return std::nullopt;
    }
    const std::string key = corespace::normalize_query(query);
    if (key.empty()) {
        return std::nullopt;
    }
    if (const auto it = entries.find(key); it != entries.end()) {
        return *it;
    }
    if (substring) {
        for (const auto& [name, value] : entries.items()) {
            if (name.find(key) != std::string::npos) {
                return value;
            }
        }
    }
    return std::nullopt;
}

std::size_t static_dataset::size() const noexcept { return entries.size(); }
}
