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

#ifndef LEXIS_CONTENT_SOURCE_HPP
#define LEXIS_CONTENT_SOURCE_HPP

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lexispace {
/**
 * @class content_source
 * @brief Offline lookup of ready-made results.
 */
class content_source {
public:
    virtual ~content_source() = default;

    /**
     * @return The result for @p query in @p lang, or nullopt.
     */
    virtual std::optional<nlohmann::json>
    find(std::string_view query, std::string_view lang) const = 0;
};

/**
 * @class static_dataset
 * @brief Bundled dataset: a JSON object mapping queries to results.
 *
 * Keys are matched after `normalize_query`. With `substring` enabled, a
 * query without an exact entry matches the first key (in key order) that
 * contains it. A dataset bound to a language answers only for that
 * language; an empty language answers for all.
 */
class static_dataset final : public content_source {
public:
    /**
     * @throws lexis_error(invalid_input) if @p entries is not an object.
     */
    static_dataset(
        nlohmann::json entries, std::string lang = {}, bool substring = false
    );

    /**
     * @brief Load a dataset from a JSON file.
     * @throws lexis_error(invalid_input) if the file cannot be read,
     *         lexis_error(malformed_response) if it is not valid JSON.
     */
    static static_dataset load(
        const std::filesystem::path& path, std::string lang = {},
        bool substring = false
    );

    std::optional<nlohmann::json>
    find(std::string_view query, std::string_view lang) const override;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    nlohmann::json entries;
    std::string lang;
    bool substring;
};
}
#endif // LEXIS_CONTENT_SOURCE_HPP
