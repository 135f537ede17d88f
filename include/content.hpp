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

#ifndef LEXIS_CONTENT_HPP
#define LEXIS_CONTENT_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexispace {
/// Longest text accepted for translation.
inline constexpr std::size_t max_translation_length = 4000;
/// Longest suggestion list kept after merging.
inline constexpr std::size_t max_suggestions = 10;

struct headword {
    std::string lemma;
    std::string lang;
    std::vector<std::string> pos;
    std::string gender;
};

struct sense {
    std::string id;
    std::string gloss_short;
};

struct example {
    std::string text_src;
    std::string text_dst;
};

struct word_metrics {
    int frequency = 0;
    int difficulty = 0;
    int nuance = 50;
};

/**
 * @struct word_detail
 * @brief Dictionary entry as produced by the generator.
 *
 * Wire names are camelCase (`glossShort`, `textSrc`, ...). Every section
 * except `headword` may be missing from a partial result.
 */
struct word_detail {
    headword head;
    std::vector<sense> senses;
    std::vector<example> examples;
    std::vector<std::string> collocations;
    std::optional<std::string> hint;
    std::optional<word_metrics> metrics;
};

/**
 * @struct suggestion_item
 * @brief One candidate word proposed for a native-language query.
 */
struct suggestion_item {
    std::string lemma;
    std::vector<std::string> pos;
    std::vector<std::string> short_sense;
    double confidence = 0.0;
    std::string usage_hint;
    std::optional<int> nuance;
    std::string gender;
};

struct translation {
    std::string original_text;
    std::string translated_text;
    std::string source_lang;
    std::string target_lang;
};

void to_json(nlohmann::json& j, const word_detail& detail);
void from_json(const nlohmann::json& j, word_detail& detail);
void to_json(nlohmann::json& j, const suggestion_item& item);
void from_json(const nlohmann::json& j, suggestion_item& item);
void to_json(nlohmann::json& j, const translation& result);
void from_json(const nlohmann::json& j, translation& result);

/**
 * @brief A dictionary result is usable once `headword.lemma` is non-empty.
 */
bool usable_word_detail(const nlohmann::json& value) noexcept;

/**
 * @brief A suggestion result is usable when it is a non-empty array.
 */
bool usable_suggestions(const nlohmann::json& value) noexcept;

/**
 * @brief A translation result is usable once `translatedText` is non-empty.
 */
bool usable_translation(const nlohmann::json& value) noexcept;

/**
 * @brief Reject text that cannot be sent for translation.
 * @throws lexis_error(invalid_input) if @p text is blank or longer than
 *         `max_translation_length` code points.
 */
void check_translation_input(std::string_view text);

/**
 * @brief Merge two suggestion lists by lemma.
 *
 * Items of @p primary come first; an item of @p secondary is appended only
 * if its lemma has not been seen. The result holds at most @p limit items.
 * Non-array inputs are treated as empty.
 */
nlohmann::json merge_suggestions(
    const nlohmann::json& primary, const nlohmann::json& secondary,
    std::size_t limit = max_suggestions
);

/**
 * @brief Copy of @p list with `usageHint` set on the item whose lemma is
 * @p lemma. Other items are untouched; an unknown lemma leaves the list
 * unchanged.
 */
nlohmann::json attach_usage_hint(
    const nlohmann::json& list, const std::string& lemma,
    const std::string& hint
);
}
#endif // LEXIS_CONTENT_HPP
