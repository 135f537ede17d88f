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

#include "content.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <unordered_set>

namespace lexispace {
namespace {
    template <typename T>
    T member_or(const nlohmann::json& j, const char* name, T fallback) {
        const auto it = j.find(name);
        if (it == j.end() || it->is_null()) {
            return fallback;
        }
        return it->get<T>();
    }

    std::vector<std::string> string_list(
        const nlohmann::json& j, const char* name
    ) {
        const auto it = j.find(name);
        if (it == j.end() || it->is_null()) {
            return {};
        }
        if (it->is_string()) {
            return { it->get<std::string>() };
        }
        return it->get<std::vector<std::string>>();
    }

    bool non_empty_string(const nlohmann::json& j, const char* name) {
        const auto it = j.find(name);
        return it != j.end() && it->is_string()
            && !it->get_ref<const std::string&>().empty();
    }
}

void to_json(nlohmann::json& j, const word_detail& detail) {
    j = nlohmann::json::object();
    j["headword"] = { { "lemma", detail.head.lemma },
                      { "lang", detail.head.lang },
                      { "pos", detail.head.pos } };
    if (!detail.head.gender.empty()) {
        j["headword"]["gender"] = detail.head.gender;
    }
    j["senses"] = nlohmann::json::array();
    for (const auto& s : detail.senses) {
        j["senses"].push_back({ { "id", s.id }, { "glossShort", s.gloss_short } });
    }
    j["examples"] = nlohmann::json::array();
    for (const auto& e : detail.examples) {
        j["examples"].push_back(
            { { "textSrc", e.text_src }, { "textDst", e.text_dst } }
        );
    }
    j["collocations"] = nlohmann::json::array();
    for (const auto& phrase : detail.collocations) {
        j["collocations"].push_back({ { "phrase", phrase } });
    }
    if (detail.hint) {
        j["hint"] = { { "text", *detail.hint } };
    }
    if (detail.metrics) {
        j["metrics"] = { { "frequency", detail.metrics->frequency },
                         { "difficulty", detail.metrics->difficulty },
                         { "nuance", detail.metrics->nuance } };
    }
}

void from_json(const nlohmann::json& j, word_detail& detail) {
    const auto& head = j.at("headword");
    detail.head.lemma = head.at("lemma").get<std::string>();
    detail.head.lang = member_or<std::string>(head, "lang", "");
    detail.head.pos = string_list(head, "pos");
    detail.head.gender = member_or<std::string>(head, "gender", "");

    detail.senses.clear();
    for (const auto& s : j.value("senses", nlohmann::json::array())) {
        detail.senses.push_back(
            { member_or<std::string>(s, "id", ""),
              member_or<std::string>(s, "glossShort", "") }
        );
    }
    detail.examples.clear();
    for (const auto& e : j.value("examples", nlohmann::json::array())) {
        detail.examples.push_back(
            { member_or<std::string>(e, "textSrc", ""),
              member_or<std::string>(e, "textDst", "") }
        );
    }
    detail.collocations.clear();
    for (const auto& c : j.value("collocations", nlohmann::json::array())) {
        detail.collocations.push_back(
            c.is_string() ? c.get<std::string>()
                          : member_or<std::string>(c, "phrase", "")
        );
    }
    detail.hint.reset();
    if (const auto it = j.find("hint"); it != j.end() && it->is_object()) {
        detail.hint = member_or<std::string>(*it, "text", "");
    }
    detail.metrics.reset();
    if (const auto it = j.find("metrics"); it != j.end() && it->is_object()) {
        detail.metrics = word_metrics {
            member_or<int>(*it, "frequency", 0),
            member_or<int>(*it, "difficulty", 0),
            member_or<int>(*it, "nuance", 50),
        };
    }
}

void to_json(nlohmann::json& j, const suggestion_item& item) {
    j = { { "lemma", item.lemma },
          { "pos", item.pos },
          { "shortSense", item.short_sense },
          { "confidence", item.confidence },
          { "usageHint", item.usage_hint } };
    if (item.nuance) {
        j["nuance"] = *item.nuance;
    }
    if (!item.gender.empty()) {
        j["gender"] = item.gender;
    }
}

void from_json(const nlohmann::json& j, suggestion_item& item) {
    item.lemma = j.at("lemma").get<std::string>();
    item.pos = string_list(j, "pos");
    item.short_sense = string_list(j, "shortSense");
    if (item.short_sense.empty()) {
        item.short_sense = string_list(j, "shortSenseJa");
    }
    item.confidence = member_or<double>(j, "confidence", 0.0);
    item.usage_hint = member_or<std::string>(j, "usageHint", "");
    item.nuance.reset();
    if (const auto it = j.find("nuance"); it != j.end() && it->is_number()) {
        item.nuance = it->get<int>();
    }
    item.gender = member_or<std::string>(j, "gender", "");
}

void to_json(nlohmann::json& j, const translation& result) {
    j = { { "originalText", result.original_text },
          { "translatedText", result.translated_text },
          { "sourceLang", result.source_lang },
          { "targetLang", result.target_lang } };
}

void from_json(const nlohmann::json& j, translation& result) {
    result.original_text = member_or<std::string>(j, "originalText", "");
    result.translated_text = j.at("translatedText").get<std::string>();
    result.source_lang = member_or<std::string>(j, "sourceLang", "");
    result.target_lang = member_or<std::string>(j, "targetLang", "");
}

bool usable_word_detail(const nlohmann::json& value) noexcept {
    if (!value.is_object()) {
        return false;
    }
    const auto it = value.find("headword");
    return it != value.end() && it->is_object() && non_empty_string(*it, "lemma");
}

bool usable_suggestions(const nlohmann::json& value) noexcept {
    return value.is_array() && !value.empty();
}

bool usable_translation(const nlohmann::json& value) noexcept {
    return value.is_object() && non_empty_string(value, "translatedText");
}

nlohmann::json merge_suggestions(
    const nlohmann::json& primary, const nlohmann::json& secondary,
    const std::size_t limit
) {
    nlohmann::json result = nlohmann::json::array();
    std::unordered_set<std::string> seen;
    for (const auto* list : { &primary, &secondary }) {
        if (!list->is_array()) {
            continue;
        }
        for (const auto& item : *list) {
            if (result.size() >= limit) {
                return result;
            }
            if (!item.is_object() || !non_empty_string(item, "lemma")) {
                continue;
            }
            if (seen.insert(item["lemma"].get<std::string>()).second) {
                result.push_back(item);
            }
        }
    }
    return result;
}

nlohmann::json attach_usage_hint(
    const nlohmann::json& list, const std::string& lemma,
    const std::string& hint
) {
    nlohmann::json updated = list;
    if (!updated.is_array()) {
        return updated;
    }
    for (auto& item : updated) {
        if (item.is_object() && item.value("lemma", std::string()) == lemma) {
            item["usageHint"] = hint;
        }
    }
    return updated;
}

void check_translation_input(const std::string_view text) {
    using corespace::error_kind;
    if (corespace::trim(text).empty()) {
        throw corespace::lexis_error(
            error_kind::invalid_input, "nothing to translate"
        );
    }
    const std::size_t length = corespace::utf8_length(text);
    if (length > max_translation_length) {
        throw corespace::lexis_error(
            error_kind::invalid_input,
            "text too long to translate: " + std::to_string(length) + " of "
                + std::to_string(max_translation_length) + " characters"
        );
    }
}
}
