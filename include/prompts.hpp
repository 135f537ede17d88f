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

#ifndef LEXIS_PROMPTS_HPP
#define LEXIS_PROMPTS_HPP

#include <map>
#include <string>
#include <string_view>

namespace lexispace {
/**
 * @brief English name of a language code ("en" -> "English"); unknown
 * codes are returned unchanged.
 */
std::string language_name(std::string_view code);

/// @return true if nouns of @p lang carry a grammatical gender.
bool has_gender(std::string_view lang);

/**
 * @brief Replace every `{{name}}` in @p tpl with `vars.at(name)`.
 *
 * Placeholders without a value are left as they are.
 */
std::string render_template(
    std::string_view tpl, const std::map<std::string, std::string>& vars
);

/// Full dictionary entry, used by the polled generation.
std::string dictionary_prompt(
    std::string_view word, std::string_view lang, std::string_view native
);

/// Headword and senses only, for the fast first stage.
std::string basic_info_prompt(
    std::string_view word, std::string_view lang, std::string_view native
);

/// Hint, metrics and examples, for the streamed second stage.
std::string additional_details_prompt(
    std::string_view word, std::string_view lang, std::string_view native
);

/// Candidate words in @p lang for a query written in @p native.
std::string suggestions_prompt(
    std::string_view query, std::string_view lang, std::string_view native
);
}
#endif // LEXIS_PROMPTS_HPP
