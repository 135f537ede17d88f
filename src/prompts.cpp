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

#include "prompts.hpp"

#include <array>

namespace lexispace {
namespace {
    constexpr std::array<std::pair<std::string_view, std::string_view>, 14>
        language_names { {
            { "en", "English" },
            { "ja", "Japanese" },
            { "es", "Spanish" },
            { "pt", "Portuguese" },
            { "fr", "French" },
            { "de", "German" },
            { "it", "Italian" },
            { "zh", "Chinese" },
            { "ko", "Korean" },
            { "ru", "Russian" },
            { "ar", "Arabic" },
            { "hi", "Hindi" },
            { "vi", "Vietnamese" },
            { "id", "Indonesian" },
        } };

    constexpr std::array<std::string_view, 8> gendered {
        "es", "pt", "fr", "de", "it", "ru", "ar", "hi"
    };

    constexpr std::string_view nuance_scale
        = "nuance is a formality score (0=very casual/slang, 30=casual, "
          "50=neutral, 70=formal, 100=very formal/academic)";

    constexpr std::string_view dictionary_template = R"(Create a dictionary entry for the {{targetLanguageName}} word "{{word}}" for a {{nativeLanguageName}} speaker, as JSON:

{
  "headword": {"lemma": "{{word}}", "lang": "{{targetLanguage}}", "pos": ["part of speech"]{{genderField}}},
  "senses": [{"id": "1", "glossShort": "short meaning in {{nativeLanguageName}}"}],
  "hint": {"text": "usage note in {{nativeLanguageName}}"},
  "metrics": {"frequency": 0-100, "difficulty": 0-100, "nuance": 0-100},
  "examples": [{"textSrc": "sentence in {{targetLanguageName}}", "textDst": "translation in {{nativeLanguageName}}"}],
  "collocations": [{"phrase": "common phrase"}]
}

Requirements:
- 2-4 senses ordered by frequency
- 3 natural example sentences
- {{nuanceScale}})";

    constexpr std::string_view basic_template = R"(For the {{targetLanguageName}} word "{{word}}", return only the headword and senses for a {{nativeLanguageName}} speaker, as JSON:

{
  "headword": {"lemma": "{{word}}", "lang": "{{targetLanguage}}", "pos": ["part of speech"]{{genderField}}},
  "senses": [{"id": "1", "glossShort": "short meaning in {{nativeLanguageName}}"}]
}

Requirements:
- 2-4 senses ordered by frequency
- keep every glossShort under 20 characters)";

    constexpr std::string_view additional_template = R"(For the {{targetLanguageName}} word "{{word}}", generate the remaining details for a {{nativeLanguageName}} speaker, as JSON with exactly these sections in this order:

{
  "hint": {"text": "usage note in {{nativeLanguageName}}"},
  "metrics": {"frequency": 0-100, "difficulty": 0-100, "nuance": 0-100},
  "examples": [{"textSrc": "sentence in {{targetLanguageName}}", "textDst": "translation in {{nativeLanguageName}}"}]
}

Requirements:
- do not repeat the headword or senses
- 3 natural example sentences
- {{nuanceScale}})";

    constexpr std::string_view suggestions_template = R"(Generate 3-5 {{targetLanguageName}} words corresponding to {{nativeLanguageName}} "{{query}}" in the following JSON array structure:

[
  {"lemma": "word1", "pos": ["part of speech"], "shortSense": ["meaning1", "meaning2", "meaning3"], "confidence": relevance score 0-1, "nuance": nuance score 0-100{{genderField}}}
]

Requirements:
- Must return at least 3 candidates
- shortSense holds 3 meanings in {{nativeLanguageName}}, each within 10 characters, ordered by frequency of use
- Sort by relevance; the most relevant has confidence 1.0
- {{nuanceScale}})";

    std::map<std::string, std::string> base_vars(
        const std::string_view lang, const std::string_view native
    ) {
        return {
            { "targetLanguage", std::string(lang) },
            { "targetLanguageName", language_name(lang) },
            { "nativeLanguageName", language_name(native) },
            { "genderField",
              has_gender(lang) ? R"x(, "gender": "m/f/n (nouns only)")x" : "" },
            { "nuanceScale", std::string(nuance_scale) },
        };
    }
}

std::string language_name(const std::string_view code) {
    for (const auto& [key, name] : language_names) {
        if (key == code) {
            return std::string(name);
        }
    }
    return std::string(code);
}

bool has_gender(const std::string_view lang) {
    for (const auto code : gendered) {
        if (code == lang) {
            return true;
        }
    }
    return false;
}

std::string render_template(
    const std::string_view tpl, const std::map<std::string, std::string>& vars
) {
    std::string out;
    out.reserve(tpl.size());
    std::size_t pos = 0;
    while (pos < tpl.size()) {
        const std::size_t open = tpl.find("{{", pos);
        if (open == std::string_view::npos) {
            break;
        }
        const std::size_t close = tpl.find("}}", open + 2);
        if (close == std::string_view::npos) {
            break;
        }
        out.append(tpl.substr(pos, open - pos));
        const std::string name(tpl.substr(open + 2, close - open - 2));
        const auto it = vars.find(name);
        if (it != vars.end()) {
            out.append(it->second);
        } else {
            out.append(tpl.substr(open, close + 2 - open));
        }
        pos = close + 2;
    }
    out.append(tpl.substr(pos));
    return out;
}

std::string dictionary_prompt(
    const std::string_view word, const std::string_view lang,
    const std::string_view native
) {
    auto vars = base_vars(lang, native);
    vars["word"] = std::string(word);
    return render_template(dictionary_template, vars);
}

std::string basic_info_prompt(
    const std::string_view word, const std::string_view lang,
    const std::string_view native
) {
    auto vars = base_vars(lang, native);
    vars["word"] = std::string(word);
    return render_template(basic_template, vars);
}

std::string additional_details_prompt(
    const std::string_view word, const std::string_view lang,
    const std::string_view native
) {
    auto vars = base_vars(lang, native);
    vars["word"] = std::string(word);
    return render_template(additional_template, vars);
}

std::string suggestions_prompt(
    const std::string_view query, const std::string_view lang,
    const std::string_view native
) {
    auto vars = base_vars(lang, native);
    vars["query"] = std::string(query);
    return render_template(suggestions_template, vars);
}
}
