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

#include "suggestions.hpp"
#include "content.hpp"
#include "logging.hpp"
#include "prompts.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace lexispace {
remote_fn streaming_suggestions_remote(backend_client& client) {
    return [&client](
               const chain_request& request, const progress_callback& report,
               const std::stop_token stop
           ) {
        nlohmann::json items = nlohmann::json::array();
        const auto result = client.stream_suggestions(
            suggestions_prompt(request.query, request.lang, request.native_lang),
            [&](const stream_event& event) {
                const auto* section = std::get_if<section_event>(&event);
                if (!section || !section->data.is_object()) {
                    return;
                }
                items.push_back(section->data);
                if (report) {
                    const auto count = static_cast<int>(items.size());
                    report(
                        std::min(99, count * 100 / int(max_suggestions)), items
                    );
                }
            },
            stop
        );
        return merge_suggestions(result.data, items);
    };
}

progress_callback forward_new_items(item_sink on_item) {
    auto delivered = std::make_shared<std::unordered_set<std::string>>();
    return [on_item = std::move(on_item),
            delivered](int, const nlohmann::json& partial) {
        if (!on_item || !partial.is_array()) {
            return;
        }
        for (const auto& item : partial) {
            const auto lemma = item.is_object() ? item.find("lemma") : item.end();
            std::string identity = lemma != item.end() && lemma->is_string()
                ? lemma->get<std::string>()
                : item.dump();
            if (delivered->insert(std::move(identity)).second) {
                on_item(item);
            }
        }
    };
}

enrich_fn usage_hint_enricher(
    backend_client& client, result_cache& cache, const std::size_t parallelism
) {
    return [&client, &cache, parallelism](
               const std::string& key, const chain_request& request,
               const nlohmann::json& value, const std::stop_token stop
           ) {
        if (!value.is_array()) {
            return;
        }
        std::vector<std::string> lemmas;
        for (const auto& item : value) {
            if (!item.is_object()) {
                continue;
            }
            const auto lemma = item.value("lemma", std::string());
            if (!lemma.empty() && item.value("usageHint", std::string()).empty()) {
                lemmas.push_back(lemma);
            }
        }

        const std::size_t width = std::max<std::size_t>(1, parallelism);
        for (std::size_t begin = 0; begin < lemmas.size(); begin += width) {
            if (stop.stop_requested()) {
                corespace::logger()->debug("usage hints for '{}' stopped", key);
                return;
            }
            const std::size_t end = std::min(lemmas.size(), begin + width);
            std::vector<std::pair<std::string, std::future<std::string>>> batch;
            for (std::size_t i = begin; i < end; ++i) {
                batch.emplace_back(
                    lemmas[i],
                    std::async(std::launch::async, [&client, &request,
                                                    lemma = lemmas[i]] {
                        return client.generate_usage_hint(
                            lemma, request.query, request.native_lang
                        );
                    })
                );
            }
            for (auto& entry : batch) {
                const std::string& lemma = entry.first;
                const std::string hint = entry.second.get();
                if (hint.empty()) {
                    continue;
                }
                cache.update(
                    key, [&](const std::optional<nlohmann::json>& current) {
                        return attach_usage_hint(
                            current.value_or(value), lemma, hint
                        );
                    }
                );
            }
        }
        corespace::logger()->debug(
            "usage hints for '{}' finished ({} lemmas)", key, lemmas.size()
        );
    };
}
}
