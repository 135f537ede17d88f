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

#ifndef LEXIS_SUGGESTIONS_HPP
#define LEXIS_SUGGESTIONS_HPP

#include "backend_client.hpp"
#include "fallback_chain.hpp"
#include "result_cache.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>

namespace lexispace {
/// Receives each suggestion item once, in arrival order.
using item_sink = std::function<void(const nlohmann::json&)>;

/**
 * @brief Remote generation of a suggestion list over the streaming
 *        endpoint.
 *
 * Every streamed item is reported as progress together with the list
 * collected so far, so that subscribers joining later replay the items
 * already delivered. Progress is `items * 100 / max_suggestions`, held
 * below 100 until the stream completes. The returned list is the complete
 * payload merged with the streamed items.
 */
remote_fn streaming_suggestions_remote(backend_client& client);

/**
 * @brief Turn a progress callback into an item sink.
 *
 * Items are told apart by lemma (the whole item when it has none). Every
 * item of a reported list not forwarded before is passed to @p on_item,
 * wherever it sits in the list.
 */
progress_callback forward_new_items(item_sink on_item);

/**
 * @brief Background usage hints for a freshly generated suggestion list.
 *
 * One `generate_usage_hint` call per lemma that has no hint yet, run in
 * parallel with at most @p parallelism in flight. Each non-empty hint is
 * attached to the cached list through `result_cache::update`.
 */
enrich_fn usage_hint_enricher(
    backend_client& client, result_cache& cache, std::size_t parallelism = 4
);
}
#endif // LEXIS_SUGGESTIONS_HPP
