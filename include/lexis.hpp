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

#ifndef LEXIS_LEXIS_HPP
#define LEXIS_LEXIS_HPP

#include "backend_client.hpp"
#include "config.hpp"
#include "content_source.hpp"
#include "fallback_chain.hpp"
#include "http_client.hpp"
#include "request_deduplicator.hpp"
#include "result_cache.hpp"
#include "suggestions.hpp"
#include "task_poller.hpp"
#include "two_stage_orchestrator.hpp"

#include <memory>
#include <stop_token>
#include <string>

namespace lexispace {
/**
 * @class lexis
 * @brief Entry point: word details, suggestions and translations.
 *
 * Owns one transport, one backend client, one result cache and one
 * deduplicator shared by three fallback chains:
 *  - word details: cache, local dictionary, two-stage remote generation,
 *    static fallback dataset;
 *  - suggestions: cache, streamed remote generation with usage hints
 *    attached in the background;
 *  - translations: cache, remote translation.
 *
 * Every call returns the chain outcome; only invalid input and
 * cancellation are thrown.
 */
class lexis {
public:
    /**
     * @brief Build every component from @p opt with a libcurl transport.
     * @throws lexis_error(invalid_input) on an unknown log level or an
     *         unreadable dataset.
     */
    explicit lexis(lexis_options opt = {});

    /// Same as above, over a caller-provided transport.
    lexis(lexis_options opt, std::unique_ptr<corespace::transport> link);

    lexis(const lexis&) = delete;
    lexis& operator=(const lexis&) = delete;

    chain_outcome word_detail(
        const std::string& query, const std::string& lang,
        const progress_callback& on_progress = {}, std::stop_token stop = {}
    );

    chain_outcome suggestions(
        const std::string& query, const std::string& lang,
        item_sink on_item = {}, std::stop_token stop = {}
    );

    /**
     * @throws lexis_error(invalid_input) for blank or over-long text, before
     *         any lookup.
     */
    chain_outcome translate(
        const std::string& text, const std::string& source_lang,
        const std::string& target_lang, std::stop_token stop = {}
    );

    /// Wait for background enrichment and durable cache writes.
    void wait_background();

    [[nodiscard]] result_cache& cache() noexcept;
    [[nodiscard]] const lexis_options& options() const noexcept;

private:
    [[nodiscard]] stage_fn detail_stage();
    [[nodiscard]] std::function<bool()> availability();

    lexis_options opt;
    std::unique_ptr<corespace::transport> link;
    backend_client client;
    task_poller poller;
    result_cache store;
    two_stage_orchestrator words;
    request_deduplicator dedup;
    fallback_chain word_chain;
    fallback_chain suggestion_chain;
    fallback_chain translation_chain;
};
}
#endif // LEXIS_LEXIS_HPP
