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

#ifndef LEXIS_FALLBACK_CHAIN_HPP
#define LEXIS_FALLBACK_CHAIN_HPP

#include "content_source.hpp"
#include "errors.hpp"
#include "request_deduplicator.hpp"
#include "result_cache.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace lexispace {
enum class chain_state {
    cache_lookup,
    local_dataset,
    remote_generation,
    static_fallback,
    done,
    failed
};

std::string_view chain_state_name(chain_state state) noexcept;

/// Where a resolved value came from.
enum class result_source { none, cache, local, remote, fallback };

std::string_view result_source_name(result_source source) noexcept;

/**
 * @brief One lookup. `scope` separates result kinds that share queries
 *        (word details, suggestions, translations) in cache and dedup keys.
 */
struct chain_request {
    std::string query;
    std::string lang;
    std::string native_lang = "ja";
    std::string scope;
};

/// Cache and deduplication key of @p request.
std::string chain_key(const chain_request& request);

/// Remote generation for one request; run once per key at a time.
using remote_fn = std::function<nlohmann::json(
    const chain_request&, const progress_callback&, std::stop_token
)>;

/**
 * @brief Background enrichment of a freshly generated value.
 *
 * Runs after the caller already has the primary result and writes its
 * additions through the cache, under the key it is given.
 */
using enrich_fn = std::function<void(
    const std::string& key, const chain_request&, const nlohmann::json&,
    std::stop_token
)>;

using usable_fn = std::function<bool(const nlohmann::json&)>;

/**
 * @struct chain_sources
 * @brief The sources consulted by a chain, in order.
 *
 * Every member is optional. `available` is the remote availability probe
 * (remote generation is skipped when it answers false); `usable` decides
 * whether a value counts as a hit (default: not empty).
 */
struct chain_sources {
    std::shared_ptr<const content_source> local;
    std::shared_ptr<const content_source> fallback;
    remote_fn remote;
    std::function<bool()> available;
    enrich_fn enrich;
    usable_fn usable;
};

/**
 * @struct chain_outcome
 * @brief Result of one walk through the chain.
 *
 * `trace` lists every state entered, ending with `done` or `failed`.
 * `error` is the classification surfaced to the caller on failure
 * (`not_found` once every source is exhausted); `remote_error` keeps what
 * the remote stage reported, if anything.
 */
struct chain_outcome {
    chain_state state = chain_state::cache_lookup;
    result_source source = result_source::none;
    nlohmann::json value;
    std::vector<chain_state> trace;
    std::optional<corespace::error_kind> error;
    std::optional<corespace::error_kind> remote_error;
    std::string message;

    [[nodiscard]] bool ok() const noexcept;
};

/**
 * @class fallback_chain
 * @brief Resolves a request against cache, local dataset, remote
 * generation and static fallback, in that order.
 *
 *  - A usable cache entry ends the walk; nothing else is consulted.
 *  - A local dataset hit is written to the cache and ends the walk.
 *  - Remote generation goes through the deduplicator keyed by the cache
 *    key, so concurrent identical requests share one remote operation. A
 *    usable result is cached by that operation, and the caller that started
 *    it also starts background enrichment. The walk ends.
 *  - Every remote failure descends to the static fallback: `rate_limited`,
 *    `timeout` and `network` are logged as warnings, anything else as an
 *    error. Cancellation is not a failure of the source and is rethrown.
 *  - Static fallback hits are returned but not cached.
 *  - With no hit anywhere, the walk fails with `not_found`.
 *
 * Background enrichments are waited for on destruction.
 */
class fallback_chain {
public:
    fallback_chain(
        result_cache& cache, request_deduplicator& dedup, chain_sources sources
    );
    fallback_chain(const fallback_chain&) = delete;
    fallback_chain& operator=(const fallback_chain&) = delete;
    ~fallback_chain();

    /**
     * @throws lexis_error(invalid_input) for an empty query.
     * @throws lexis_error(cancelled) once @p stop is requested.
     */
    chain_outcome resolve(
        const chain_request& request, const progress_callback& on_progress = {},
        std::stop_token stop = {}
    );

    /**
     * @brief `resolve`, returning the value of a successful walk.
     * @throws lexis_error with the outcome's classification on failure.
     */
    nlohmann::json fetch(
        const chain_request& request, const progress_callback& on_progress = {},
        std::stop_token stop = {}
    );

    /// Block until every background enrichment has finished.
    void wait_enrichment();

    /// @return Background enrichments still running.
    [[nodiscard]] std::size_t pending_enrichments();

private:
    [[nodiscard]] bool usable(const nlohmann::json& value) const;
    std::optional<nlohmann::json> remote_stage(
        const std::string& key, const chain_request& request,
        const progress_callback& on_progress, const std::stop_token& stop,
        chain_outcome& outcome, bool& origin
    );
    void start_enrichment(
        const std::string& key, const chain_request& request,
        const nlohmann::json& value
    );
    /// Drop finished enrichments. Caller holds m.
    void reap_enrichments();

    result_cache& cache;
    request_deduplicator& dedup;
    const chain_sources sources;

    std::stop_source enrich_stop;
    std::mutex m;
    std::vector<std::future<void>> enrichments;
};
}
#endif // LEXIS_FALLBACK_CHAIN_HPP
