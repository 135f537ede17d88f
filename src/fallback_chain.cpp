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

#include "fallback_chain.hpp"
#include "logging.hpp"
#include "partial_merger.hpp"
#include "utils.hpp"

#include <chrono>

namespace lexispace {
using corespace::error_kind;
using corespace::lexis_error;

std::string_view chain_state_name(const chain_state state) noexcept {
    switch (state) {
    case chain_state::cache_lookup:
        return "cache_lookup";
    case chain_state::local_dataset:
        return "local_dataset";
    case chain_state::remote_generation:
        return "remote_generation";
    case chain_state::static_fallback:
        return "static_fallback";
    case chain_state::done:
        return "done";
    case chain_state::failed:
        return "failed";
    }
    return "unknown";
}

std::string_view result_source_name(const result_source source) noexcept {
    switch (source) {
    case result_source::none:
        return "none";
    case result_source::cache:
        return "cache";
    case result_source::local:
        return "local";
    case result_source::remote:
        return "remote";
    case result_source::fallback:
        return "fallback";
    }
    return "unknown";
}

std::string chain_key(const chain_request& request) {
    auto key = make_cache_key(request.query, request.lang);
    if (request.scope.empty()) {
        return key;
    }
    return request.scope + ":" + key;
}

bool chain_outcome::ok() const noexcept { return state == chain_state::done; }

fallback_chain::fallback_chain(
    result_cache& cache, request_deduplicator& dedup, chain_sources sources
)
    : cache(cache)
    , dedup(dedup)
    , sources(std::move(sources)) { }

fallback_chain::~fallback_chain() {
    enrich_stop.request_stop();
    wait_enrichment();
}

bool fallback_chain::usable(const nlohmann::json& value) const {
    if (sources.usable) {
        return sources.usable(value);
    }
    return !is_empty_value(value);
}

chain_outcome fallback_chain::resolve(
    const chain_request& request, const progress_callback& on_progress,
    const std::stop_token stop
) {
    const std::string key = chain_key(request);
    if (corespace::normalize_query(request.query).empty()) {
        throw lexis_error(error_kind::invalid_input, "empty query");
    }

    chain_outcome outcome;
    const auto enter = [&outcome](const chain_state state) {
        outcome.state = state;
        outcome.trace.push_back(state);
    };
    const auto finish = [&](const result_source source, nlohmann::json value) {
        enter(chain_state::done);
        outcome.source = source;
        outcome.value = std::move(value);
        corespace::logger()->info(
            "'{}' resolved from {}", key, result_source_name(source)
        );
        if (on_progress) {
            on_progress(100, outcome.value);
        }
        return outcome;
    };
    const auto check_stop = [&stop] {
        if (stop.stop_requested()) {
            throw lexis_error(error_kind::cancelled, "lookup cancelled");
        }
    };

    enter(chain_state::cache_lookup);
    if (auto hit = cache.read(key); hit && usable(*hit)) {
        return finish(result_source::cache, std::move(*hit));
    }

    check_stop();
    enter(chain_state::local_dataset);
    if (sources.local) {
        if (auto hit = sources.local->find(request.query, request.lang);
            hit && usable(*hit)) {
            cache.write(key, *hit);
            return finish(result_source::local, std::move(*hit));
        }
    }

    check_stop();
    enter(chain_state::remote_generation);
    bool origin = false;
    if (auto value
        = remote_stage(key, request, on_progress, stop, outcome, origin)) {
        if (origin) {
            start_enrichment(key, request, *value);
        }
        return finish(result_source::remote, std::move(*value));
    }

    check_stop();
    enter(chain_state::static_fallback);
    if (sources.fallback) {
        if (auto hit = sources.fallback->find(request.query, request.lang);
            hit && usable(*hit)) {
            return finish(result_source::fallback, std::move(*hit));
        }
    }

    enter(chain_state::failed);
    outcome.error = error_kind::not_found;
    outcome.message = "'" + request.query + "' was not found";
    std::vector<std::string> visited;
    for (const auto state : outcome.trace) {
        visited.emplace_back(chain_state_name(state));
    }
    corespace::logger()->info(
        "'{}' not found ({})", key, corespace::join_str(visited, " -> ")
    );
    return outcome;
}

std::optional<nlohmann::json> fallback_chain::remote_stage(
    const std::string& key, const chain_request& request,
    const progress_callback& on_progress, const std::stop_token& stop,
    chain_outcome& outcome, bool& origin
) {
    if (!sources.remote) {
        return std::nullopt;
    }
    if (sources.available && !sources.available()) {
        corespace::logger()->info("remote generation unavailable for '{}'", key);
        return std::nullopt;
    }

    try {
        // the operation caches its own result, once for every subscriber
        auto handle = dedup.get_or_start(
            key,
            [&cache = cache, remote = sources.remote, usable = sources.usable,
             key, request](const progress_callback& report, std::stop_token token) {
                auto value = remote(request, report, token);
                const bool keep = usable ? usable(value) : !is_empty_value(value);
                if (keep && !token.stop_requested()) {
                    cache.write(key, value);
                }
                return value;
            },
            on_progress
        );
        origin = handle.started_here();
        const std::stop_callback drop(stop, [&handle] { handle.cancel(); });
        auto value = handle.get();
        if (stop.stop_requested()) {
            throw lexis_error(error_kind::cancelled, "lookup cancelled");
        }
        if (usable(value)) {
            return value;
        }
        outcome.remote_error = error_kind::malformed_response;
        corespace::logger()->warn("remote result for '{}' is not usable", key);
    } catch (const lexis_error& e) {
        if (e.kind() == error_kind::cancelled) {
            throw;
        }
        outcome.remote_error = e.kind();
        switch (e.kind()) {
        case error_kind::rate_limited:
        case error_kind::timeout:
        case error_kind::network:
            corespace::logger()->warn(
                "remote generation for '{}' failed ({}): {}", key,
                corespace::error_kind_name(e.kind()), e.what()
            );
            break;
        default:
            corespace::logger()->error(
                "remote generation for '{}' failed ({}): {}", key,
                corespace::error_kind_name(e.kind()), e.what()
            );
        }
    } catch (const std::exception& e) {
        outcome.remote_error = corespace::classify(std::current_exception());
        corespace::logger()->error(
            "remote generation for '{}' failed: {}", key, e.what()
        );
    }
    return std::nullopt;
}

void fallback_chain::start_enrichment(
    const std::string& key, const chain_request& request,
    const nlohmann::json& value
) {
    if (!sources.enrich) {
        return;
    }
    auto task = std::async(
        std::launch::async,
        [enrich = sources.enrich, key, request, value,
         token = enrich_stop.get_token()] {
            try {
                enrich(key, request, value, token);
            } catch (const std::exception& e) {
                corespace::logger()->error(
                    "enrichment of '{}' failed: {}", key, e.what()
                );
            }
        }
    );
    std::lock_guard lock(m);
    reap_enrichments();
    enrichments.push_back(std::move(task));
}

std::size_t fallback_chain::pending_enrichments() {
    std::lock_guard lock(m);
    reap_enrichments();
    return enrichments.size();
}

void fallback_chain::reap_enrichments() {
    std::erase_if(enrichments, [](std::future<void>& task) {
        if (task.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }
        task.get();
        return true;
    });
}

void fallback_chain::wait_enrichment() {
    std::vector<std::future<void>> waiting;
    {
        std::lock_guard lock(m);
        waiting.swap(enrichments);
    }
    for (auto& task : waiting) {
        task.get();
    }
}

nlohmann::json fallback_chain::fetch(
    const chain_request& request, const progress_callback& on_progress,
    const std::stop_token stop
) {
    auto outcome = resolve(request, on_progress, stop);
    if (!outcome.ok()) {
        throw lexis_error(
            outcome.error.value_or(error_kind::not_found), outcome.message
        );
    }
    return std::move(outcome.value);
}
}
