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

#include "config.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <fstream>
#include <string>
#include <type_traits>

namespace lexispace {
using corespace::error_kind;
using corespace::lexis_error;

namespace {
    const nlohmann::json* section(
        const nlohmann::json& config, const char* name
    ) {
        const auto it = config.find(name);
        if (it == config.end()) {
            return nullptr;
        }
        if (!it->is_object()) {
            throw lexis_error(
                error_kind::invalid_input,
                std::string("config section '") + name + "' must be an object"
            );
        }
        return &*it;
    }

    /// Assign `obj[name]` to @p out when present, rejecting wrong types.
    template <typename T>
    void read_key(const nlohmann::json& obj, const char* name, T& out) {
        const auto it = obj.find(name);
        if (it == obj.end()) {
            return;
        }
        bool fits;
        if constexpr (std::is_same_v<T, bool>) {
            fits = it->is_boolean();
        } else if constexpr (std::is_integral_v<T>) {
            fits = it->is_number_integer();
        } else if constexpr (std::is_floating_point_v<T>) {
            fits = it->is_number();
        } else {
            fits = it->is_string();
        }
        if (!fits) {
            throw lexis_error(
                error_kind::invalid_input,
                std::string("config key '") + name + "' has the wrong type"
            );
        }
        out = it->get<T>();
    }

    template <typename Duration>
    void read_duration(
        const nlohmann::json& obj, const char* name, Duration& out
    ) {
        long long count = out.count();
        read_key(obj, name, count);
        out = Duration(count);
    }

    void read_path(
        const nlohmann::json& obj, const char* name, std::filesystem::path& out
    ) {
        std::string text = out.string();
        read_key(obj, name, text);
        out = text;
    }
}

detail_mode parse_detail_mode(const std::string& name) {
    if (name == "polling") {
        return detail_mode::polling;
    }
    if (name == "streaming") {
        return detail_mode::streaming;
    }
    throw lexis_error(
        error_kind::invalid_input, "unknown detail mode: " + name
    );
}

void apply_config(lexis_options& options, const nlohmann::json& config) {
    if (!config.is_object()) {
        throw lexis_error(
            error_kind::invalid_input, "configuration must be a JSON object"
        );
    }

    if (const auto* net = section(config, "network")) {
        auto& n = options.network;
        read_key(*net, "timeout_ms", n.timeout_ms);
        read_key(*net, "stream_timeout_ms", n.stream_timeout_ms);
        read_key(*net, "connect_ms", n.connect_ms);
        read_key(*net, "max_retries", n.max_retries);
        read_key(*net, "retry_base_ms", n.retry_base_ms);
        read_key(*net, "retry_max_ms", n.retry_max_ms);
        read_key(*net, "user_agent", n.user_agent);
        read_key(*net, "bearer_token", n.bearer_token);
    }

    if (const auto* backend = section(config, "backend")) {
        auto& b = options.backend;
        read_key(*backend, "base_url", b.base_url);
        read_key(*backend, "api_prefix", b.api_prefix);
        read_key(*backend, "translate_path", b.translate_path);
        if (const auto* model = section(*backend, "model_config")) {
            b.model_config.update(*model);
        }
    }

    if (const auto* poll = section(config, "poll")) {
        auto& p = options.poll;
        read_duration(*poll, "interval_ms", p.interval);
        read_duration(*poll, "rate_limit_cooldown_ms", p.rate_limit_cooldown);
        read_key(*poll, "rate_limit_retries", p.rate_limit_retries);
        read_key(*poll, "not_found_high_water", p.not_found_high_water);
        read_key(*poll, "not_found_retries", p.not_found_retries);
        read_duration(*poll, "ceiling_ms", p.ceiling);
    }

    if (const auto* cache = section(config, "cache")) {
        read_duration(*cache, "ttl_seconds", options.cache.ttl);
        read_key(*cache, "prefix", options.cache.prefix);
    }

    if (const auto* orch = section(config, "orchestrator")) {
        read_key(*orch, "basic_share", options.orchestrator.basic_share);
        if (options.orchestrator.basic_share < 0
            || options.orchestrator.basic_share > 100) {
            throw lexis_error(
                error_kind::invalid_input, "basic_share must be within 0..100"
            );
        }
        std::string mode;
        read_key(*orch, "detail_mode", mode);
        if (!mode.empty()) {
            options.orchestrator.mode = parse_detail_mode(mode);
        }
    }

    read_path(config, "storage_dir", options.storage_dir);
    read_path(config, "dictionary", options.dictionary_path);
    read_path(config, "fallback", options.fallback_path);
    read_key(config, "log_level", options.log_level);
}

lexis_options load_options(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw lexis_error(
            error_kind::invalid_input, "cannot open config " + path.string()
        );
    }
    const auto config = nlohmann::json::parse(in, nullptr, false);
    if (config.is_discarded()) {
        throw lexis_error(
            error_kind::malformed_response,
            "config " + path.string() + " is not valid JSON"
        );
    }
    lexis_options options;
    apply_config(options, config);
    return options;
}

void apply_environment(lexis_options& options) {
    if (const char* url = std::getenv("LEXIS_BACKEND_URL"); url && *url) {
        options.backend.base_url = url;
    }
    if (const char* level = std::getenv("LEXIS_LOG_LEVEL"); level && *level) {
        options.log_level = level;
    }
}
}
