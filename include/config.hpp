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

#ifndef LEXIS_CONFIG_HPP
#define LEXIS_CONFIG_HPP

#include "backend_client.hpp"
#include "result_cache.hpp"
#include "task_poller.hpp"
#include "two_stage_orchestrator.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace lexispace {
/**
 * @struct lexis_options
 * @brief Every tunable of a `lexis` instance.
 *
 * `storage_dir` enables the durable cache layer when non-empty.
 * `dictionary_path` and `fallback_path` name JSON datasets used as the
 * local and static sources of word lookups; empty paths disable them.
 */
struct lexis_options {
    corespace::network_options network;
    backend_options backend;
    poll_options poll;
    cache_options cache;
    orchestrator_options orchestrator;
    std::filesystem::path storage_dir;
    std::filesystem::path dictionary_path;
    std::filesystem::path fallback_path;
    std::string log_level = "info";
};

/**
 * @brief Overlay a JSON configuration document onto @p options.
 *
 * Recognized sections: `network`, `backend`, `poll`, `cache`,
 * `orchestrator` and the top-level keys `storage_dir`, `dictionary`,
 * `fallback`, `log_level`. Every key is optional and unknown keys are
 * ignored. Durations are given in milliseconds, except `cache.ttl_seconds`.
 *
 * @throws lexis_error(invalid_input) if a known key has the wrong type or
 *         the document is not an object.
 */
void apply_config(lexis_options& options, const nlohmann::json& config);

/**
 * @brief Read a configuration file on top of the defaults.
 * @throws lexis_error(invalid_input) if the file cannot be opened or a key
 *         has the wrong type, lexis_error(malformed_response) if it is not
 *         valid JSON.
 */
lexis_options load_options(const std::filesystem::path& path);

/**
 * @brief Apply `LEXIS_BACKEND_URL` and `LEXIS_LOG_LEVEL` when set.
 */
void apply_environment(lexis_options& options);

detail_mode parse_detail_mode(const std::string& name);
}
#endif // LEXIS_CONFIG_HPP
