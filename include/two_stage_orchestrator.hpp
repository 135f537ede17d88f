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

#ifndef LEXIS_TWO_STAGE_ORCHESTRATOR_HPP
#define LEXIS_TWO_STAGE_ORCHESTRATOR_HPP

#include "task_poller.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace lexispace {
/// What a stage is asked to produce.
struct stage_request {
    std::string query;
    std::string lang;
    std::string native_lang = "ja";
};

/**
 * @brief One stage of a two-stage fetch.
 *
 * Reports its own progress (0..100) with partial results and returns its
 * final result. Must honour the stop token.
 */
using stage_fn = std::function<nlohmann::json(
    const stage_request&, const progress_callback&, std::stop_token
)>;

using prompt_fn = std::function<std::string(const stage_request&)>;

enum class detail_mode { polling, streaming };

struct orchestrator_options {
    int basic_share = 30; ///< Progress reported once the basic stage resolves.
    detail_mode mode = detail_mode::polling;
};

/**
 * @brief Map detailed-stage progress 0..100 onto `basic_share..100`.
 */
int rescale_progress(int detail_progress, int basic_share) noexcept;

/**
 * @brief Overall progress announced by a streamed section: `hint` 50,
 * `metrics` 70, `examples` 90, `complete` 100. Other sections have none.
 */
std::optional<int> section_progress(std::string_view section) noexcept;

/**
 * @brief Inverse of `rescale_progress`: the smallest stage progress that
 * rescales to at least @p overall.
 */
int stage_progress_for(int overall, int basic_share) noexcept;

/// First stage: `generate_basic` with the prompt built by @p prompt.
stage_fn basic_stage(backend_client& client, prompt_fn prompt);

/// Second stage, polled: a progressive task driven by @p poller.
stage_fn polling_detail_stage(task_poller& poller, prompt_fn prompt);

/**
 * @brief Second stage, streamed: `stream_additional`, reporting each
 * section at its announced progress with the sections received so far.
 */
stage_fn streaming_detail_stage(
    backend_client& client, prompt_fn prompt, int basic_share = 30
);

/**
 * @class two_stage_orchestrator
 * @brief Runs a fast basic stage and a slower detailed stage concurrently
 * and presents them as one result with one progress timeline.
 *
 * Timeline: the basic stage resolving reports `basic_share` with the basic
 * result; detailed progress `p` is reported as
 * `rescale_progress(p, basic_share)`; the end reports 100. Reported
 * progress never decreases.
 *
 * The shown result is folded with `merge_partial`, so a field that was
 * shown is never blanked by a later, emptier partial.
 *
 * Failure policy: a failed basic stage stops the detailed stage and fails
 * the fetch. A failed detailed stage is logged and the fetch returns the
 * basic result merged with whatever detail arrived. Stop requests fail the
 * fetch with `cancelled`.
 */
class two_stage_orchestrator {
public:
    two_stage_orchestrator(
        stage_fn basic, stage_fn detailed, orchestrator_options opt = {}
    );

    nlohmann::json fetch(
        const stage_request& request, const progress_callback& on_progress,
        std::stop_token stop = {}
    ) const;

    [[nodiscard]] const orchestrator_options& options() const noexcept;

private:
    stage_fn basic;
    stage_fn detailed;
    orchestrator_options opt;
};
}
#endif // LEXIS_TWO_STAGE_ORCHESTRATOR_HPP
