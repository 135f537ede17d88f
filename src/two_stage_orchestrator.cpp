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

#include "two_stage_orchestrator.hpp"
#include "logging.hpp"
#include "partial_merger.hpp"

#include <algorithm>
#include <future>
#include <mutex>

namespace lexispace {
using corespace::error_kind;
using corespace::lexis_error;

int rescale_progress(const int detail_progress, const int basic_share) noexcept {
    const int p = std::clamp(detail_progress, 0, 100);
    return basic_share + p * (100 - basic_share) / 100;
}

std::optional<int> section_progress(const std::string_view section) noexcept {
    if (section == "hint") {
        return 50;
    }
    if (section == "metrics") {
        return 70;
    }
    if (section == "examples") {
        return 90;
    }
    if (section == "complete") {
        return 100;
    }
    return std::nullopt;
}

int stage_progress_for(const int overall, const int basic_share) noexcept {
    const int span = 100 - basic_share;
    if (span <= 0 || overall <= basic_share) {
        return 0;
    }
    const int above = std::min(overall, 100) - basic_share;
    return (above * 100 + span - 1) / span;
}

stage_fn basic_stage(backend_client& client, prompt_fn prompt) {
    return [&client, prompt = std::move(prompt)](
               const stage_request& request, const progress_callback&,
               const std::stop_token stop
           ) {
        if (stop.stop_requested()) {
            throw lexis_error(error_kind::cancelled, "basic stage cancelled");
        }
        return client.generate_basic(prompt(request)).data;
    };
}

stage_fn polling_detail_stage(task_poller& poller, prompt_fn prompt) {
    return [&poller, prompt = std::move(prompt)](
               const stage_request& request, const progress_callback& report,
               const std::stop_token stop
           ) { return poller.run(prompt(request), report, stop).data; };
}

stage_fn streaming_detail_stage(
    backend_client& client, prompt_fn prompt, const int basic_share
) {
    return [&client, prompt = std::move(prompt), basic_share](
               const stage_request& request, const progress_callback& report,
               const std::stop_token stop
           ) {
        nlohmann::json sections = nlohmann::json::object();
        const auto result = client.stream_additional(
            prompt(request),
            [&](const stream_event& event) {
                const auto* section = std::get_if<section_event>(&event);
                if (!section) {
                    return;
                }
                sections[section->section] = section->data;
                const auto overall = section_progress(section->section);
                if (overall && report) {
                    report(stage_progress_for(*overall, basic_share), sections);
                }
            },
            stop
        );
        return merge_partial(sections, result.data);
    };
}

two_stage_orchestrator::two_stage_orchestrator(
    stage_fn basic, stage_fn detailed, orchestrator_options opt
)
    : basic(std::move(basic))
    , detailed(std::move(detailed))
    , opt(opt) { }

const orchestrator_options& two_stage_orchestrator::options() const noexcept {
    return opt;
}

nlohmann::json two_stage_orchestrator::fetch(
    const stage_request& request, const progress_callback& on_progress,
    const std::stop_token stop
) const {
    std::mutex m;
    nlohmann::json basic_part;
    nlohmann::json detail_part;
    nlohmann::json shown;
    int reported = -1;

    // caller must hold m
    const auto publish = [&](const int progress) {
        auto next = merge_partial(shown, merge_partial(basic_part, detail_part));
        const int level = std::max(reported, progress);
        if (level == reported && next == shown) {
            return;
        }
        shown = std::move(next);
        reported = level;
        if (on_progress) {
            on_progress(reported, shown);
        }
    };

    std::stop_source detail_stop;
    const std::stop_callback forward(stop, [&detail_stop] {
        detail_stop.request_stop();
    });

    const progress_callback detail_report
        = [&](const int progress, const nlohmann::json& partial) {
              std::lock_guard lock(m);
              detail_part = merge_partial(detail_part, partial);
              publish(rescale_progress(progress, opt.basic_share));
          };

    auto detail = std::async(std::launch::async, [&] {
        return detailed(request, detail_report, detail_stop.get_token());
    });

    nlohmann::json basic_value;
    try {
        basic_value = basic(request, {}, stop);
    } catch (...) {
        // the detailed stage borrows this frame; it must end before unwinding
        detail_stop.request_stop();
        detail.wait();
        corespace::logger()->error(
            "basic stage for '{}' failed: {}", request.query,
            corespace::describe(std::current_exception())
        );
        throw;
    }
    {
        std::lock_guard lock(m);
        basic_part = std::move(basic_value);
        publish(opt.basic_share);
    }

    try {
        auto detail_value = detail.get();
        std::lock_guard lock(m);
        detail_part = merge_partial(detail_part, detail_value);
    } catch (const lexis_error& e) {
        if (e.kind() == error_kind::cancelled && stop.stop_requested()) {
            throw;
        }
        corespace::logger()->warn(
            "detailed stage for '{}' failed ({}): {}; keeping basic result",
            request.query, corespace::error_kind_name(e.kind()), e.what()
        );
    } catch (const std::exception& e) {
        corespace::logger()->warn(
            "detailed stage for '{}' failed: {}; keeping basic result",
            request.query, e.what()
        );
    }

    if (stop.stop_requested()) {
        throw lexis_error(error_kind::cancelled, "fetch cancelled");
    }
    std::lock_guard lock(m);
    publish(100);
    return shown;
}
}
