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

#include "task_poller.hpp"
#include "logging.hpp"
#include "partial_merger.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace lexispace {
using corespace::error_kind;
using corespace::lexis_error;

void interruptible_sleep(
    const std::chrono::milliseconds duration, std::stop_token stop
) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, duration, [] { return false; });
}

task_poller::task_poller(backend_client& client, poll_options opt)
    : client(client)
    , opt(std::move(opt)) { }

void task_poller::throw_if_stopped(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw lexis_error(error_kind::cancelled, "generation cancelled");
    }
}

void task_poller::pause(
    const std::chrono::milliseconds duration, const std::stop_token& stop
) const {
    opt.sleep(duration, stop);
    throw_if_stopped(stop);
}

poll_outcome task_poller::run(
    const std::string& prompt, const progress_callback& on_progress,
    const std::stop_token stop
) {
    throw_if_stopped(stop);
    return follow(client.start_task(prompt), on_progress, stop);
}

poll_outcome task_poller::follow(
    const std::string& task_id, const progress_callback& on_progress,
    const std::stop_token stop
) {
    const auto deadline = opt.now() + opt.ceiling;
    const auto notify = [&](const int progress, const nlohmann::json& partial) {
        if (on_progress) {
            on_progress(progress, partial);
        }
    };

    int last_progress = 0;
    nlohmann::json last_partial;
    int not_found = 0;
    int limited = 0;

    for (;;) {
        throw_if_stopped(stop);
        if (opt.now() >= deadline) {
            throw lexis_error(
                error_kind::timeout,
                "task " + task_id + " did not finish within "
                    + std::to_string(opt.ceiling.count()) + " ms"
            );
        }
        pause(opt.interval, stop);

        const auto response = client.task_status(task_id);
        if (!response.task) {
            const long status = response.http_status;
            if (status == 404) {
                if (last_progress >= opt.not_found_high_water
                    && !is_empty_value(last_partial)) {
                    ++not_found;
                    corespace::logger()->warn(
                        "task {} not found ({}/{}), last progress {}", task_id,
                        not_found, opt.not_found_retries, last_progress
                    );
                    if (not_found >= opt.not_found_retries) {
                        corespace::logger()->info(
                            "task {} completed from its last partial result",
                            task_id
                        );
                        if (last_progress < 100) {
                            notify(100, last_partial);
                        }
                        return { last_partial, 0, true, task_id };
                    }
                    continue;
                }
                throw lexis_error(
                    error_kind::task_not_found,
                    "task " + task_id + " not found at progress "
                        + std::to_string(last_progress),
                    status
                );
            }
            if (status == 429) {
                if (++limited > opt.rate_limit_retries) {
                    throw lexis_error(
                        error_kind::rate_limited, response.message, status
                    );
                }
                corespace::logger()->warn(
                    "rate limited while polling task {}, cooling down {} ms",
                    task_id, opt.rate_limit_cooldown.count()
                );
                pause(opt.rate_limit_cooldown, stop);
                continue;
            }
            throw lexis_error(error_kind::http_status, response.message, status);
        }

        not_found = 0;
        limited = 0;
        const generation_task& task = *response.task;
        const int progress = std::clamp(task.progress, 0, 100);
        corespace::logger()->debug(
            "task {} status {} progress {}", task_id,
            static_cast<int>(task.status), progress
        );
        if (!is_empty_value(task.partial_result)) {
            last_partial = task.partial_result;
        }
        if (progress > last_progress) {
            last_progress = progress;
            notify(progress, task.partial_result);
        }

        if (task.status == task_state::completed) {
            nlohmann::json data = is_empty_value(task.partial_result)
                ? last_partial
                : task.partial_result;
            if (last_progress < 100) {
                last_progress = 100;
                notify(100, data);
            }
            corespace::logger()->info("task {} completed", task_id);
            return { std::move(data), task.tokens_used, false, task_id };
        }
        if (task.status == task_state::error) {
            throw lexis_error(
                error_kind::remote_failure,
                task.error.empty() ? "Generation failed" : task.error
            );
        }
    }
}
}
