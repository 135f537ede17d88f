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

#ifndef LEXIS_TASK_POLLER_HPP
#define LEXIS_TASK_POLLER_HPP

#include "backend_client.hpp"

#include <chrono>
#include <functional>
#include <stop_token>

namespace lexispace {
/**
 * @brief Progress observer: `(progress 0..100, partial result)`.
 *
 * The partial result may be null when the source has no content yet.
 */
using progress_callback = std::function<void(int, const nlohmann::json&)>;

using clock_fn = std::function<std::chrono::steady_clock::time_point()>;
using sleep_fn
    = std::function<void(std::chrono::milliseconds, std::stop_token)>;

/**
 * @brief Sleep for @p duration or until @p stop is requested.
 */
void interruptible_sleep(
    std::chrono::milliseconds duration, std::stop_token stop
);

/**
 * @struct poll_options
 * @brief Timing and tolerance policy of the status poll loop.
 *
 *  - `interval`: pause before every status request.
 *  - `rate_limit_cooldown`: extra pause after a 429; the poll is repeated
 *    and does not count as a failure. More than `rate_limit_retries`
 *    consecutive 429s raise `rate_limited`.
 *  - `not_found_high_water` / `not_found_retries`: a 404 is tolerated only
 *    once progress reached the high-water mark and a partial result exists;
 *    the `not_found_retries`-th consecutive tolerated 404 completes the task
 *    with the last partial result.
 *  - `ceiling`: wall-clock budget of one `run`, measured with `now`.
 *
 * `now` and `sleep` are hooks so that tests control time.
 */
struct poll_options {
    std::chrono::milliseconds interval { 500 };
    std::chrono::milliseconds rate_limit_cooldown { 1000 };
    int rate_limit_retries = 10;
    int not_found_high_water = 75;
    int not_found_retries = 3;
    std::chrono::milliseconds ceiling { 60000 };
    clock_fn now = [] { return std::chrono::steady_clock::now(); };
    sleep_fn sleep = interruptible_sleep;
};

/// Final result of a polled task.
struct poll_outcome {
    nlohmann::json data;
    long tokens_used = 0;
    bool synthesized = false; ///< Completed from the last partial after 404s.
    std::string task_id;
};

/**
 * @class task_poller
 * @brief Drives one progressive generation task to a terminal state.
 *
 * The progress callback fires only when the reported progress strictly
 * increases, so a subscriber never observes a regression. A task that
 * completes without having reported 100 gets a final callback at 100.
 *
 * Failures: `task_not_found` (404 outside the tolerance window),
 * `rate_limited` (429 budget exhausted), `http_status` (any other non-2xx),
 * `remote_failure` (task status `error`), `timeout` (ceiling exceeded),
 * `cancelled` (stop requested; checked before and after every pause).
 */
class task_poller {
public:
    explicit task_poller(backend_client& client, poll_options opt = {});

    /**
     * @brief Start a task for @p prompt and poll it to completion.
     */
    poll_outcome run(
        const std::string& prompt, const progress_callback& on_progress,
        std::stop_token stop = {}
    );

    /**
     * @brief Poll an already started task to completion.
     */
    poll_outcome follow(
        const std::string& task_id, const progress_callback& on_progress,
        std::stop_token stop = {}
    );

private:
    void pause(
        std::chrono::milliseconds duration, const std::stop_token& stop
    ) const;
    static void throw_if_stopped(const std::stop_token& stop);

    backend_client& client;
    const poll_options opt;
};
}
#endif // LEXIS_TASK_POLLER_HPP
