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

#include "fake_clock.hpp"
#include "fake_transport.hpp"
#include "task_poller.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace lexispace;
using corespace::error_kind;
using corespace::lexis_error;
using nlohmann::json;

namespace {
const std::string task_route = "/task/t1";

json task(const std::string& status, int progress, json partial = nullptr) {
    json body { { "status", status }, { "progress", progress } };
    if (!partial.is_null()) {
        body["partialData"] = std::move(partial);
    }
    return body;
}

struct poller_fixture : ::testing::Test {
    fake_transport link;
    backend_client client { link };
    fake_clock clock;
    std::vector<int> reported;

    poll_outcome run(poll_options opt = {}, std::stop_token stop = {}) {
        link.reply_json("/generate-json-progressive", { { "taskId", "t1" } });
        task_poller poller(client, clock.apply(std::move(opt)));
        return poller.run(
            "prompt", [this](int p, const json&) { reported.push_back(p); },
            stop
        );
    }

    error_kind failure_of(poll_options opt = {}) {
        try {
            (void)run(std::move(opt));
        } catch (const lexis_error& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected lexis_error";
        return error_kind::invalid_input;
    }
};
}

using TaskPoller = poller_fixture;

TEST_F(TaskPoller, CompletesWithMonotonicProgress) {
    link.reply_json(task_route, task("queued", 0));
    link.reply_json(task_route, task("running", 10, { { "a", 1 } }));
    link.reply_json(task_route, task("running", 40, { { "a", 2 } }));
    link.reply_json(task_route, task("running", 30, { { "a", 3 } }));
    link.reply_json(task_route, task("completed", 100, { { "a", 4 } }));

    const auto outcome = run();
    EXPECT_EQ(outcome.data, json({ { "a", 4 } }));
    EXPECT_EQ(outcome.task_id, "t1");
    EXPECT_FALSE(outcome.synthesized);
    EXPECT_EQ(reported, (std::vector<int> { 10, 40, 100 }));
    EXPECT_EQ(link.calls(task_route), 5u);
}

TEST_F(TaskPoller, PausesForIntervalBeforeEveryPoll) {
    link.reply_json(task_route, task("running", 50, { { "a", 1 } }));
    link.reply_json(task_route, task("completed", 100, { { "a", 1 } }));

    poll_options opt;
    opt.interval = std::chrono::milliseconds(250);
    (void)run(opt);
    EXPECT_EQ(clock.sleeps(), (std::vector<long long> { 250, 250 }));
}

TEST_F(TaskPoller, CompletionReportsHundredOnce) {
    link.reply_json(task_route, task("running", 20, { { "a", 1 } }));
    link.reply_json(task_route, task("completed", 80, { { "a", 2 } }));

    (void)run();
    EXPECT_EQ(reported, (std::vector<int> { 20, 80, 100 }));
}

TEST_F(TaskPoller, CompletedWithoutDataUsesLastPartial) {
    link.reply_json(task_route, task("running", 60, { { "a", 1 } }));
    link.reply_json(task_route, task("completed", 100));

    EXPECT_EQ(run().data, json({ { "a", 1 } }));
}

TEST_F(TaskPoller, NotFoundNearCompletionUsesLastPartial) {
    link.reply_json(task_route, task("running", 80, { { "a", 1 } }));
    link.reply(task_route, 404, R"({"error":"Task not found"})");

    const auto outcome = run();
    EXPECT_TRUE(outcome.synthesized);
    EXPECT_EQ(outcome.data, json({ { "a", 1 } }));
    EXPECT_EQ(reported, (std::vector<int> { 80, 100 }));
    EXPECT_EQ(link.calls(task_route), 4u);
}

TEST_F(TaskPoller, NotFoundAtHighWaterMarkIsTolerated) {
    link.reply_json(task_route, task("running", 75, { { "a", 1 } }));
    link.reply(task_route, 404, "");

    EXPECT_TRUE(run().synthesized);
}

TEST_F(TaskPoller, NotFoundBudgetResetsOnSuccess) {
    link.reply_json(task_route, task("running", 80, { { "a", 1 } }));
    link.reply(task_route, 404, "");
    link.reply(task_route, 404, "");
    link.reply_json(task_route, task("running", 90, { { "a", 2 } }));
    link.reply(task_route, 404, "");
    link.reply(task_route, 404, "");
    link.reply_json(task_route, task("completed", 100, { { "a", 3 } }));

    const auto outcome = run();
    EXPECT_FALSE(outcome.synthesized);
    EXPECT_EQ(outcome.data, json({ { "a", 3 } }));
}

TEST_F(TaskPoller, NotFoundEarlyIsFatal) {
    link.reply_json(task_route, task("running", 50, { { "a", 1 } }));
    link.reply(task_route, 404, "");

    EXPECT_EQ(failure_of(), error_kind::task_not_found);
    EXPECT_EQ(link.calls(task_route), 2u);
}

TEST_F(TaskPoller, NotFoundWithoutPartialIsFatal) {
    link.reply_json(task_route, task("running", 90));
    link.reply(task_route, 404, "");

    EXPECT_EQ(failure_of(), error_kind::task_not_found);
}

TEST_F(TaskPoller, RateLimitCoolsDownAndRetries) {
    link.reply(task_route, 429, R"({"error":"slow down"})");
    link.reply(task_route, 429, R"({"error":"slow down"})");
    link.reply_json(task_route, task("completed", 100, { { "a", 1 } }));

    const auto outcome = run();
    EXPECT_EQ(outcome.data, json({ { "a", 1 } }));
    const auto sleeps = clock.sleeps();
    EXPECT_EQ(std::count(sleeps.begin(), sleeps.end(), 1000), 2);
}

TEST_F(TaskPoller, RateLimitBudgetIsBounded) {
    link.reply(task_route, 429, "");

    poll_options opt;
    opt.rate_limit_retries = 3;
    EXPECT_EQ(failure_of(opt), error_kind::rate_limited);
    EXPECT_EQ(link.calls(task_route), 4u);
}

TEST_F(TaskPoller, OtherStatusIsFatal) {
    link.reply(task_route, 500, R"({"message":"boom"})");
    try {
        (void)run();
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::http_status);
        EXPECT_EQ(e.status(), 500);
        EXPECT_STREQ(e.what(), "boom");
    }
}

TEST_F(TaskPoller, TaskErrorIsRemoteFailure) {
    json failed = task("error", 30);
    failed["error"] = "quota exceeded";
    link.reply_json(task_route, failed);
    try {
        (void)run();
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::remote_failure);
        EXPECT_STREQ(e.what(), "quota exceeded");
    }
}

TEST_F(TaskPoller, CeilingEndsPolling) {
    link.reply_json(task_route, task("running", 10, { { "a", 1 } }));

    poll_options opt;
    opt.interval = std::chrono::milliseconds(500);
    opt.ceiling = std::chrono::milliseconds(2000);
    EXPECT_EQ(failure_of(opt), error_kind::timeout);
    EXPECT_EQ(clock.elapsed_ms(), 2000);
}

TEST_F(TaskPoller, StopEndsPolling) {
    link.reply_json(task_route, task("running", 10, { { "a", 1 } }));
    link.reply_json(task_route, task("running", 20, { { "a", 1 } }));

    std::stop_source stop;
    link.reply_json("/generate-json-progressive", { { "taskId", "t1" } });
    task_poller poller(client, clock.apply());
    try {
        (void)poller.run(
            "prompt",
            [&stop](int progress, const json&) {
                if (progress >= 20) {
                    stop.request_stop();
                }
            },
            stop.get_token()
        );
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::cancelled);
    }
    EXPECT_EQ(link.calls(task_route), 2u);
}

TEST_F(TaskPoller, StartFailureIsReported) {
    link.reply("/generate-json-progressive", 503, R"({"error":"down"})");
    task_poller poller(client, clock.apply());
    try {
        (void)poller.run("prompt", {});
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::http_status);
        EXPECT_EQ(e.status(), 503);
    }
}
