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
#include "two_stage_orchestrator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>

using namespace lexispace;
using corespace::error_kind;
using corespace::lexis_error;
using nlohmann::json;

namespace {
const json basic_result = { { "headword", { { "lemma", "gato" }, { "lang", "es" } } },
                            { "senses", { { { "id", "s1" }, { "glossShort", "猫" } } } } };

stage_fn returning(json value) {
    return [value = std::move(value)](
               const stage_request&, const progress_callback&, std::stop_token
           ) { return value; };
}

void wait_for_stop(const std::stop_token& stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait(lock, stop, [] { return false; });
}

/// Progress observer that can be awaited from a stage.
struct recorder {
    std::mutex m;
    std::vector<int> seen;
    std::promise<void> basic_shown;
    bool signalled = false;

    progress_callback callback(const int basic_share = 30) {
        return [this, basic_share](const int progress, const json&) {
            std::lock_guard lock(m);
            seen.push_back(progress);
            if (progress >= basic_share && !signalled) {
                signalled = true;
                basic_shown.set_value();
            }
        };
    }
};

std::string prompt_for(const stage_request& request) {
    return request.lang + ":" + request.query;
}
}

TEST(ProgressScale, RescaleDetailOntoRemainingSpan) {
    EXPECT_EQ(rescale_progress(0, 30), 30);
    EXPECT_EQ(rescale_progress(50, 30), 65);
    EXPECT_EQ(rescale_progress(100, 30), 100);
    EXPECT_EQ(rescale_progress(-5, 30), 30);
    EXPECT_EQ(rescale_progress(250, 30), 100);
}

TEST(ProgressScale, SectionMilestones) {
    EXPECT_EQ(section_progress("hint"), 50);
    EXPECT_EQ(section_progress("metrics"), 70);
    EXPECT_EQ(section_progress("examples"), 90);
    EXPECT_EQ(section_progress("complete"), 100);
    EXPECT_FALSE(section_progress("collocations"));
}

TEST(ProgressScale, StageProgressInvertsRescale) {
    EXPECT_EQ(stage_progress_for(20, 30), 0);
    EXPECT_EQ(stage_progress_for(100, 30), 100);
    for (const int overall : { 50, 70, 90 }) {
        const int stage = stage_progress_for(overall, 30);
        EXPECT_GE(rescale_progress(stage, 30), overall);
        EXPECT_LT(rescale_progress(stage - 1, 30), overall);
    }
}

TEST(TwoStageOrchestrator, BasicFirstThenDetailMerged) {
    recorder rec;
    auto shown = rec.basic_shown.get_future().share();
    const stage_fn detailed = [shown](
                                  const stage_request&, const progress_callback& report,
                                  std::stop_token
                              ) {
        shown.wait();
        report(50, { { "examples", { { { "textSrc", "un gato" } } } } });
        return json { { "examples", { { { "textSrc", "un gato" } } } },
                      { "metrics", { { "frequency", 80 } } } };
    };
    const two_stage_orchestrator orchestrator(returning(basic_result), detailed);

    const auto result
        = orchestrator.fetch({ "gato", "es" }, rec.callback());
    EXPECT_EQ(result["headword"]["lemma"], "gato");
    EXPECT_EQ(result["senses"].size(), 1u);
    EXPECT_EQ(result["examples"][0]["textSrc"], "un gato");
    EXPECT_EQ(result["metrics"]["frequency"], 80);
    EXPECT_EQ(rec.seen, (std::vector<int> { 30, 65, 100 }));
}

TEST(TwoStageOrchestrator, ProgressNeverDecreases) {
    recorder rec;
    const stage_fn detailed = [](const stage_request&, const progress_callback& report,
                                 std::stop_token) {
        report(60, { { "hint", { { "text", "h" } } } });
        report(20, { { "hint", { { "text", "h" } } } });
        return json { { "hint", { { "text", "h" } } } };
    };
    const two_stage_orchestrator orchestrator(returning(basic_result), detailed);
    (void)orchestrator.fetch({ "gato", "es" }, rec.callback());
    ASSERT_FALSE(rec.seen.empty());
    EXPECT_TRUE(std::is_sorted(rec.seen.begin(), rec.seen.end()));
    EXPECT_EQ(rec.seen.back(), 100);
}

TEST(TwoStageOrchestrator, DetailFailureKeepsBasicResult) {
    recorder rec;
    const stage_fn detailed = [](const stage_request&, const progress_callback&,
                                 std::stop_token) -> json {
        throw lexis_error(error_kind::timeout, "detail too slow");
    };
    const two_stage_orchestrator orchestrator(returning(basic_result), detailed);
    EXPECT_EQ(orchestrator.fetch({ "gato", "es" }, rec.callback()), basic_result);
    EXPECT_EQ(rec.seen, (std::vector<int> { 30, 100 }));
}

TEST(TwoStageOrchestrator, EmptyDetailFieldKeepsBasicValue) {
    const two_stage_orchestrator orchestrator(
        returning({ { "senses", { "a" } } }),
        returning({ { "senses", json::array() }, { "examples", { "x" } } })
    );
    EXPECT_EQ(
        orchestrator.fetch({ "gato", "es" }, {}),
        (json { { "senses", { "a" } }, { "examples", { "x" } } })
    );
}

TEST(TwoStageOrchestrator, DetailFailureKeepsPartialDetail) {
    recorder rec;
    auto shown = rec.basic_shown.get_future().share();
    const stage_fn detailed = [shown](
                                  const stage_request&, const progress_callback& report,
                                  std::stop_token
                              ) -> json {
        shown.wait();
        report(50, { { "examples", { { { "textSrc", "un gato" } } } } });
        throw lexis_error(error_kind::network, "connection reset");
    };
    const two_stage_orchestrator orchestrator(returning(basic_result), detailed);

    const auto result = orchestrator.fetch({ "gato", "es" }, rec.callback());
    EXPECT_EQ(result["headword"], basic_result["headword"]);
    EXPECT_EQ(result["senses"], basic_result["senses"]);
    EXPECT_EQ(result["examples"][0]["textSrc"], "un gato");
    EXPECT_EQ(rec.seen, (std::vector<int> { 30, 65, 100 }));
}

TEST(TwoStageOrchestrator, BasicFailureStopsDetailAndFails) {
    std::atomic<bool> detail_stopped { false };
    const stage_fn detailed = [&detail_stopped](
                                  const stage_request&, const progress_callback&,
                                  std::stop_token stop
                              ) -> json {
        wait_for_stop(stop);
        detail_stopped = true;
        throw lexis_error(error_kind::cancelled, "stopped");
    };
    const stage_fn basic = [](const stage_request&, const progress_callback&,
                              std::stop_token) -> json {
        throw lexis_error(error_kind::http_status, "basic failed", 500);
    };
    const two_stage_orchestrator orchestrator(basic, detailed);
    try {
        (void)orchestrator.fetch({ "gato", "es" }, {});
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::http_status);
    }
    EXPECT_TRUE(detail_stopped.load());
}

TEST(TwoStageOrchestrator, StopFailsWithCancelled) {
    std::stop_source stop;
    const stage_fn detailed = [&stop](const stage_request&, const progress_callback&,
                                      std::stop_token token) -> json {
        stop.request_stop();
        wait_for_stop(token);
        throw lexis_error(error_kind::cancelled, "stopped");
    };
    const stage_fn basic = [](const stage_request&, const progress_callback&,
                              std::stop_token token) {
        wait_for_stop(token);
        return basic_result;
    };
    const two_stage_orchestrator orchestrator(basic, detailed);
    try {
        (void)orchestrator.fetch({ "gato", "es" }, {}, stop.get_token());
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::cancelled);
    }
}

TEST(TwoStageOrchestrator, CustomBasicShare) {
    recorder rec;
    orchestrator_options opt;
    opt.basic_share = 50;
    const two_stage_orchestrator orchestrator(
        returning(basic_result), returning(json::object()), opt
    );
    (void)orchestrator.fetch({ "gato", "es" }, rec.callback(50));
    EXPECT_EQ(rec.seen, (std::vector<int> { 50, 100 }));
    EXPECT_EQ(orchestrator.options().basic_share, 50);
}

TEST(Stages, BasicStageUsesBasicEndpoint) {
    fake_transport link;
    backend_client client(link);
    link.reply_json("/generate-basic-info", { { "data", basic_result } });
    const auto stage = basic_stage(client, prompt_for);
    EXPECT_EQ(stage({ "gato", "es" }, {}, {}), basic_result);
    EXPECT_EQ(json::parse(link.requests().back().body)["prompt"], "es:gato");
}

TEST(Stages, PollingDetailStageFollowsTask) {
    fake_transport link;
    backend_client client(link);
    fake_clock clock;
    task_poller poller(client, clock.apply());
    link.reply_json("/generate-json-progressive", { { "taskId", "t7" } });
    link.reply_json("/task/t7", { { "status", "running" },
                                  { "progress", 40 },
                                  { "partialData", { { "a", 1 } } } });
    link.reply_json("/task/t7", { { "status", "completed" },
                                  { "progress", 100 },
                                  { "partialData", { { "a", 2 } } } });

    std::vector<int> seen;
    const auto stage = polling_detail_stage(poller, prompt_for);
    const auto result = stage(
        { "gato", "es" }, [&seen](int p, const json&) { seen.push_back(p); }, {}
    );
    EXPECT_EQ(result, json({ { "a", 2 } }));
    EXPECT_EQ(seen, (std::vector<int> { 40, 100 }));
}

TEST(Stages, StreamingDetailStageReportsSections) {
    fake_transport link;
    backend_client client(link);
    link.stream_reply(
        "/generate-additional-stream",
        { sse_line({ { "type", "section" },
                     { "section", "hint" },
                     { "data", { { "text", "h" } } } }),
          sse_line({ { "type", "section" },
                     { "section", "metrics" },
                     { "data", { { "frequency", 5 } } } }),
          sse_line({ { "type", "complete" },
                     { "data", { { "examples", { { { "textSrc", "x" } } } } } } }) }
    );

    std::vector<int> overall;
    json last;
    const auto stage = streaming_detail_stage(client, prompt_for);
    const auto result = stage(
        { "gato", "es" },
        [&](const int p, const json& partial) {
            overall.push_back(rescale_progress(p, 30));
            last = partial;
        },
        {}
    );
    EXPECT_EQ(overall, (std::vector<int> { 50, 70 }));
    EXPECT_EQ(last["hint"]["text"], "h");
    EXPECT_EQ(last["metrics"]["frequency"], 5);
    EXPECT_EQ(result["hint"]["text"], "h");
    EXPECT_EQ(result["examples"][0]["textSrc"], "x");
}
