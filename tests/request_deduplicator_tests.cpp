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

#include "errors.hpp"
#include "request_deduplicator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace lexispace;
using corespace::error_kind;
using corespace::lexis_error;
using namespace std::chrono_literals;

namespace {
/// Factory that blocks until released, then returns its payload.
struct gated_factory {
    std::shared_ptr<std::promise<void>> gate
        = std::make_shared<std::promise<void>>();
    std::shared_future<void> opened = gate->get_future().share();
    std::shared_ptr<std::atomic<int>> calls
        = std::make_shared<std::atomic<int>>(0);

    operation_factory make(nlohmann::json payload) const {
        return [opened = opened, calls = calls,
                payload](const progress_callback&, std::stop_token) {
            ++*calls;
            opened.wait();
            return payload;
        };
    }

    void open() const { gate->set_value(); }
};

/// Block until @p stop is requested.
void wait_for_stop(const std::stop_token& stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait(lock, stop, [] { return false; });
}
}

TEST(RequestDeduplicator, OneFactoryCallForConcurrentCallers) {
    request_deduplicator dedup;
    gated_factory factory;
    const auto work = factory.make({ { "lemma", "gato" } });

    std::vector<subscription> subs;
    for (int i = 0; i < 8; ++i) {
        subs.push_back(dedup.get_or_start("es:gato", work));
    }
    EXPECT_TRUE(subs.front().started_here());
    for (std::size_t i = 1; i < subs.size(); ++i) {
        EXPECT_FALSE(subs[i].started_here());
    }
    EXPECT_EQ(dedup.pending(), 1u);

    factory.open();
    std::vector<std::future<nlohmann::json>> results;
    for (auto& sub : subs) {
        results.push_back(std::async(std::launch::async, [&sub] {
            return sub.get();
        }));
    }
    for (auto& result : results) {
        EXPECT_EQ(result.get()["lemma"], "gato");
    }
    EXPECT_EQ(factory.calls->load(), 1);
}

TEST(RequestDeduplicator, ThreadsRacingForOneKey) {
    request_deduplicator dedup;
    gated_factory factory;
    const auto work = factory.make(42);

    std::atomic<int> joined { 0 };
    std::vector<subscription> subs(6);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < subs.size(); ++i) {
        threads.emplace_back([&, i] {
            subs[i] = dedup.get_or_start("k", work);
            ++joined;
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    ASSERT_EQ(joined.load(), 6);
    factory.open();
    for (auto& sub : subs) {
        EXPECT_EQ(sub.get(), 42);
    }
    EXPECT_EQ(factory.calls->load(), 1);
}

TEST(RequestDeduplicator, DifferentKeysRunSeparately) {
    request_deduplicator dedup;
    gated_factory factory;
    auto a = dedup.get_or_start("es:a", factory.make("a"));
    auto b = dedup.get_or_start("es:b", factory.make("b"));
    EXPECT_TRUE(a.started_here());
    EXPECT_TRUE(b.started_here());
    EXPECT_EQ(dedup.pending(), 2u);
    factory.open();
    EXPECT_EQ(a.get(), "a");
    EXPECT_EQ(b.get(), "b");
    EXPECT_EQ(factory.calls->load(), 2);
}

TEST(RequestDeduplicator, RegistryClearedBeforeOutcomeIsVisible) {
    request_deduplicator dedup;
    gated_factory factory;
    auto first = dedup.get_or_start("k", factory.make(1));
    EXPECT_TRUE(dedup.contains("k"));
    factory.open();
    EXPECT_EQ(first.get(), 1);
    EXPECT_FALSE(dedup.contains("k"));
    EXPECT_EQ(dedup.pending(), 0u);

    auto second = dedup.get_or_start("k", factory.make(2));
    EXPECT_TRUE(second.started_here());
    EXPECT_EQ(second.get(), 2);
    EXPECT_EQ(factory.calls->load(), 2);
}

TEST(RequestDeduplicator, FailureReachesEverySubscriber) {
    request_deduplicator dedup;
    auto gate = std::make_shared<std::promise<void>>();
    std::shared_future<void> opened = gate->get_future().share();
    const operation_factory work
        = [opened](const progress_callback&, std::stop_token) -> nlohmann::json {
        opened.wait();
        throw lexis_error(error_kind::timeout, "too slow");
    };

    auto a = dedup.get_or_start("k", work);
    auto b = dedup.get_or_start("k", work);
    gate->set_value();
    for (auto* sub : { &a, &b }) {
        try {
            (void)sub->get();
            FAIL() << "expected lexis_error";
        } catch (const lexis_error& e) {
            EXPECT_EQ(e.kind(), error_kind::timeout);
        }
    }
    EXPECT_FALSE(dedup.contains("k"));
}

TEST(RequestDeduplicator, LateSubscriberReplaysProgressInOrder) {
    request_deduplicator dedup;
    auto gate = std::make_shared<std::promise<void>>();
    std::shared_future<void> opened = gate->get_future().share();
    const operation_factory work
        = [opened](const progress_callback& report, std::stop_token) {
              report(10, { { "step", 1 } });
              report(40, { { "step", 2 } });
              opened.wait();
              report(80, { { "step", 3 } });
              return nlohmann::json { { "step", 4 } };
          };

    std::mutex m;
    std::vector<int> early_seen;
    std::vector<int> late_seen;
    auto early = dedup.get_or_start("k", work, [&](int p, const nlohmann::json&) {
        std::lock_guard lock(m);
        early_seen.push_back(p);
    });
    ASSERT_EQ(early.next_progress()->progress, 10);
    ASSERT_EQ(early.next_progress()->progress, 40);

    auto late = dedup.get_or_start("k", work, [&](int p, const nlohmann::json&) {
        std::lock_guard lock(m);
        late_seen.push_back(p);
    });
    {
        std::lock_guard lock(m);
        EXPECT_EQ(late_seen, (std::vector<int> { 10, 40 }));
    }

    gate->set_value();
    EXPECT_EQ(early.get()["step"], 4);
    EXPECT_EQ(late.get()["step"], 4);

    std::lock_guard lock(m);
    EXPECT_EQ(early_seen, (std::vector<int> { 10, 40, 80 }));
    EXPECT_EQ(late_seen, (std::vector<int> { 10, 40, 80 }));
}

TEST(RequestDeduplicator, ProgressNeverRegresses) {
    request_deduplicator dedup;
    auto sub = dedup.get_or_start(
        "k",
        [](const progress_callback& report, std::stop_token) {
            report(50, {});
            report(30, {});
            report(50, {});
            report(60, {});
            return nlohmann::json(true);
        }
    );
    std::vector<int> seen;
    while (auto event = sub.next_progress()) {
        seen.push_back(event->progress);
    }
    EXPECT_EQ(seen, (std::vector<int> { 50, 50, 60 }));
    EXPECT_EQ(sub.get(), true);
}

TEST(RequestDeduplicator, LastCancelStopsOperation) {
    request_deduplicator dedup;
    std::promise<void> saw_stop;
    auto stopped = saw_stop.get_future();
    auto sub = dedup.get_or_start(
        "k",
        [&saw_stop](const progress_callback&, std::stop_token stop)
            -> nlohmann::json {
            wait_for_stop(stop);
            saw_stop.set_value();
            throw lexis_error(error_kind::cancelled, "stopped");
        }
    );
    sub.cancel();
    EXPECT_EQ(stopped.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(sub.valid());
    try {
        (void)sub.get();
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::cancelled);
    }
}

TEST(RequestDeduplicator, CancelOfOneSubscriberKeepsOthersRunning) {
    request_deduplicator dedup;
    gated_factory factory;
    const auto work = factory.make("done");
    std::atomic<int> calls_to_leaver { 0 };

    auto stays = dedup.get_or_start("k", work);
    auto leaves = dedup.get_or_start("k", work, [&](int, const nlohmann::json&) {
        ++calls_to_leaver;
    });

    auto blocked = std::async(std::launch::async, [&leaves] {
        return leaves.get();
    });
    std::this_thread::sleep_for(20ms);
    leaves.cancel();
    try {
        (void)blocked.get();
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::cancelled);
    }

    factory.open();
    EXPECT_EQ(stays.get(), "done");
    EXPECT_EQ(calls_to_leaver.load(), 0);
    EXPECT_EQ(factory.calls->load(), 1);
}

TEST(RequestDeduplicator, StoppingOperationIsNotReused) {
    request_deduplicator dedup;
    std::promise<void> release_first;
    auto first_released = release_first.get_future().share();
    std::atomic<int> calls { 0 };
    const operation_factory work
        = [&calls, first_released](const progress_callback&, std::stop_token stop)
        -> nlohmann::json {
        const int n = ++calls;
        if (n == 1) {
            wait_for_stop(stop);
            first_released.wait();
            throw lexis_error(error_kind::cancelled, "stopped");
        }
        return n;
    };

    auto first = dedup.get_or_start("k", work);
    first.cancel();
    auto second = dedup.get_or_start("k", work);
    EXPECT_TRUE(second.started_here());
    release_first.set_value();
    EXPECT_EQ(second.get(), 2);
}

TEST(SharedOperation, JoinRefusesAbandonedOperation) {
    shared_operation op("k");
    op.acquire();
    EXPECT_TRUE(op.join());
    op.release();
    op.release();
    EXPECT_TRUE(op.token().stop_requested());
    EXPECT_FALSE(op.join());

    // last subscriber gone but stop not yet requested
    shared_operation unowned("k");
    EXPECT_FALSE(unowned.join());
    EXPECT_FALSE(unowned.token().stop_requested());

    shared_operation settled("k");
    settled.acquire();
    settled.settle(1);
    EXPECT_FALSE(settled.join());
}

TEST(RequestDeduplicator, ListenerFailureIsContained) {
    request_deduplicator dedup;
    auto sub = dedup.get_or_start(
        "k",
        [](const progress_callback& report, std::stop_token) {
            report(10, {});
            return nlohmann::json("ok");
        },
        [](int, const nlohmann::json&) { throw std::runtime_error("listener"); }
    );
    EXPECT_EQ(sub.get(), "ok");
}
