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

#ifndef LEXIS_REQUEST_DEDUPLICATOR_HPP
#define LEXIS_REQUEST_DEDUPLICATOR_HPP

#include "task_poller.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lexispace {
/// One progress notification of a shared operation.
struct progress_event {
    int progress = 0;
    nlohmann::json partial;
};

/**
 * @brief Body of a deduplicated operation.
 *
 * Receives a reporter for progress and a stop token raised once every
 * subscriber has cancelled. Its return value (or exception) is the shared
 * outcome.
 */
using operation_factory = std::function<nlohmann::json(
    const progress_callback& report, std::stop_token stop
)>;

/**
 * @class shared_operation
 * @brief State of one in-flight operation shared by all its subscribers.
 *
 * Progress reports are kept in an ordered log; a report lower than the
 * last accepted one is dropped, so the log is non-decreasing. Listeners are
 * called under a dispatch lock: a listener attached late first replays the
 * log, and every listener sees the same order.
 */
class shared_operation {
public:
    explicit shared_operation(std::string key);

    [[nodiscard]] const std::string& key() const noexcept;

    void report(int progress, const nlohmann::json& partial);
    void settle(nlohmann::json value);
    void fail(std::exception_ptr error);

    /**
     * @brief Replay the log into @p listener, then keep it for later
     * reports.
     * @return Id for `detach`; 0 if @p listener is empty.
     */
    std::size_t attach(progress_callback listener);

    /// Stop calling a listener. No call to it is in flight on return,
    /// except from the calling thread itself.
    void detach(std::size_t id);

    void acquire();
    /**
     * @brief `acquire` unless the operation was abandoned or has settled;
     * checked under the same lock `release` takes.
     * @return false if a new operation must be started instead.
     */
    [[nodiscard]] bool join();
    /// Drop one subscriber; the last one leaving an unsettled operation
    /// requests stop.
    void release();
    /// Request stop regardless of subscribers.
    void abort() noexcept;

    [[nodiscard]] std::stop_token token() const noexcept;

    /**
     * @brief Block until settled; return the value or rethrow the failure.
     * @throws lexis_error(cancelled) if @p cancelled is set before
     *         settlement.
     */
    nlohmann::json wait(const std::atomic<bool>& cancelled) const;

    /**
     * @brief Block until the log holds entry @p index or the operation
     * settles.
     * @return The entry, or nullopt once settled with no entry at @p index.
     */
    std::optional<progress_event> event_at(std::size_t index) const;

private:
    const std::string name;

    mutable std::mutex m;
    mutable std::condition_variable cv;
    std::recursive_mutex dispatch;

    std::vector<progress_event> log;
    std::vector<std::pair<std::size_t, progress_callback>> listeners;
    std::size_t next_listener = 1;
    int last_progress = -1;
    bool done = false;
    nlohmann::json value;
    std::exception_ptr error;
    std::size_t count = 0;
    std::stop_source stop;
};

/**
 * @class subscription
 * @brief One caller's handle on a shared operation.
 *
 * Move-only. Destroying or cancelling the handle releases the caller's
 * reference; when the last reference goes, the operation is asked to stop.
 * `cancel` may be called from another thread while `get` is blocked.
 */
class subscription {
public:
    subscription() = default;
    subscription(std::shared_ptr<shared_operation> op, bool origin);
    subscription(subscription&& other) noexcept;
    subscription& operator=(subscription&& other) noexcept;
    subscription(const subscription&) = delete;
    subscription& operator=(const subscription&) = delete;
    ~subscription();

    /**
     * @brief Block for the shared outcome.
     * @throws The operation's failure; lexis_error(cancelled) after
     *         `cancel()`.
     */
    nlohmann::json get();

    /**
     * @brief Next progress event for this subscriber, in operation order.
     *
     * Blocks until an event is available. Returns nullopt once the
     * operation has settled and every event has been consumed.
     */
    std::optional<progress_event> next_progress();

    /// Stop listening. Idempotent.
    void cancel() noexcept;

    /// @return true if this call started the operation.
    [[nodiscard]] bool started_here() const noexcept;
    [[nodiscard]] bool valid() const noexcept;

private:
    std::shared_ptr<shared_operation> op;
    std::size_t cursor = 0;
    bool origin = false;
    std::atomic<bool> cancelled { false };
    std::size_t listener = 0;

    friend class request_deduplicator;
};

/**
 * @class request_deduplicator
 * @brief At most one in-flight operation per key.
 *
 * `get_or_start` attaches to the pending operation for a key, or starts a
 * new one on a worker thread. The registry entry is removed exactly once,
 * before the outcome is published, so a caller that has observed the
 * outcome also observes the empty slot. An operation that is already
 * stopping is not reused.
 *
 * Workers are joined on destruction after every pending operation was
 * asked to stop.
 */
class request_deduplicator {
public:
    request_deduplicator() = default;
    request_deduplicator(const request_deduplicator&) = delete;
    request_deduplicator& operator=(const request_deduplicator&) = delete;
    ~request_deduplicator();

    subscription get_or_start(
        const std::string& key, const operation_factory& factory,
        progress_callback on_progress = {}
    );

    /// @return Number of pending operations.
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] bool contains(const std::string& key) const;

private:
    struct worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void run(
        const std::shared_ptr<shared_operation>& op,
        const operation_factory& factory
    );
    void reap();

    mutable std::mutex m;
    std::unordered_map<std::string, std::shared_ptr<shared_operation>>
        registry;
    std::list<worker> workers;
};
}
#endif // LEXIS_REQUEST_DEDUPLICATOR_HPP
