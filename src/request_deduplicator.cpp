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

#include "request_deduplicator.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <utility>

namespace lexispace {
shared_operation::shared_operation(std::string key)
    : name(std::move(key)) { }

const std::string& shared_operation::key() const noexcept { return name; }

void shared_operation::report(
    const int progress, const nlohmann::json& partial
) {
    std::lock_guard order(dispatch);
    std::vector<std::pair<std::size_t, progress_callback>> targets;
    progress_event event { progress, partial };
    {
        std::lock_guard lock(m);
        if (done || progress < last_progress) {
            return;
        }
        last_progress = progress;
        log.push_back(event);
        targets = listeners;
    }
    cv.notify_all();
    const auto attached = [this](const std::size_t id) {
        std::lock_guard lock(m);
        return std::ranges::any_of(listeners, [id](const auto& entry) {
            return entry.first == id;
        });
    };
    for (const auto& [id, listener] : targets) {
        if (!attached(id)) {
            continue;
        }
        try {
            listener(event.progress, event.partial);
        } catch (const std::exception& e) {
            corespace::logger()->error(
                "progress listener for '{}' failed: {}", name, e.what()
            );
        }
    }
}

void shared_operation::settle(nlohmann::json result) {
    {
        std::lock_guard lock(m);
        if (done) {
            return;
        }
        value = std::move(result);
        done = true;
    }
    cv.notify_all();
}

void shared_operation::fail(std::exception_ptr failure) {
    {
        std::lock_guard lock(m);
        if (done) {
            return;
        }
        error = std::move(failure);
        done = true;
    }
    cv.notify_all();
}

std::size_t shared_operation::attach(progress_callback listener) {
    if (!listener) {
        return 0;
    }
    std::lock_guard order(dispatch);
    std::vector<progress_event> replay;
    std::size_t id = 0;
    {
        std::lock_guard lock(m);
        replay = log;
        id = next_listener++;
        listeners.emplace_back(id, listener);
    }
    for (const auto& event : replay) {
        try {
            listener(event.progress, event.partial);
        } catch (const std::exception& e) {
            corespace::logger()->error(
                "progress listener for '{}' failed: {}", name, e.what()
            );
        }
    }
    return id;
}

void shared_operation::detach(const std::size_t id) {
    if (id == 0) {
        return;
    }
    std::lock_guard order(dispatch);
    std::lock_guard lock(m);
    std::erase_if(listeners, [id](const auto& entry) {
        return entry.first == id;
    });
}

void shared_operation::acquire() {
    std::lock_guard lock(m);
    ++count;
}

bool shared_operation::join() {
    std::lock_guard lock(m);
    if (count == 0 || done || stop.stop_requested()) {
        return false;
    }
    ++count;
    return true;
}

void shared_operation::release() {
    bool abandon = false;
    {
        std::lock_guard lock(m);
        if (count > 0) {
            --count;
        }
        abandon = (count == 0 && !done);
    }
    cv.notify_all();
    if (abandon) {
        corespace::logger()->info("'{}' abandoned by every subscriber", name);
        stop.request_stop();
    }
}

std::stop_token shared_operation::token() const noexcept {
    return stop.get_token();
}

void shared_operation::abort() noexcept { stop.request_stop(); }

nlohmann::json shared_operation::wait(const std::atomic<bool>& cancelled) const {
    std::unique_lock lock(m);
    cv.wait(lock, [&] { return done || cancelled.load(); });
    if (!done) {
        throw corespace::lexis_error(
            corespace::error_kind::cancelled, "subscription was cancelled"
        );
    }
    if (error) {
        std::rethrow_exception(error);
    }
    return value;
}

std::optional<progress_event>
shared_operation::event_at(const std::size_t index) const {
    std::unique_lock lock(m);
    cv.wait(lock, [&] { return done || index < log.size(); });
    if (index < log.size()) {
        return log[index];
    }
    return std::nullopt;
}

subscription::subscription(
    std::shared_ptr<shared_operation> op, const bool origin
)
    : op(std::move(op))
    , origin(origin) { }

subscription::subscription(subscription&& other) noexcept
    : op(std::move(other.op))
    , cursor(other.cursor)
    , origin(other.origin)
    , cancelled(other.cancelled.exchange(true))
    , listener(std::exchange(other.listener, 0)) { }

subscription& subscription::operator=(subscription&& other) noexcept {
    if (this != &other) {
        cancel();
        op = std::move(other.op);
        cursor = other.cursor;
        origin = other.origin;
        cancelled = other.cancelled.exchange(true);
        listener = std::exchange(other.listener, 0);
    }
    return *this;
}

subscription::~subscription() { cancel(); }

nlohmann::json subscription::get() {
    if (!op || cancelled) {
        throw corespace::lexis_error(
            corespace::error_kind::cancelled, "subscription was cancelled"
        );
    }
    return op->wait(cancelled);
}

std::optional<progress_event> subscription::next_progress() {
    if (!op || cancelled) {
        return std::nullopt;
    }
    auto event = op->event_at(cursor);
    if (event) {
        ++cursor;
    }
    return event;
}

void subscription::cancel() noexcept {
    if (op && !cancelled.exchange(true)) {
        op->detach(listener);
        op->release();
    }
}

bool subscription::started_here() const noexcept { return origin; }

bool subscription::valid() const noexcept { return op && !cancelled; }

request_deduplicator::~request_deduplicator() {
    std::list<worker> remaining;
    {
        std::lock_guard lock(m);
        for (const auto& [key, op] : registry) {
            op->abort();
        }
        remaining.swap(workers);
    }
    for (auto& w : remaining) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

subscription request_deduplicator::get_or_start(
    const std::string& key, const operation_factory& factory,
    progress_callback on_progress
) {
    std::shared_ptr<shared_operation> op;
    bool origin = false;
    {
        std::lock_guard lock(m);
        reap();
        const auto it = registry.find(key);
        if (it != registry.end() && it->second->join()) {
            op = it->second;
            corespace::logger()->debug("joined pending operation '{}'", key);
        } else {
            op = std::make_shared<shared_operation>(key);
            op->acquire();
            registry[key] = op;
            origin = true;
            auto finished = std::make_shared<std::atomic<bool>>(false);
            workers.push_back(
                { std::thread([this, op, factory, finished] {
                      run(op, factory);
                      finished->store(true);
                  }),
                  finished }
            );
            corespace::logger()->debug("started operation '{}'", key);
        }
    }
    subscription handle(op, origin);
    handle.listener = op->attach(std::move(on_progress));
    return handle;
}

void request_deduplicator::run(
    const std::shared_ptr<shared_operation>& op,
    const operation_factory& factory
) {
    nlohmann::json value;
    std::exception_ptr failure;
    try {
        value = factory(
            [&op](const int progress, const nlohmann::json& partial) {
                op->report(progress, partial);
            },
            op->token()
        );
    } catch (...) {
        // handed to every subscriber through wait(cancelled)
        failure = std::current_exception();
    }
    {
        std::lock_guard lock(m);
        const auto it = registry.find(op->key());
        if (it != registry.end() && it->second == op) {
            registry.erase(it);
        }
    }
    if (failure) {
        corespace::logger()->debug(
            "operation '{}' failed: {}", op->key(), corespace::describe(failure)
        );
        op->fail(failure);
    } else {
        op->settle(std::move(value));
    }
}

void request_deduplicator::reap() {
    for (auto it = workers.begin(); it != workers.end();) {
        if (it->finished->load()) {
            it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t request_deduplicator::pending() const {
    std::lock_guard lock(m);
    return registry.size();
}

bool request_deduplicator::contains(const std::string& key) const {
    std::lock_guard lock(m);
    return registry.contains(key);
}
}
