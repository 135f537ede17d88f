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

#include "result_cache.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <utility>

namespace lexispace {
using namespace std::chrono;

namespace {
    nlohmann::json encode_record(const cache_entry& entry) {
        return {
            { "value", entry.value },
            { "writtenAt",
              duration_cast<milliseconds>(entry.written_at.time_since_epoch())
                  .count() },
            { "ttl", entry.ttl.count() },
        };
    }

    std::optional<cache_entry> decode_record(const std::string& text) {
        const auto record = nlohmann::json::parse(text, nullptr, false);
        if (!record.is_object() || !record.contains("value")) {
            return std::nullopt;
        }
        const auto written = record.find("writtenAt");
        const auto ttl = record.find("ttl");
        if (written == record.end() || !written->is_number_integer()
            || ttl == record.end() || !ttl->is_number_integer()) {
            return std::nullopt;
        }
        return cache_entry {
            record["value"],
            system_clock::time_point(milliseconds(written->get<long long>())),
            seconds(ttl->get<long long>()),
        };
    }
}

std::string
make_cache_key(const std::string_view query, const std::string_view lang) {
    return std::string(lang) + ":" + corespace::normalize_query(query);
}

bool cache_entry::expired(const system_clock::time_point now) const noexcept {
    return now >= written_at + ttl;
}

result_cache::listener_handle::listener_handle(
    std::weak_ptr<listener_table> table, std::string key, const std::size_t id
)
    : table(std::move(table))
    , key(std::move(key))
    , id(id) { }

result_cache::listener_handle::listener_handle(listener_handle&& other) noexcept
    : table(std::move(other.table))
    , key(std::move(other.key))
    , id(std::exchange(other.id, 0)) { }

result_cache::listener_handle&
result_cache::listener_handle::operator=(listener_handle&& other) noexcept {
    if (this != &other) {
        reset();
        table = std::move(other.table);
        key = std::move(other.key);
        id = std::exchange(other.id, 0);
    }
    return *this;
}

result_cache::listener_handle::~listener_handle() { reset(); }

void result_cache::listener_handle::reset() noexcept {
    const auto owner = table.lock();
    if (!owner || id == 0) {
        return;
    }
    std::lock_guard lock(owner->m);
    const auto it = owner->listeners.find(key);
    if (it != owner->listeners.end()) {
        std::erase_if(it->second, [this](const auto& item) {
            return item.first == id;
        });
        if (it->second.empty()) {
            owner->listeners.erase(it);
        }
    }
    id = 0;
    table.reset();
}

result_cache::result_cache(
    std::shared_ptr<key_value_store> durable, cache_options opt
)
    : durable(std::move(durable))
    , opt(std::move(opt))
    , table(std::make_shared<listener_table>()) { }

result_cache::~result_cache() { flush(); }

std::optional<nlohmann::json> result_cache::read_sync(const std::string& key) {
    std::lock_guard lock(m);
    const auto it = entries.find(key);
    if (it == entries.end()) {
        corespace::logger()->debug("cache miss '{}'", key);
        return std::nullopt;
    }
    if (it->second.expired(opt.now())) {
        corespace::logger()->debug("cache entry '{}' expired", key);
        entries.erase(it);
        return std::nullopt;
    }
    corespace::logger()->debug("cache hit '{}'", key);
    return it->second.value;
}

std::optional<nlohmann::json> result_cache::read(const std::string& key) {
    if (auto hit = read_sync(key)) {
        return hit;
    }
    if (!durable) {
        return std::nullopt;
    }

    std::optional<std::string> stored;
    try {
        stored = durable->get(opt.prefix + key);
    } catch (const std::exception& e) {
        corespace::logger()->error("durable read of '{}' failed: {}", key, e.what());
        return std::nullopt;
    }
    if (!stored) {
        return std::nullopt;
    }

    auto entry = decode_record(*stored);
    if (!entry || entry->expired(opt.now())) {
        corespace::logger()->debug("evicting stale durable entry '{}'", key);
        try {
            std::lock_guard lock(durable_m);
            durable->remove(opt.prefix + key);
        } catch (const std::exception& e) {
            corespace::logger()->error(
                "durable eviction of '{}' failed: {}", key, e.what()
            );
        }
        return std::nullopt;
    }

    std::lock_guard lock(m);
    return entries.try_emplace(key, std::move(*entry)).first->second.value;
}

std::future<std::optional<nlohmann::json>>
result_cache::read_async(const std::string& key) {
    return std::async(std::launch::async, [this, key] { return read(key); });
}

void result_cache::write(const std::string& key, nlohmann::json value) {
    cache_entry entry { std::move(value), opt.now(), opt.ttl };
    unsigned long long version = 0;
    {
        std::lock_guard lock(m);
        entries[key] = entry;
        if (durable) {
            auto& ticket = tickets[key];
            version = ++ticket.version;
            ++ticket.pending;
        }
    }
    notify(key, entry.value);

    if (!durable) {
        return;
    }
    drop_finished_writes();
    auto task = std::async(
        std::launch::async, [this, key, entry = std::move(entry), version] {
            std::lock_guard order(durable_m);
            bool latest = false;
            {
                std::lock_guard lock(m);
                latest = tickets[key].version == version;
            }
            if (latest) {
                try {
                    durable->put(opt.prefix + key, encode_record(entry).dump());
                } catch (const std::exception& e) {
                    corespace::logger()->error(
                        "durable write of '{}' failed: {}", key, e.what()
                    );
                }
            }
            std::lock_guard lock(m);
            const auto it = tickets.find(key);
            if (it != tickets.end() && --it->second.pending == 0) {
                tickets.erase(it);
            }
        }
    );
    std::lock_guard lock(pending_m);
    pending_writes.push_back(std::move(task));
}

nlohmann::json
result_cache::update(const std::string& key, const cache_transform& fn) {
    auto guard = key_lock(key);
    nlohmann::json next;
    try {
        std::lock_guard serial(*guard);
        next = fn(read(key));
        write(key, next);
    } catch (...) {
        release_key_lock(key, std::move(guard));
        throw;
    }
    release_key_lock(key, std::move(guard));
    return next;
}

void result_cache::invalidate(const std::string& key) {
    {
        std::lock_guard lock(m);
        entries.erase(key);
        // queued durable writes of this key are now stale
        if (const auto it = tickets.find(key); it != tickets.end()) {
            ++it->second.version;
        }
    }
    if (!durable) {
        return;
    }
    try {
        std::lock_guard order(durable_m);
        durable->remove(opt.prefix + key);
    } catch (const std::exception& e) {
        corespace::logger()->error(
            "durable removal of '{}' failed: {}", key, e.what()
        );
    }
}

void result_cache::flush() {
    std::vector<std::future<void>> waiting;
    {
        std::lock_guard lock(pending_m);
        waiting.swap(pending_writes);
    }
    for (auto& task : waiting) {
        task.get();
    }
}

result_cache::listener_handle
result_cache::subscribe(const std::string& key, cache_listener listener) {
    std::lock_guard lock(table->m);
    const std::size_t id = table->next_id++;
    table->listeners[key].emplace_back(id, std::move(listener));
    return { table, key, id };
}

std::size_t result_cache::size() const {
    std::lock_guard lock(m);
    return entries.size();
}

std::size_t result_cache::tracked_keys() const {
    std::lock_guard lock(m);
    std::size_t count = tickets.size();
    for (const auto& [key, slot] : key_locks) {
        if (!tickets.contains(key)) {
            ++count;
        }
    }
    return count;
}

void result_cache::notify(const std::string& key, const nlohmann::json& value) {
    std::vector<cache_listener> targets;
    {
        std::lock_guard lock(table->m);
        const auto it = table->listeners.find(key);
        if (it == table->listeners.end()) {
            return;
        }
        for (const auto& [id, listener] : it->second) {
            targets.push_back(listener);
        }
    }
    for (const auto& listener : targets) {
        try {
            listener(key, value);
        } catch (const std::exception& e) {
            corespace::logger()->error(
                "cache listener for '{}' failed: {}", key, e.what()
            );
        }
    }
}

std::shared_ptr<std::mutex> result_cache::key_lock(const std::string& key) {
    std::lock_guard lock(m);
    auto& slot = key_locks[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void result_cache::release_key_lock(
    const std::string& key, std::shared_ptr<std::mutex> guard
) {
    std::lock_guard lock(m);
    guard.reset();
    const auto it = key_locks.find(key);
    if (it != key_locks.end() && it->second.use_count() == 1) {
        key_locks.erase(it);
    }
}

void result_cache::drop_finished_writes() {
    std::lock_guard lock(pending_m);
    std::erase_if(pending_writes, [](std::future<void>& task) {
        if (task.wait_for(seconds(0)) != std::future_status::ready) {
            return false;
        }
        task.get();
        return true;
    });
}
}
