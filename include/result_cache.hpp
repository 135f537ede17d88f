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

#ifndef LEXIS_RESULT_CACHE_HPP
#define LEXIS_RESULT_CACHE_HPP

#include "key_value_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lexispace {
/**
 * @brief Cache key of a query in a target language.
 *
 * The query is normalized (see `corespace::normalize_query`), so spelling
 * variants that differ only in case or spacing share an entry.
 */
std::string make_cache_key(std::string_view query, std::string_view lang);

using wall_clock_fn = std::function<std::chrono::system_clock::time_point()>;

/**
 * @struct cache_options
 * @brief Lifetime of entries and naming inside the durable store.
 */
struct cache_options {
    std::chrono::seconds ttl { std::chrono::hours(24 * 7) };
    std::string prefix = "@lexis:"; ///< Prepended to keys in the store.
    wall_clock_fn now = [] { return std::chrono::system_clock::now(); };
};

struct cache_entry {
    nlohmann::json value;
    std::chrono::system_clock::time_point written_at;
    std::chrono::seconds ttl { 0 };

    [[nodiscard]] bool
    expired(std::chrono::system_clock::time_point now) const noexcept;
};

/// Called after every write to a subscribed key.
using cache_listener
    = std::function<void(const std::string& key, const nlohmann::json& value)>;

/// Derives the next value from the current one (nullopt when absent).
using cache_transform = std::function<nlohmann::json(
    const std::optional<nlohmann::json>& current
)>;

/**
 * @class result_cache
 * @brief Key to JSON cache with TTL, a memory layer and an optional durable
 * store.
 *
 * Reads:
 *  - `read_sync` consults memory only.
 *  - `read` falls back to the durable store and promotes hits into memory.
 *  - `read_async` runs `read` on another thread.
 * Expired entries read as absent and are evicted from both layers.
 *
 * Writes update memory immediately; the durable copy is written in the
 * background. Durable writes of one key land in write order, and their
 * failures are logged, never thrown. `flush` waits for all of them.
 *
 * `update` is the read-modify-write path. It is serialized per key, so
 * concurrent enrichments of one entry never lose each other's changes.
 * Plain `write` is last-writer-wins.
 */
class result_cache {
    struct listener_table;

public:
    /**
     * @class listener_handle
     * @brief Keeps a listener registered; unsubscribes when destroyed.
     *
     * Safe to outlive the cache.
     */
    class listener_handle {
    public:
        listener_handle() = default;
        listener_handle(
            std::weak_ptr<listener_table> table, std::string key,
            std::size_t id
        );
        listener_handle(listener_handle&& other) noexcept;
        listener_handle& operator=(listener_handle&& other) noexcept;
        listener_handle(const listener_handle&) = delete;
        listener_handle& operator=(const listener_handle&) = delete;
        ~listener_handle();

        void reset() noexcept;

    private:
        std::weak_ptr<listener_table> table;
        std::string key;
        std::size_t id = 0;
    };

    explicit result_cache(
        std::shared_ptr<key_value_store> durable = nullptr,
        cache_options opt = {}
    );
    result_cache(const result_cache&) = delete;
    result_cache& operator=(const result_cache&) = delete;
    ~result_cache();

    std::optional<nlohmann::json> read_sync(const std::string& key);
    std::optional<nlohmann::json> read(const std::string& key);
    std::future<std::optional<nlohmann::json>>
    read_async(const std::string& key);

    void write(const std::string& key, nlohmann::json value);

    /**
     * @brief Serialized read-modify-write of one entry.
     * @return The value written.
     */
    nlohmann::json update(const std::string& key, const cache_transform& fn);

    void invalidate(const std::string& key);

    /// Wait until every background durable write has finished.
    void flush();

    [[nodiscard]] listener_handle
    subscribe(const std::string& key, cache_listener listener);

    /// @return Number of entries held in memory (expired ones included).
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Keys with per-key bookkeeping alive: an `update` in progress
     * or a durable write still pending.
     */
    [[nodiscard]] std::size_t tracked_keys() const;

private:
    struct listener_table {
        std::mutex m;
        std::size_t next_id = 1;
        std::unordered_map<
            std::string,
            std::vector<std::pair<std::size_t, cache_listener>>>
            listeners;
    };

    /// Latest durable write of a key and how many writes are still queued.
    struct write_ticket {
        unsigned long long version = 0;
        std::size_t pending = 0;
    };

    void notify(const std::string& key, const nlohmann::json& value);
    std::shared_ptr<std::mutex> key_lock(const std::string& key);
    void release_key_lock(const std::string& key, std::shared_ptr<std::mutex> guard);
    void drop_finished_writes();

    const std::shared_ptr<key_value_store> durable;
    const cache_options opt;

    mutable std::mutex m;
    std::unordered_map<std::string, cache_entry> entries;
    std::unordered_map<std::string, write_ticket> tickets;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_locks;

    std::mutex durable_m;
    std::mutex pending_m;
    std::vector<std::future<void>> pending_writes;

    std::shared_ptr<listener_table> table;
};
}
#endif // LEXIS_RESULT_CACHE_HPP
