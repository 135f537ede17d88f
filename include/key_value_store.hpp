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

#ifndef LEXIS_KEY_VALUE_STORE_HPP
#define LEXIS_KEY_VALUE_STORE_HPP

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace lexispace {
/**
 * @class key_value_store
 * @brief Durable string store behind the result cache.
 *
 * Implementations must be safe for concurrent use and report I/O failures
 * by throwing.
 */
class key_value_store {
public:
    virtual ~key_value_store() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
};

/// In-process store, used in tests and when no directory is configured.
class memory_store final : public key_value_store {
public:
    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex m;
    std::unordered_map<std::string, std::string> items;
};

/**
 * @class file_store
 * @brief One file per key under a directory.
 *
 * File names are the hex encoding of the key; long keys are truncated and
 * suffixed with a 64-bit hash of the whole key. Writes go to a uniquely named
 * temporary file that is renamed over the target, so a reader sees either
 * the old or the new content.
 */
class file_store final : public key_value_store {
public:
    /// @throws std::filesystem::filesystem_error if @p dir cannot be created.
    explicit file_store(std::filesystem::path dir);

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept;

private:
    [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;

    const std::filesystem::path dir;
};
}
#endif // LEXIS_KEY_VALUE_STORE_HPP
