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

#include "key_value_store.hpp"
#include "rng.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace lexispace {
std::optional<std::string> memory_store::get(const std::string& key) {
    std::lock_guard lock(m);
    const auto it = items.find(key);
    if (it == items.end()) {
        return std::nullopt;
    }
    return it->second;
}

void memory_store::put(const std::string& key, const std::string& value) {
    std::lock_guard lock(m);
    items[key] = value;
}

void memory_store::remove(const std::string& key) {
    std::lock_guard lock(m);
    items.erase(key);
}

std::size_t memory_store::size() const {
    std::lock_guard lock(m);
    return items.size();
}

file_store::file_store(std::filesystem::path dir)
    : dir(std::move(dir)) {
    std::filesystem::create_directories(this->dir);
}

const std::filesystem::path& file_store::directory() const noexcept {
    return dir;
}

std::filesystem::path file_store::path_for(const std::string& key) const {
    static constexpr char digits[] = "0123456789abcdef";
    // stays below NAME_MAX
    static constexpr std::size_t max_hex = 160;
    std::string name;
    name.reserve(std::min(key.size() * 2, max_hex) + 22);
    for (const char c : key) {
        if (name.size() >= max_hex) {
            break;
        }
        const auto byte = static_cast<unsigned char>(c);
        name.push_back(digits[byte >> 4]);
        name.push_back(digits[byte & 0x0F]);
    }
    if (key.size() * 2 > max_hex) {
        std::uint64_t hash = 14695981039346656037ULL;
        for (const char c : key) {
            hash ^= static_cast<unsigned char>(c);
            hash *= 1099511628211ULL;
        }
        name.push_back('-');
        for (int shift = 60; shift >= 0; shift -= 4) {
            name.push_back(digits[(hash >> shift) & 0x0F]);
        }
    }
    name += ".json";
    return dir / name;
}

std::optional<std::string> file_store::get(const std::string& key) {
    std::ifstream in(path_for(key), std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

void file_store::put(const std::string& key, const std::string& value) {
    const auto target = path_for(key);
    auto temp = target;
    temp += ".tmp-" + random_hex(8);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + temp.string());
        }
        out.write(value.data(), static_cast<std::streamsize>(value.size()));
        if (!out) {
            throw std::runtime_error("cannot write " + temp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw std::filesystem::filesystem_error("rename", temp, target, ec);
    }
}

void file_store::remove(const std::string& key) {
    std::filesystem::remove(path_for(key));
}
}
