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

#include "partial_merger.hpp"

namespace lexispace {
bool is_empty_value(const nlohmann::json& value) noexcept {
    if (value.is_null()) {
        return true;
    }
    if (value.is_string()) {
        return value.get_ref<const std::string&>().empty();
    }
    if (value.is_array() || value.is_object()) {
        return value.empty();
    }
    return false;
}

nlohmann::json
merge_partial(const nlohmann::json& previous, const nlohmann::json& incoming) {
    if (!previous.is_object() || !incoming.is_object()) {
        return is_empty_value(incoming) ? previous : incoming;
    }

    nlohmann::json merged = previous;
    for (const auto& [field, value] : incoming.items()) {
        const auto it = merged.find(field);
        if (it == merged.end()) {
            merged[field] = value;
            continue;
        }
        if (is_empty_value(value)) {
            continue;
        }
        *it = value;
    }
    return merged;
}
}
