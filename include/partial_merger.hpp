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

#ifndef LEXIS_PARTIAL_MERGER_HPP
#define LEXIS_PARTIAL_MERGER_HPP

#include <nlohmann/json.hpp>

namespace lexispace {
/**
 * @brief Whether @p value carries no content.
 *
 * Null, empty strings, empty arrays and empty objects are empty. Numbers
 * and booleans always count as content.
 */
bool is_empty_value(const nlohmann::json& value) noexcept;

/**
 * @brief Fold @p incoming into @p previous.
 *
 * Field-level rules for two objects:
 *  - A field absent from @p incoming keeps its previous value.
 *  - A field whose incoming value is empty (see `is_empty_value`) keeps its
 *    previous value; it is adopted only when the field had no value yet.
 *  - Any other incoming value replaces the previous one wholesale (nested
 *    objects and sequences included).
 *
 * When either side is not an object, a non-empty @p incoming replaces
 * @p previous and an empty one leaves it unchanged.
 *
 * The merge is idempotent: `merge_partial(a, a) == a`.
 */
nlohmann::json
merge_partial(const nlohmann::json& previous, const nlohmann::json& incoming);
}
#endif // LEXIS_PARTIAL_MERGER_HPP
