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

#ifndef LEXIS_ERRORS_HPP
#define LEXIS_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace corespace {
/**
 * @brief Failure classification shared by every layer.
 *
 * Transport-level kinds (`network`, `rate_limited`, `task_not_found`,
 * `timeout`) are retried or reclassified close to their origin; `not_found`
 * is the business outcome surfaced to callers once every source is
 * exhausted.
 */
enum class error_kind {
    network, ///< Connection failed or reset.
    rate_limited, ///< HTTP 429 after the soft retry budget.
    task_not_found, ///< HTTP 404 on a task status poll.
    timeout, ///< Wall-clock ceiling exceeded.
    malformed_response, ///< Payload is not the expected JSON shape.
    not_found, ///< No source has the requested entity.
    http_status, ///< Any other non-2xx status.
    remote_failure, ///< The remote task reported an error.
    cancelled, ///< Every subscriber abandoned the operation.
    invalid_input ///< Caller-supplied argument rejected.
};

/**
 * @brief Stable lowercase name of @p kind ("rate_limited", "timeout", ...).
 */
std::string_view error_kind_name(error_kind kind) noexcept;

/**
 * @class lexis_error
 * @brief Typed failure carrying an `error_kind` and, when the failure came
 * from an HTTP exchange, the status code.
 */
class lexis_error : public std::runtime_error {
public:
    lexis_error(error_kind kind, const std::string& message, long status = 0);

    [[nodiscard]] error_kind kind() const noexcept;
    /// @return HTTP status, or 0 when the failure did not come from HTTP.
    [[nodiscard]] long status() const noexcept;

private:
    error_kind code;
    long status_code;
};

/**
 * @brief Classify an arbitrary captured exception.
 *
 * `lexis_error` keeps its own kind, `nlohmann::json::exception` maps to
 * `malformed_response`, everything else to `remote_failure`.
 */
error_kind classify(const std::exception_ptr& error) noexcept;

/**
 * @brief Human-readable message of a captured exception.
 */
std::string describe(const std::exception_ptr& error);
}
#endif // LEXIS_ERRORS_HPP
