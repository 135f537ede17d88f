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

#include <nlohmann/json.hpp>

namespace corespace {
std::string_view error_kind_name(const error_kind kind) noexcept {
    switch (kind) {
    case error_kind::network:
        return "network";
    case error_kind::rate_limited:
        return "rate_limited";
    case error_kind::task_not_found:
        return "task_not_found";
    case error_kind::timeout:
        return "timeout";
    case error_kind::malformed_response:
        return "malformed_response";
    case error_kind::not_found:
        return "not_found";
    case error_kind::http_status:
        return "http_status";
    case error_kind::remote_failure:
        return "remote_failure";
    case error_kind::cancelled:
        return "cancelled";
    case error_kind::invalid_input:
        return "invalid_input";
    }
    return "unknown";
}

lexis_error::lexis_error(
    const error_kind kind, const std::string& message, const long status
)
    : std::runtime_error(message)
    , code(kind)
    , status_code(status) { }

error_kind lexis_error::kind() const noexcept { return code; }

long lexis_error::status() const noexcept { return status_code; }

error_kind classify(const std::exception_ptr& error) noexcept {
    if (!error) {
        return error_kind::remote_failure;
    }
    try {
        std::rethrow_exception(error);
    } catch (const lexis_error& e) {
        return e.kind();
    } catch (const nlohmann::json::exception&) {
        return error_kind::malformed_response;
    } catch (const std::exception&) {
        return error_kind::remote_failure;
    } catch (...) {
        return error_kind::remote_failure;
    }
}

std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}
}
