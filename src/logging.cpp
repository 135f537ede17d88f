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

#include "logging.hpp"
#include "errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace corespace {
namespace {
    std::once_flag logger_once;
    std::shared_ptr<spdlog::logger> shared_logger;

    void create_logger() {
        shared_logger = spdlog::get("lexis");
        if (!shared_logger) {
            shared_logger = spdlog::stderr_color_mt("lexis");
            shared_logger->set_level(spdlog::level::info);
        }
    }
}

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(logger_once, create_logger);
    return shared_logger;
}

void set_log_level(const std::string_view level) {
    spdlog::level::level_enum parsed;
    if (level == "trace") {
        parsed = spdlog::level::trace;
    } else if (level == "debug") {
        parsed = spdlog::level::debug;
    } else if (level == "info") {
        parsed = spdlog::level::info;
    } else if (level == "warn") {
        parsed = spdlog::level::warn;
    } else if (level == "error") {
        parsed = spdlog::level::err;
    } else if (level == "off") {
        parsed = spdlog::level::off;
    } else {
        throw lexis_error(
            error_kind::invalid_input,
            "unknown log level: " + std::string(level)
        );
    }
    logger()->set_level(parsed);
}
}
