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

#ifndef LEXIS_LOGGING_HPP
#define LEXIS_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace corespace {
/**
 * @brief Process-wide "lexis" logger.
 *
 * Created on first use with a thread-safe colored stderr sink at level
 * `info`. If a logger with that name was already registered with spdlog
 * (for example by an embedding application) it is reused as-is.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the "lexis" logger by name.
 *
 * Accepted names: trace, debug, info, warn, error, off.
 *
 * @throws lexis_error(invalid_input) for any other name.
 */
void set_log_level(std::string_view level);
}
#endif // LEXIS_LOGGING_HPP
