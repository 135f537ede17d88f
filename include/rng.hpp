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

#ifndef LEXIS_RNG_HPP
#define LEXIS_RNG_HPP

#include <cstddef>
#include <random>
#include <string>

/**
 * @brief Per-thread 64-bit Mersenne Twister seeded from `std::random_device`.
 *
 * Each thread owns its generator, so callers never synchronize.
 */
std::mt19937_64& rng();

/**
 * @brief Uniform integer in the closed range [@p lo, @p hi].
 *
 * Used for backoff jitter. Returns @p lo when @p hi is not above it.
 */
long long random_between(long long lo, long long hi);

/**
 * @brief Random lowercase hexadecimal string of length @p n, for unique
 *        temporary file names.
 */
std::string random_hex(std::size_t n);

#endif // LEXIS_RNG_HPP
