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

#include "config.hpp"
#include "errors.hpp"
#include "rng.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace lexispace;
using corespace::error_kind;
using corespace::lexis_error;
using nlohmann::json;

namespace {
error_kind config_failure(const json& config) {
    lexis_options options;
    try {
        apply_config(options, config);
    } catch (const lexis_error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected lexis_error for " << config.dump();
    return error_kind::not_found;
}

std::filesystem::path write_temp(const std::string& text) {
    const auto path = std::filesystem::temp_directory_path()
        / ("lexis-config-" + random_hex(12) + ".json");
    std::ofstream(path) << text;
    return path;
}
}

TEST(Config, DefaultsAreUntouchedByEmptyDocument) {
    lexis_options options;
    apply_config(options, json::object());
    EXPECT_EQ(options.backend.base_url, "http://localhost:3000");
    EXPECT_EQ(options.poll.interval, std::chrono::milliseconds(500));
    EXPECT_EQ(options.orchestrator.basic_share, 30);
    EXPECT_EQ(options.orchestrator.mode, detail_mode::polling);
    EXPECT_EQ(options.log_level, "info");
    EXPECT_TRUE(options.storage_dir.empty());
}

TEST(Config, AppliesEverySection) {
    lexis_options options;
    apply_config(
        options,
        {
            { "network", { { "timeout_ms", 1000 }, { "max_retries", 1 },
                           { "retry_max_ms", 400 }, { "user_agent", "test" } } },
            { "backend", { { "base_url", "http://api.local" },
                           { "model_config", { { "temperature", 0.7 } } } } },
            { "poll", { { "interval_ms", 100 }, { "rate_limit_retries", 2 },
                        { "ceiling_ms", 5000 } } },
            { "cache", { { "ttl_seconds", 60 }, { "prefix", "@t:" } } },
            { "orchestrator", { { "basic_share", 40 }, { "detail_mode", "streaming" } } },
            { "storage_dir", "/tmp/lexis" },
            { "dictionary", "dict.json" },
            { "log_level", "debug" },
        }
    );
    EXPECT_EQ(options.network.timeout_ms, 1000);
    EXPECT_EQ(options.network.max_retries, 1);
    EXPECT_EQ(options.network.retry_max_ms, 400);
    EXPECT_EQ(options.network.user_agent, "test");
    EXPECT_EQ(options.network.connect_ms, 3000);
    EXPECT_EQ(options.backend.base_url, "http://api.local");
    EXPECT_EQ(options.backend.model_config["temperature"], 0.7);
    EXPECT_EQ(options.backend.model_config["model"], "gemini-2.5-flash");
    EXPECT_EQ(options.poll.interval, std::chrono::milliseconds(100));
    EXPECT_EQ(options.poll.rate_limit_retries, 2);
    EXPECT_EQ(options.poll.ceiling, std::chrono::milliseconds(5000));
    EXPECT_EQ(options.cache.ttl, std::chrono::seconds(60));
    EXPECT_EQ(options.cache.prefix, "@t:");
    EXPECT_EQ(options.orchestrator.basic_share, 40);
    EXPECT_EQ(options.orchestrator.mode, detail_mode::streaming);
    EXPECT_EQ(options.storage_dir, std::filesystem::path("/tmp/lexis"));
    EXPECT_EQ(options.dictionary_path, std::filesystem::path("dict.json"));
    EXPECT_TRUE(options.fallback_path.empty());
    EXPECT_EQ(options.log_level, "debug");
}

TEST(Config, RejectsMalformedDocuments) {
    EXPECT_EQ(config_failure(json::array()), error_kind::invalid_input);
    EXPECT_EQ(config_failure({ { "network", 5 } }), error_kind::invalid_input);
    EXPECT_EQ(
        config_failure({ { "network", { { "timeout_ms", "fast" } } } }),
        error_kind::invalid_input
    );
    EXPECT_EQ(
        config_failure({ { "network", { { "timeout_ms", 1.5 } } } }),
        error_kind::invalid_input
    );
    EXPECT_EQ(config_failure({ { "log_level", 3 } }), error_kind::invalid_input);
    EXPECT_EQ(
        config_failure({ { "orchestrator", { { "basic_share", 120 } } } }),
        error_kind::invalid_input
    );
    EXPECT_EQ(
        config_failure({ { "orchestrator", { { "detail_mode", "push" } } } }),
        error_kind::invalid_input
    );
}

TEST(Config, DetailModeNames) {
    EXPECT_EQ(parse_detail_mode("polling"), detail_mode::polling);
    EXPECT_EQ(parse_detail_mode("streaming"), detail_mode::streaming);
    EXPECT_THROW((void)parse_detail_mode("Polling"), lexis_error);
}

TEST(Config, LoadFromFile) {
    const auto path = write_temp(R"({"backend":{"base_url":"http://file.local"}})");
    EXPECT_EQ(load_options(path).backend.base_url, "http://file.local");
    std::filesystem::remove(path);
}

TEST(Config, LoadFailures) {
    try {
        (void)load_options("/nonexistent/lexis.json");
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::invalid_input);
    }

    const auto path = write_temp("{ not json");
    try {
        (void)load_options(path);
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::malformed_response);
    }
    std::filesystem::remove(path);
}

TEST(Config, EnvironmentOverrides) {
    lexis_options options;
    ::setenv("LEXIS_BACKEND_URL", "http://env.local", 1);
    ::setenv("LEXIS_LOG_LEVEL", "warn", 1);
    apply_environment(options);
    EXPECT_EQ(options.backend.base_url, "http://env.local");
    EXPECT_EQ(options.log_level, "warn");

    ::setenv("LEXIS_BACKEND_URL", "", 1);
    ::unsetenv("LEXIS_LOG_LEVEL");
    lexis_options untouched;
    apply_environment(untouched);
    EXPECT_EQ(untouched.backend.base_url, "http://localhost:3000");
    EXPECT_EQ(untouched.log_level, "info");
    ::unsetenv("LEXIS_BACKEND_URL");
}
