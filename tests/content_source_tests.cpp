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

#include "content_source.hpp"
#include "errors.hpp"
#include "rng.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace lexispace;
using corespace::error_kind;
using corespace::lexis_error;
using nlohmann::json;

TEST(StaticDataset, KeysAreNormalized) {
    const static_dataset data(json { { "  Gato   Negro ", 1 }, { "perro", 2 } });
    EXPECT_EQ(data.size(), 2u);
    EXPECT_EQ(data.find("gato negro", "es"), json(1));
    EXPECT_EQ(data.find("GATO NEGRO", "pt"), json(1));
    EXPECT_FALSE(data.find("gato", "es"));
    EXPECT_FALSE(data.find("   ", "es"));
}

TEST(StaticDataset, BoundToLanguage) {
    const static_dataset data(json { { "gato", 1 } }, "es");
    EXPECT_TRUE(data.find("gato", "es"));
    EXPECT_FALSE(data.find("gato", "pt"));
}

TEST(StaticDataset, SubstringMatchPrefersExactKey) {
    const static_dataset data(json { { "gato negro", 1 }, { "gato", 2 } }, {}, true);
    EXPECT_EQ(data.find("gato", "es"), json(2));
    EXPECT_EQ(data.find("negro", "es"), json(1));
    EXPECT_FALSE(data.find("perro", "es"));
}

TEST(StaticDataset, RejectsNonObject) {
    EXPECT_THROW(static_dataset(json::array()), lexis_error);
}

TEST(StaticDataset, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path()
        / ("lexis-dataset-" + random_hex(12) + ".json");
    std::ofstream(path) << R"({"Gato": {"headword": {"lemma": "gato"}}})";
    const auto data = static_dataset::load(path, "es");
    EXPECT_EQ((*data.find("gato", "es"))["headword"]["lemma"], "gato");

    std::ofstream(path) << "[broken";
    try {
        (void)static_dataset::load(path);
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::malformed_response);
    }
    std::filesystem::remove(path);

    try {
        (void)static_dataset::load(path);
        FAIL() << "expected lexis_error";
    } catch (const lexis_error& e) {
        EXPECT_EQ(e.kind(), error_kind::invalid_input);
    }
}
