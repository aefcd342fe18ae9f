// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

#include "utilities/tensor.h"
#include "test_utils.h"

using namespace testing_utils;

TEST_CASE("dtype names round-trip and unknown names throw", "[tensor][dtype]") {
    REQUIRE(dtype_from_str("FP32") == ETensorDType::FP32);
    REQUIRE(dtype_from_str("double") == ETensorDType::FP64);
    REQUIRE(std::string(dtype_to_str(ETensorDType::INT64)) == "int64");
    REQUIRE(get_dtype_size(ETensorDType::FP64) == 8);
    REQUIRE_THROWS_AS(dtype_from_str("bf17"), std::runtime_error);
}

TEST_CASE("allocate returns zeroed owning storage", "[tensor]") {
    Tensor t = Tensor::allocate(ETensorDType::FP32, {3, 4});
    REQUIRE(t.Rank == 2);
    REQUIRE(t.nelem() == 12);
    REQUIRE(t.bytes() == 48);
    REQUIRE_FALSE(t.is_view());
    for (float v : to_vector(t)) {
        REQUIRE(v == 0.f);
    }
    REQUIRE_THROWS_AS(t.get<double>(), std::logic_error);
}

TEST_CASE("slice along dim 0 is a view", "[tensor]") {
    Tensor t = iota_tensor({4, 2});
    Tensor s = slice(t, 0, 1, 3);
    REQUIRE(s.is_view());
    REQUIRE(s.Sizes[0] == 2);
    REQUIRE(to_vector(s) == std::vector<float>{2, 3, 4, 5});
    REQUIRE_THROWS_AS(slice(t, 1, 0, 1), std::logic_error);
    REQUIRE_THROWS_AS(slice(t, 0, 2, 5), std::logic_error);
}

TEST_CASE("scatter and gather along the batch dimension", "[tensor][scatter]") {
    Tensor t = iota_tensor({6, 2});
    auto chunks = scatter({t, Tensor{}}, 3, 0);
    REQUIRE(chunks.size() == 3);
    for (const auto& chunk : chunks) {
        REQUIRE(chunk.size() == 2);
        REQUIRE(chunk[0].is_view());
        REQUIRE(chunk[0].Sizes[0] == 2);
        REQUIRE(chunk[1].is_null());
    }
    REQUIRE(to_vector(chunks[2][0]) == std::vector<float>{8, 9, 10, 11});

    TensorList merged = gather(chunks, 0);
    REQUIRE(merged.size() == 2);
    REQUIRE(merged[1].is_null());
    REQUIRE(to_vector(merged[0]) == to_vector(t));
}

TEST_CASE("scatter along an inner dimension copies", "[tensor][scatter]") {
    Tensor t = iota_tensor({2, 4});
    auto chunks = scatter({t}, 2, 1);
    REQUIRE_FALSE(chunks[0][0].is_view());
    REQUIRE(to_vector(chunks[0][0]) == std::vector<float>{0, 1, 4, 5});
    REQUIRE(to_vector(chunks[1][0]) == std::vector<float>{2, 3, 6, 7});
    REQUIRE(to_vector(gather(chunks, 1)[0]) == to_vector(t));
}

TEST_CASE("scatter rejects uneven splits and bad arguments", "[tensor][scatter]") {
    Tensor t = iota_tensor({5, 2});
    REQUIRE_THROWS_AS(scatter({t}, 2, 0), std::runtime_error);
    REQUIRE_THROWS_AS(scatter({t}, 0, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(scatter({t}, 5, 3), std::invalid_argument);
    REQUIRE(scatter({}, 4, 0).size() == 4);
}

TEST_CASE("gather rejects inconsistent chunks", "[tensor][scatter]") {
    std::vector<TensorList> chunks = {{iota_tensor({2, 3})}, {iota_tensor({2, 4})}};
    REQUIRE_THROWS_AS(gather(chunks, 0), std::invalid_argument);
    chunks = {{iota_tensor({2, 3})}, {}};
    REQUIRE_THROWS_AS(gather(chunks, 0), std::invalid_argument);
}

TEST_CASE("release frees owning tensors and refuses views", "[tensor]") {
    Tensor t = iota_tensor({4, 2});
    Tensor view = slice(t, 0, 0, 2);
    REQUIRE_THROWS_AS(release(view), std::logic_error);

    Tensor alias = t;
    release(t);
    REQUIRE(t.is_null());
    // other holders keep the memory alive
    REQUIRE(to_vector(alias)[7] == 7.f);
}
