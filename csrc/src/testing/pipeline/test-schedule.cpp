// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <array>
#include <stdexcept>
#include <string>

#include "pipeline/schedule.h"

using dualpipe::make_schedule_plan;
using dualpipe::SchedulePlan;

TEST_CASE("schedule: iteration counts for four ranks", "[pipeline][schedule]") {
    SchedulePlan outer = make_schedule_plan(4, 0, 8);
    REQUIRE(outer.HalfRank == 0);
    REQUIRE(outer.NumHalfRanks == 2);
    REQUIRE(outer.HalfNumChunks == 4);
    REQUIRE(outer.Iterations == std::array<int, 8>{2, 1, 1, 1, 1, 1, 1, 1});

    SchedulePlan inner = make_schedule_plan(4, 1, 8);
    REQUIRE(inner.HalfRank == 1);
    REQUIRE(inner.Iterations == std::array<int, 8>{0, 2, 0, 2, 0, 2, 0, 2});

    // mirrored ranks run the same program
    REQUIRE(make_schedule_plan(4, 3, 8).Iterations == outer.Iterations);
    REQUIRE(make_schedule_plan(4, 2, 8).Iterations == inner.Iterations);
}

TEST_CASE("schedule: every rank computes each chunk once per direction", "[pipeline][schedule]") {
    const int N = GENERATE(2, 4, 6, 8);
    const int extra = GENERATE(0, 2, 6);
    const int C = 2 * N + extra;

    for (int r = 0; r < N; ++r) {
        SchedulePlan p = make_schedule_plan(N, r, C);
        const auto& n = p.Iterations;
        for (int v : n) {
            REQUIRE(v >= 0);
        }

        const int forwards = n[0] + 2 * n[1] + n[2] + 2 * n[3] + n[4];
        const int backwards = n[2] + 2 * n[3] + 2 * n[4] + 2 * n[5] + n[6];
        const int weights = n[2] + n[6] + n[7];
        REQUIRE(forwards == C);
        REQUIRE(backwards == C);
        REQUIRE(weights == N - p.HalfRank - 1);
    }
}

TEST_CASE("schedule: invalid arguments", "[pipeline][schedule]") {
    REQUIRE_THROWS_AS(make_schedule_plan(3, 0, 8), std::invalid_argument);
    REQUIRE_THROWS_AS(make_schedule_plan(4, 4, 8), std::invalid_argument);
    REQUIRE_THROWS_AS(make_schedule_plan(4, 0, 7), std::invalid_argument);
    REQUIRE_THROWS_AS(make_schedule_plan(4, 0, 6), std::invalid_argument);
    REQUIRE_THROWS_AS(make_schedule_plan(4, 0, 0), std::invalid_argument);
}

TEST_CASE("schedule: phase names", "[pipeline][schedule]") {
    REQUIRE(std::string(dualpipe::schedule_phase_name(0)) == "nF0");
    REQUIRE(std::string(dualpipe::schedule_phase_name(3)) == "nF0B1F1B0");
    REQUIRE(std::string(dualpipe::schedule_phase_name(7)) == "nW");
    REQUIRE(make_schedule_plan(4, 0, 8).total_iterations() == 9);
}
