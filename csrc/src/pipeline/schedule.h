// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_PIPELINE_SCHEDULE_H
#define DUALPIPE_SRC_PIPELINE_SCHEDULE_H

#include <array>

namespace dualpipe {

constexpr int NUM_SCHEDULE_PHASES = 8;

/**
 * @brief Iteration counts of the eight schedule phases for one pipeline rank.
 *
 * Phase i runs Iterations[i] times. The phases are, in order:
 * nF0, nF0F1, nB1W1F1, nF0B1F1B0, nB1F1B0, nB1B0, nWB0, nW.
 */
struct SchedulePlan {
    int NumRanks = 0;
    int NumChunks = 0;
    int HalfRank = 0;
    int NumHalfRanks = 0;
    int HalfNumChunks = 0;
    std::array<int, NUM_SCHEDULE_PHASES> Iterations{};

    [[nodiscard]] int total_iterations() const;
};

/**
 * @brief Computes the schedule of @p pipeline_rank in a pipeline of @p num_ranks.
 *
 * @throws std::invalid_argument unless num_ranks is even and positive, the rank is valid,
 *         and num_chunks is positive, even and at least 2 * num_ranks.
 */
SchedulePlan make_schedule_plan(int num_ranks, int pipeline_rank, int num_chunks);

const char* schedule_phase_name(int phase);

} // namespace dualpipe

#endif //DUALPIPE_SRC_PIPELINE_SCHEDULE_H
