// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/schedule.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <fmt/core.h>

namespace dualpipe {

int SchedulePlan::total_iterations() const {
    return std::accumulate(Iterations.begin(), Iterations.end(), 0);
}

SchedulePlan make_schedule_plan(int num_ranks, int pipeline_rank, int num_chunks) {
    if (num_ranks <= 0 || num_ranks % 2 != 0) {
        throw std::invalid_argument(fmt::format("Number of ranks must be even, got {}", num_ranks));
    }
    if (pipeline_rank < 0 || pipeline_rank >= num_ranks) {
        throw std::invalid_argument(fmt::format("Invalid pipeline rank {} for {} ranks", pipeline_rank, num_ranks));
    }
    if (num_chunks <= 0 || num_chunks % 2 != 0 || num_chunks < 2 * num_ranks) {
        throw std::invalid_argument(fmt::format(
            "Number of chunks must be positive, even and at least twice the number of ranks (num_chunks={}, num_ranks={})",
            num_chunks, num_ranks));
    }

    SchedulePlan plan;
    plan.NumRanks = num_ranks;
    plan.NumChunks = num_chunks;
    plan.NumHalfRanks = num_ranks / 2;
    plan.HalfRank = std::min(pipeline_rank, num_ranks - 1 - pipeline_rank);
    plan.HalfNumChunks = num_chunks / 2;

    const int h = plan.HalfRank;
    const int nh = plan.NumHalfRanks;
    plan.Iterations = {
        (nh - h - 1) * 2,                          // nF0
        h + 1,                                     // nF0F1
        nh - h - 1,                                // nB1W1F1
        plan.HalfNumChunks - num_ranks + h + 1,    // nF0B1F1B0
        nh - h - 1,                                // nB1F1B0
        h + 1,                                     // nB1B0
        nh - h - 1,                                // nWB0
        h + 1                                      // nW
    };
    return plan;
}

const char* schedule_phase_name(int phase) {
    switch (phase) {
    case 0: return "nF0";
    case 1: return "nF0F1";
    case 2: return "nB1W1F1";
    case 3: return "nF0B1F1B0";
    case 4: return "nB1F1B0";
    case 5: return "nB1B0";
    case 6: return "nWB0";
    case 7: return "nW";
    default: return "unknown";
    }
}

} // namespace dualpipe
