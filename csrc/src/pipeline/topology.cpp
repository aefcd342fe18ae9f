// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/topology.h"

#include <stdexcept>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace dualpipe {

PipelineTopology::PipelineTopology(int num_ranks, int comm_rank, const std::vector<int>& rank_mapping) :
    mNumRanks(num_ranks), mCommRank(comm_rank)
{
    if (num_ranks < 2 || num_ranks % 2 != 0) {
        throw std::invalid_argument(fmt::format("Number of ranks must be even and at least 2, got {}", num_ranks));
    }
    if (comm_rank < 0 || comm_rank >= num_ranks) {
        throw std::invalid_argument(fmt::format("Rank {} is outside of a pipeline with {} ranks", comm_rank, num_ranks));
    }

    std::vector<int> mapping = rank_mapping;
    if (mapping.empty()) {
        mapping.resize(num_ranks);
        for (int i = 0; i < num_ranks; ++i) {
            mapping[i] = i;
        }
    }
    if (static_cast<int>(mapping.size()) != num_ranks) {
        throw std::invalid_argument(fmt::format("Rank mapping has {} entries, expected {}", mapping.size(), num_ranks));
    }

    mInverse.assign(num_ranks, -1);
    for (int i = 0; i < num_ranks; ++i) {
        int p = mapping[i];
        if (p < 0 || p >= num_ranks || mInverse[p] != -1) {
            throw std::invalid_argument(fmt::format("Rank mapping [{}] is not a permutation of 0..{}", fmt::join(mapping, ", "), num_ranks - 1));
        }
        mInverse[p] = i;
    }

    mRank = mapping[comm_rank];
    mFirstRank = mInverse[0];
    mLastRank = mInverse[num_ranks - 1];
    if (mRank > 0) {
        mPrevRank = mInverse[mRank - 1];
    }
    if (mRank < num_ranks - 1) {
        mNextRank = mInverse[mRank + 1];
    }
}

int PipelineTopology::to_comm_rank(int pipeline_rank) const {
    return mInverse.at(pipeline_rank);
}

} // namespace dualpipe
