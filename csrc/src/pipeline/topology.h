// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_PIPELINE_TOPOLOGY_H
#define DUALPIPE_SRC_PIPELINE_TOPOLOGY_H

#include <vector>

namespace dualpipe {

/**
 * @brief Position of one participant in a bidirectional pipeline.
 *
 * Pipeline ranks are the logical positions 0..N-1 along the pipeline; communicator
 * ranks are the ids used by the transport. An optional rank mapping assigns each
 * communicator rank its pipeline rank. All neighbor accessors return communicator
 * ranks, or -1 where no neighbor exists.
 */
class PipelineTopology {
public:
    /**
     * @param num_ranks Number of participants; must be even and at least 2.
     * @param comm_rank Communicator rank of the calling participant.
     * @param rank_mapping rank_mapping[comm_rank] is the pipeline rank of that participant.
     *                     Empty means the identity mapping; otherwise it must be a
     *                     permutation of [0, num_ranks).
     * @throws std::invalid_argument on an odd rank count or an invalid mapping.
     */
    PipelineTopology(int num_ranks, int comm_rank, const std::vector<int>& rank_mapping = {});

    [[nodiscard]] int num_ranks() const { return mNumRanks; }
    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] int comm_rank() const { return mCommRank; }

    [[nodiscard]] int prev_rank() const { return mPrevRank; }
    [[nodiscard]] int next_rank() const { return mNextRank; }
    [[nodiscard]] int first_rank() const { return mFirstRank; }
    [[nodiscard]] int last_rank() const { return mLastRank; }

    [[nodiscard]] bool is_first() const { return mRank == 0; }
    [[nodiscard]] bool is_last() const { return mRank == mNumRanks - 1; }
    [[nodiscard]] bool is_middle() const { return mRank == mNumRanks / 2 - 1 || mRank == mNumRanks / 2; }
    [[nodiscard]] bool is_in_second_half() const { return mRank >= mNumRanks / 2; }

    //! Distance from the nearer end of the pipeline.
    [[nodiscard]] int half_rank() const { return mRank < mNumRanks - 1 - mRank ? mRank : mNumRanks - 1 - mRank; }
    [[nodiscard]] int num_half_ranks() const { return mNumRanks / 2; }

    //! Maps the local phase used by the schedule program to the shard/direction index.
    [[nodiscard]] int physical_phase(int phase) const { return phase ^ (is_in_second_half() ? 1 : 0); }

    //! Communicator rank that holds the given pipeline rank.
    [[nodiscard]] int to_comm_rank(int pipeline_rank) const;

private:
    int mNumRanks;
    int mCommRank;
    int mRank;
    int mPrevRank = -1;
    int mNextRank = -1;
    int mFirstRank;
    int mLastRank;
    std::vector<int> mInverse;
};

} // namespace dualpipe

#endif //DUALPIPE_SRC_PIPELINE_TOPOLOGY_H
