// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_PIPELINE_COMM_BATCHER_H
#define DUALPIPE_SRC_PIPELINE_COMM_BATCHER_H

#include <cstddef>
#include <vector>

#include "utilities/dtype.h"
#include "utilities/tensor.h"

class Communicator;

namespace dualpipe {

struct CommStats {
    int NumCommits = 0;
    int NumSent = 0;
    int NumReceived = 0;
    std::size_t BytesSent = 0;
    std::size_t BytesReceived = 0;
};

/**
 * @brief Collects point-to-point operations and issues them as a single batch.
 *
 * Every message carries one tensor per configured shape, all of the configured dtype.
 * Receive placeholders are allocated when the receive is posted and are filled when the
 * batch is committed. Tensors marked for release are freed right after the next commit.
 */
class CommBatcher {
public:
    explicit CommBatcher(Communicator& comm);

    void set_tensor_shapes(std::vector<std::vector<long>> shapes);
    void set_tensor_dtype(ETensorDType dtype);
    [[nodiscard]] bool is_configured() const { return mHasShapes && mHasDType; }

    [[nodiscard]] const std::vector<std::vector<long>>& tensor_shapes() const { return mShapes; }
    [[nodiscard]] ETensorDType tensor_dtype() const { return mDType; }

    //! Queues a send of @p payload to communicator rank @p peer.
    void post_send(const TensorList& payload, int peer);

    //! Queues a receive from @p peer and returns the placeholders it will fill.
    TensorList post_recv(int peer);

    //! Hands ownership of @p tensors to the batcher; they are released after the next commit.
    void mark_for_release(TensorList tensors);

    //! Issues and waits for all pending operations. Does nothing if none are pending.
    void commit_and_wait();

    //! Drops pending operations and tensors awaiting release without communicating.
    void reset();

    [[nodiscard]] const CommStats& stats() const { return mStats; }
    void reset_stats() { mStats = CommStats{}; }

private:
    void check_configured() const;

    struct PendingOp {
        bool IsSend;
        int Peer;
        TensorList Tensors;
    };

    Communicator* mComm;
    std::vector<std::vector<long>> mShapes;
    ETensorDType mDType = ETensorDType::FP32;
    bool mHasShapes = false;
    bool mHasDType = false;

    std::vector<PendingOp> mOps;
    std::vector<Tensor> mToFree;
    CommStats mStats;
};

} // namespace dualpipe

#endif //DUALPIPE_SRC_PIPELINE_COMM_BATCHER_H
