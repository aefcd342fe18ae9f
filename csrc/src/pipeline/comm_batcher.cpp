// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/comm_batcher.h"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "utilities/comm.h"

namespace dualpipe {

CommBatcher::CommBatcher(Communicator& comm) : mComm(&comm) {
}

void CommBatcher::set_tensor_shapes(std::vector<std::vector<long>> shapes) {
    for (const auto& shape : shapes) {
        if (shape.empty() || static_cast<int>(shape.size()) > MAX_TENSOR_DIM) {
            throw std::invalid_argument(fmt::format("Invalid p2p tensor shape [{}]", fmt::join(shape, ", ")));
        }
        for (long d : shape) {
            if (d <= 0) {
                throw std::invalid_argument(fmt::format("Invalid p2p tensor shape [{}]", fmt::join(shape, ", ")));
            }
        }
    }
    mShapes = std::move(shapes);
    mHasShapes = true;
}

void CommBatcher::set_tensor_dtype(ETensorDType dtype) {
    mDType = dtype;
    mHasDType = true;
}

void CommBatcher::check_configured() const {
    if (!is_configured()) {
        throw std::invalid_argument("You need to set the p2p tensor shapes and dtype before communicating");
    }
}

void CommBatcher::post_send(const TensorList& payload, int peer) {
    check_configured();
    if (payload.size() != mShapes.size()) {
        throw std::invalid_argument(fmt::format("Send to rank {} carries {} tensors, expected {}", peer, payload.size(), mShapes.size()));
    }
    for (std::size_t i = 0; i < payload.size(); ++i) {
        const Tensor& t = payload[i];
        if (t.is_null()) {
            throw std::invalid_argument(fmt::format("Send to rank {}: tensor {} is null", peer, i));
        }
        if (t.DType != mDType || t.shape() != mShapes[i]) {
            throw std::invalid_argument(fmt::format("Send to rank {}: tensor {} is {}[{}], expected {}[{}]",
                                                    peer, i, dtype_to_str(t.DType), fmt::join(t.shape(), ", "),
                                                    dtype_to_str(mDType), fmt::join(mShapes[i], ", ")));
        }
    }
    mOps.push_back(PendingOp{true, peer, payload});
}

TensorList CommBatcher::post_recv(int peer) {
    check_configured();
    TensorList placeholders;
    placeholders.reserve(mShapes.size());
    for (const auto& shape : mShapes) {
        placeholders.push_back(Tensor::allocate(mDType, shape));
    }
    mOps.push_back(PendingOp{false, peer, placeholders});
    return placeholders;
}

void CommBatcher::mark_for_release(TensorList tensors) {
    for (auto& t : tensors) {
        if (t.has_value()) {
            mToFree.push_back(std::move(t));
        }
    }
}

void CommBatcher::commit_and_wait() {
    if (mOps.empty()) {
        return;
    }

    mComm->begin_transaction();
    for (auto& op : mOps) {
        for (auto& t : op.Tensors) {
            if (op.IsSend) {
                mComm->schedule_send(t, op.Peer);
                mStats.BytesSent += t.bytes();
            } else {
                mComm->schedule_recv(t, op.Peer);
                mStats.BytesReceived += t.bytes();
            }
        }
        if (op.IsSend) {
            ++mStats.NumSent;
        } else {
            ++mStats.NumReceived;
        }
    }
    mComm->execute_transaction();
    ++mStats.NumCommits;
    mOps.clear();

    std::vector<Tensor> to_free = std::move(mToFree);
    mToFree.clear();
    for (auto& t : to_free) {
        release(t);
    }
}

void CommBatcher::reset() {
    mOps.clear();
    mToFree.clear();
}

} // namespace dualpipe
