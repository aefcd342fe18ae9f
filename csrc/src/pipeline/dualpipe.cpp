// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/dualpipe.h"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "training/logging.h"
#include "utilities/comm.h"

namespace dualpipe {

namespace {

EOverlapMode select_overlap_mode(const std::array<std::shared_ptr<IStage>, 2>& stages) {
    for (const auto& stage : stages) {
        if (!stage) {
            throw std::invalid_argument("DualPipe requires two stages");
        }
    }
    return stages[0]->supports_overlap() && stages[1]->supports_overlap() ? EOverlapMode::Fused : EOverlapMode::Sequential;
}

} // namespace

DualPipe::DualPipe(std::array<std::shared_ptr<IStage>, 2> stages, Communicator& comm, int batch_dim, std::vector<int> rank_mapping) :
    mStages(std::move(stages)),
    mTopology(comm.world_size(), comm.rank(), rank_mapping),
    mBatcher(comm),
    mOverlapMode(select_overlap_mode(mStages)),
    mBatchDim(batch_dim)
{
    if (batch_dim < 0 || batch_dim >= MAX_TENSOR_DIM) {
        throw std::invalid_argument(fmt::format("Invalid batch dimension {}", batch_dim));
    }
}

void DualPipe::set_p2p_tensor_shapes(std::vector<std::vector<long>> shapes) {
    mBatcher.set_tensor_shapes(std::move(shapes));
}

void DualPipe::set_p2p_tensor_dtype(ETensorDType dtype) {
    mBatcher.set_tensor_dtype(dtype);
}

void DualPipe::reset_state() {
    mWeightGrads.clear();
    mBatcher.reset();
    mState = StepState{};
}

bool DualPipe::is_first_stage(int phys) const {
    return (mTopology.is_first() && phys == 0) || (mTopology.is_last() && phys == 1);
}

bool DualPipe::is_last_stage(int phys) const {
    return (mTopology.is_first() && phys == 1) || (mTopology.is_last() && phys == 0);
}

// ---------------------------------------------------------------------------------------------------------------------
// compute

std::shared_ptr<StageContext> DualPipe::take_context(int phys, int chunk_id) {
    auto& contexts = mState.Contexts[phys];
    if (chunk_id >= static_cast<int>(contexts.size()) || !contexts[chunk_id]) {
        throw std::logic_error(fmt::format("Phase {}: no saved forward state for chunk {}", phys, chunk_id));
    }
    return std::exchange(contexts[chunk_id], nullptr);
}

void DualPipe::post_forward(int phys, int chunk_id, ForwardResult forward, std::optional<LossResult> loss) {
    if (static_cast<int>(mState.Contexts[phys].size()) != chunk_id) {
        throw std::logic_error(fmt::format("Phase {}: forward of chunk {} out of order", phys, chunk_id));
    }
    mState.Contexts[phys].push_back(std::move(forward.Context));

    const bool last_stage = is_last_stage(phys);
    if (last_stage && mState.Criterion) {
        if (!loss) {
            throw std::logic_error(fmt::format("Phase {}: no loss computed for chunk {}", phys, chunk_id));
        }
        mState.Losses.push_back(loss->Loss);
        if (!mState.ForwardOnly) {
            mState.Queues.enqueue_output_grad(phys, std::move(loss->OutputGrads));
        }
    }

    if (!last_stage || mState.ReturnOutputs) {
        mState.Queues.enqueue_output(phys, std::move(forward.Outputs));
    }
}

void DualPipe::post_backward(int phys, int chunk_id, TensorList input_grads) {
    mState.Queues.clear_slot(phys, EChunkQueue::Input, chunk_id);
    mState.Queues.enqueue_input_grad(phys, std::move(input_grads));
}

void DualPipe::forward_compute_chunk(int phase) {
    const int phys = mTopology.physical_phase(phase);
    TensorList inputs = mState.Queues.take(phys, ECursor::ComputeF, mState.ForwardOnly);
    const int chunk_id = mState.Queues.position(phys, ECursor::ComputeF) - 1;

    ForwardResult forward = mStages[phys]->forward(inputs, !mState.ForwardOnly);

    std::optional<LossResult> loss;
    if (is_last_stage(phys) && mState.Criterion) {
        loss = mState.Criterion->compute(forward.Outputs, mState.Labels[phys].at(chunk_id));
    }
    post_forward(phys, chunk_id, std::move(forward), std::move(loss));
}

void DualPipe::backward_compute_chunk(int phase, bool enable_zb) {
    const int phys = mTopology.physical_phase(phase);
    if (mState.ForwardOnly) {
        mState.Queues.advance(phys, ECursor::ComputeB);
        return;
    }

    TensorList output_grads = mState.Queues.take(phys, ECursor::ComputeB, true);
    const int chunk_id = mState.Queues.position(phys, ECursor::ComputeB) - 1;
    std::shared_ptr<StageContext> context = take_context(phys, chunk_id);

    mWeightGrads.set_enabled(enable_zb);
    TensorList input_grads = mStages[phys]->backward(*context, output_grads, mWeightGrads);
    mWeightGrads.set_enabled(false);
    if (enable_zb) {
        if (mWeightGrads.num_cached() > 0 && mState.Phase >= 0) {
            ++mLastStats.DeferredWeightUnits[mState.Phase];
        }
        mWeightGrads.flush();
    }

    post_backward(phys, chunk_id, std::move(input_grads));
}

void DualPipe::forward_backward_compute_chunk(int phase0, int phase1) {
    if (mState.ForwardOnly || mOverlapMode == EOverlapMode::Sequential) {
        forward_compute_chunk(phase0);
        backward_compute_chunk(phase1);
        return;
    }

    // pre-forward
    const int phys0 = mTopology.physical_phase(phase0);
    TensorList inputs0 = mState.Queues.take(phys0, ECursor::ComputeF, false);
    const int chunk_id0 = mState.Queues.position(phys0, ECursor::ComputeF) - 1;

    OverlapRequest request;
    request.ForwardInputs = &inputs0;
    if (is_last_stage(phys0) && mState.Criterion) {
        request.Criterion = mState.Criterion;
        request.Labels = &mState.Labels[phys0].at(chunk_id0);
    }

    // pre-backward
    const int phys1 = mTopology.physical_phase(phase1);
    TensorList output_grads1 = mState.Queues.take(phys1, ECursor::ComputeB, true);
    const int chunk_id1 = mState.Queues.position(phys1, ECursor::ComputeB) - 1;
    std::shared_ptr<StageContext> context1 = take_context(phys1, chunk_id1);
    request.BackwardStage = mStages[phys1].get();
    request.BackwardContext = context1.get();
    request.BackwardOutputGrads = &output_grads1;

    OverlapResult result = mStages[phys0]->forward_backward(request, mWeightGrads);

    post_forward(phys0, chunk_id0, std::move(result.Forward), std::move(result.Loss));
    post_backward(phys1, chunk_id1, std::move(result.InputGrads));
}

// ---------------------------------------------------------------------------------------------------------------------
// communication

void DualPipe::recv_forward(int phase) {
    const int phys = mTopology.physical_phase(phase);
    if (!is_first_stage(phys)) {
        const int peer = phys == 0 ? mTopology.prev_rank() : mTopology.next_rank();
        mState.Queues.enqueue_input(phys, mBatcher.post_recv(peer));
    }
    mState.Queues.advance(phys, ECursor::RecvF);
}

void DualPipe::send_forward(int phase) {
    const int phys = mTopology.physical_phase(phase);
    if (is_last_stage(phys)) {
        mState.Queues.advance(phys, ECursor::SendF);
        return;
    }

    TensorList outputs = mState.Queues.take(phys, ECursor::SendF, !mState.ReturnOutputs);
    mBatcher.post_send(outputs, phys == 0 ? mTopology.next_rank() : mTopology.prev_rank());
    if (!mState.ReturnOutputs) {
        mBatcher.mark_for_release(std::move(outputs));
    }
}

void DualPipe::recv_backward(int phase) {
    const int phys = mTopology.physical_phase(phase);
    if (!mState.ForwardOnly && !is_last_stage(phys)) {
        const int peer = phys == 0 ? mTopology.next_rank() : mTopology.prev_rank();
        mState.Queues.enqueue_output_grad(phys, mBatcher.post_recv(peer));
    }
    mState.Queues.advance(phys, ECursor::RecvB);
}

void DualPipe::send_backward(int phase) {
    const int phys = mTopology.physical_phase(phase);
    if (mState.ForwardOnly) {
        mState.Queues.advance(phys, ECursor::SendB);
        return;
    }

    TensorList input_grads = mState.Queues.take(phys, ECursor::SendB, true);
    if (is_first_stage(phys)) {
        return;
    }
    mBatcher.post_send(input_grads, phys == 0 ? mTopology.prev_rank() : mTopology.next_rank());
}

void DualPipe::commit() {
    mBatcher.commit_and_wait();
}

// ---------------------------------------------------------------------------------------------------------------------
// slots

void DualPipe::forward_chunk(int phase, bool recv, bool send) {
    if (recv) {
        recv_forward(phase);
    }
    commit();
    forward_compute_chunk(phase);
    if (send) {
        send_forward(phase);
    }
}

void DualPipe::backward_chunk(int phase, bool enable_zb, bool recv, bool send) {
    if (recv) {
        recv_backward(phase);
    }
    commit();
    backward_compute_chunk(phase, enable_zb);
    if (send) {
        send_backward(phase);
    }
}

void DualPipe::forward_backward_chunk(int phase0, int phase1, bool recv0) {
    if (recv0) {
        recv_forward(phase0);
    }
    recv_backward(phase1);
    commit();
    forward_backward_compute_chunk(phase0, phase1);
    send_forward(phase0);
    send_backward(phase1);
}

void DualPipe::weight_chunk() {
    if (mState.ForwardOnly) {
        return;
    }
    commit();
    // units are popped in the order their backward chunks ran
    mWeightGrads.pop();
}

// ---------------------------------------------------------------------------------------------------------------------
// step

void DualPipe::load_inputs(const TensorList& inputs, const TensorList& labels, int half_num_chunks) {
    if (!mTopology.is_first() && !mTopology.is_last()) {
        return;
    }
    if (inputs.empty()) {
        throw std::invalid_argument("The first and last rank need inputs for their first stage");
    }

    // first rank: inputs enter direction 0, labels belong to direction 1; last rank: the reverse
    const int input_phase = mTopology.is_first() ? 0 : 1;
    const int label_phase = 1 - input_phase;

    for (auto& chunk : scatter(inputs, half_num_chunks, mBatchDim)) {
        mState.Queues.enqueue_input(input_phase, std::move(chunk));
    }
    if (!labels.empty()) {
        mState.Labels[label_phase] = scatter(labels, half_num_chunks, mBatchDim);
    } else {
        mState.Labels[label_phase].assign(half_num_chunks, TensorList{});
    }
}

void DualPipe::run_schedule(const SchedulePlan& plan) {
    const bool middle = mTopology.is_middle();
    const auto& it = plan.Iterations;

    auto timed = [&](int index, auto&& body) {
        auto start = std::chrono::steady_clock::now();
        mState.Phase = index;
        body(it[index]);
        long us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count();
        mLastStats.PhaseDurationUs[index] = us;
        if (mLogger) {
            mLogger->log_phase(mTopology.rank(), index, it[index], us);
        }
    };

    // nF0
    timed(0, [&](int n) {
        for (int i = 0; i < n; ++i) {
            forward_chunk(0);
        }
    });

    // nF0F1
    timed(1, [&](int n) {
        recv_forward(0);
        for (int i = 0; i < n; ++i) {
            forward_chunk(0, false, middle);
            recv_forward(0);
            forward_chunk(1, true, !middle || i < n - 1);
            if (!middle) {
                send_forward(0);
            }
        }
    });

    // nB1W1F1, zero bubble
    timed(2, [&](int n) {
        for (int i = 0; i < n; ++i) {
            backward_chunk(1, true);
            recv_forward(1);
            weight_chunk();
            forward_chunk(1, false);
        }
    });

    // nF0B1F1B0, main loop
    timed(3, [&](int n) {
        for (int i = 0; i < n; ++i) {
            if (i == 0) {
                if (middle) {
                    // the two middle ranks exchange their first chunks without overlap
                    forward_chunk(0, false, false);
                    send_forward(1);
                    backward_chunk(1, false, true, false);
                    send_forward(0);
                    send_backward(1);
                } else {
                    forward_backward_chunk(0, 1, false);
                }
            } else {
                forward_backward_chunk(0, 1);
            }
            forward_backward_chunk(1, 0);
        }
    });

    // nB1F1B0
    timed(4, [&](int n) {
        for (int i = 0; i < n; ++i) {
            backward_chunk(1);
            forward_backward_chunk(1, 0);
        }
    });

    // nB1B0, zero bubble for the second half of the iterations
    timed(5, [&](int n) {
        bool enable_zb = false;
        const bool odd_half_rank = plan.HalfRank % 2 == 1;
        for (int i = 0; i < n; ++i) {
            if (i == n / 2 && odd_half_rank) {
                enable_zb = true;
            }
            backward_chunk(1, enable_zb);
            if (i == n / 2 && !odd_half_rank) {
                enable_zb = true;
            }
            backward_chunk(0, enable_zb);
        }
    });

    // nWB0, zero bubble
    timed(6, [&](int n) {
        for (int i = 0; i < n; ++i) {
            weight_chunk();
            backward_chunk(0, true);
        }
    });

    // nW
    timed(7, [&](int n) {
        for (int i = 0; i < n; ++i) {
            weight_chunk();
        }
    });

    if (!mWeightGrads.empty()) {
        throw std::logic_error(fmt::format("Rank {}: {} deferred weight-gradient units left after the schedule",
                                           mTopology.rank(), mWeightGrads.size()));
    }

    commit();

    if (!mState.Queues.complete()) {
        const ChunkCursors& c0 = mState.Queues.cursors(0);
        const ChunkCursors& c1 = mState.Queues.cursors(1);
        throw std::logic_error(fmt::format(
            "Rank {}: schedule did not visit every chunk (expected {}; phase 0: {} {} {} {} {} {}; phase 1: {} {} {} {} {} {})",
            mTopology.rank(), plan.HalfNumChunks,
            c0.RecvF, c0.ComputeF, c0.SendF, c0.RecvB, c0.ComputeB, c0.SendB,
            c1.RecvF, c1.ComputeF, c1.SendF, c1.RecvB, c1.ComputeB, c1.SendB));
    }
}

StepResult DualPipe::collect_result(const SchedulePlan& plan) {
    StepResult result;
    if (mTopology.is_first() || mTopology.is_last()) {
        if (mState.Criterion) {
            result.Loss = mState.Losses;
        }
        if (mState.ReturnOutputs) {
            // the last stage of the first rank runs direction 1, the one of the last rank direction 0
            const int phys = mTopology.is_first() ? 1 : 0;
            const auto& outputs = mState.Queues.queue(phys, EChunkQueue::Output);
            if (static_cast<int>(outputs.size()) != plan.HalfNumChunks) {
                throw std::logic_error(fmt::format("Rank {}: {} of {} outputs kept", mTopology.rank(), outputs.size(), plan.HalfNumChunks));
            }
            result.Outputs = gather(outputs, mBatchDim);
        }
    }
    return result;
}

StepResult DualPipe::step(const TensorList& inputs, int num_chunks, ICriterion* criterion,
                          const TensorList& labels, bool return_outputs, bool forward_only) {
    if (!mBatcher.is_configured()) {
        throw std::invalid_argument("You need to call set_p2p_tensor_shapes and set_p2p_tensor_dtype before doing a step");
    }
    SchedulePlan plan = make_schedule_plan(mTopology.num_ranks(), mTopology.rank(), num_chunks);
    if (!forward_only && (mTopology.is_first() || mTopology.is_last()) && criterion == nullptr) {
        throw std::invalid_argument("Criterion must be provided in training mode on the first and last rank");
    }

    if (mLogger && (plan.NumChunks != mLastPlan.NumChunks || plan.NumRanks != mLastPlan.NumRanks)) {
        mLogger->log_plan(mTopology.rank(), plan);
    }

    reset_state();
    mLastPlan = plan;
    mLastStats = StepStats{};
    mBatcher.reset_stats();

    StepResult result;
    try {
        mState.Queues.reset(plan.HalfNumChunks);
        mState.Criterion = criterion;
        mState.ReturnOutputs = return_outputs;
        mState.ForwardOnly = forward_only;
        load_inputs(inputs, labels, plan.HalfNumChunks);

        run_schedule(plan);

        mLastStats.Cursors = {mState.Queues.cursors(0), mState.Queues.cursors(1)};
        mLastStats.WeightQueueDrained = mWeightGrads.empty();
        mLastStats.NumLosses = static_cast<int>(mState.Losses.size());
        mLastStats.Comm = mBatcher.stats();

        result = collect_result(plan);
    } catch (...) {
        reset_state();
        throw;
    }

    reset_state();
    return result;
}

} // namespace dualpipe
