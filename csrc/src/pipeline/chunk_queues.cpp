// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/chunk_queues.h"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace dualpipe {

const char* cursor_name(ECursor cursor) {
    switch (cursor) {
    case ECursor::RecvF: return "recv_f";
    case ECursor::ComputeF: return "compute_f";
    case ECursor::SendF: return "send_f";
    case ECursor::RecvB: return "recv_b";
    case ECursor::ComputeB: return "compute_b";
    case ECursor::SendB: return "send_b";
    }
    return "unknown";
}

const char* queue_name(EChunkQueue queue) {
    switch (queue) {
    case EChunkQueue::Input: return "input";
    case EChunkQueue::Output: return "output";
    case EChunkQueue::OutputGrad: return "output_grad";
    case EChunkQueue::InputGrad: return "input_grad";
    }
    return "unknown";
}

int ChunkCursors::get(ECursor cursor) const {
    switch (cursor) {
    case ECursor::RecvF: return RecvF;
    case ECursor::ComputeF: return ComputeF;
    case ECursor::SendF: return SendF;
    case ECursor::RecvB: return RecvB;
    case ECursor::ComputeB: return ComputeB;
    case ECursor::SendB: return SendB;
    }
    throw std::logic_error("invalid cursor");
}

int& ChunkCursors::operator[](ECursor cursor) {
    switch (cursor) {
    case ECursor::RecvF: return RecvF;
    case ECursor::ComputeF: return ComputeF;
    case ECursor::SendF: return SendF;
    case ECursor::RecvB: return RecvB;
    case ECursor::ComputeB: return ComputeB;
    case ECursor::SendB: return SendB;
    }
    throw std::logic_error("invalid cursor");
}

ChunkQueues::ChunkQueues(int chunks_per_phase) {
    reset(chunks_per_phase);
}

void ChunkQueues::reset(int chunks_per_phase) {
    if (chunks_per_phase < 0) {
        throw std::invalid_argument(fmt::format("Invalid number of chunks per phase: {}", chunks_per_phase));
    }
    mChunksPerPhase = chunks_per_phase;
    for (auto& p : mPhases) {
        for (auto& q : p.Queues) {
            q.clear();
        }
        p.Cursors = ChunkCursors{};
    }
}

ChunkQueues::PhaseQueues& ChunkQueues::phase_queues(int phase) {
    if (phase != 0 && phase != 1) {
        throw std::logic_error(fmt::format("Invalid phase {}", phase));
    }
    return mPhases[phase];
}

const ChunkQueues::PhaseQueues& ChunkQueues::phase_queues(int phase) const {
    if (phase != 0 && phase != 1) {
        throw std::logic_error(fmt::format("Invalid phase {}", phase));
    }
    return mPhases[phase];
}

int ChunkQueues::enqueue(int phase, EChunkQueue queue, TensorList batch) {
    auto& q = phase_queues(phase).Queues[static_cast<int>(queue)];
    if (static_cast<int>(q.size()) >= mChunksPerPhase) {
        throw std::logic_error(fmt::format("Phase {}: {} queue is full ({} chunks)", phase, queue_name(queue), mChunksPerPhase));
    }
    q.push_back(std::move(batch));
    return static_cast<int>(q.size()) - 1;
}

int ChunkQueues::enqueue_input(int phase, TensorList batch) {
    return enqueue(phase, EChunkQueue::Input, std::move(batch));
}

int ChunkQueues::enqueue_output(int phase, TensorList batch) {
    return enqueue(phase, EChunkQueue::Output, std::move(batch));
}

int ChunkQueues::enqueue_output_grad(int phase, TensorList batch) {
    return enqueue(phase, EChunkQueue::OutputGrad, std::move(batch));
}

int ChunkQueues::enqueue_input_grad(int phase, TensorList batch) {
    return enqueue(phase, EChunkQueue::InputGrad, std::move(batch));
}

void ChunkQueues::check_order(int phase) const {
    const ChunkCursors& c = mPhases[phase].Cursors;
    if (c.SendF > c.ComputeF || c.ComputeF > c.RecvF) {
        throw std::logic_error(fmt::format("Phase {}: forward cursors out of order (recv={}, compute={}, send={})",
                                           phase, c.RecvF, c.ComputeF, c.SendF));
    }
    if (c.SendB > c.ComputeB || c.ComputeB > c.RecvB) {
        throw std::logic_error(fmt::format("Phase {}: backward cursors out of order (recv={}, compute={}, send={})",
                                           phase, c.RecvB, c.ComputeB, c.SendB));
    }
}

int ChunkQueues::advance(int phase, ECursor cursor) {
    PhaseQueues& p = phase_queues(phase);
    int& value = p.Cursors[cursor];
    if (value >= mChunksPerPhase) {
        throw std::logic_error(fmt::format("Phase {}: cursor {} would exceed {} chunks", phase, cursor_name(cursor), mChunksPerPhase));
    }
    ++value;
    try {
        check_order(phase);
    } catch (const std::logic_error&) {
        --value;
        throw;
    }
    return value - 1;
}

TensorList ChunkQueues::take(int phase, ECursor cursor, bool release_slot) {
    PhaseQueues& p = phase_queues(phase);
    auto& q = p.Queues[static_cast<int>(queue_of(cursor))];
    const int at = p.Cursors.get(cursor);
    if (at >= static_cast<int>(q.size())) {
        throw std::logic_error(fmt::format("Phase {}: cursor {} at {} exceeds the {} enqueued {} chunks",
                                           phase, cursor_name(cursor), at, q.size(), queue_name(queue_of(cursor))));
    }
    advance(phase, cursor);
    if (release_slot) {
        return std::exchange(q[at], TensorList{});
    }
    return q[at];
}

void ChunkQueues::clear_slot(int phase, EChunkQueue queue, int index) {
    auto& q = phase_queues(phase).Queues[static_cast<int>(queue)];
    q.at(index).clear();
}

int ChunkQueues::position(int phase, ECursor cursor) const {
    return phase_queues(phase).Cursors.get(cursor);
}

const ChunkCursors& ChunkQueues::cursors(int phase) const {
    return phase_queues(phase).Cursors;
}

int ChunkQueues::size(int phase, EChunkQueue queue) const {
    return static_cast<int>(phase_queues(phase).Queues[static_cast<int>(queue)].size());
}

const std::vector<TensorList>& ChunkQueues::queue(int phase, EChunkQueue queue) const {
    return phase_queues(phase).Queues[static_cast<int>(queue)];
}

bool ChunkQueues::complete() const {
    const ChunkCursors done{mChunksPerPhase, mChunksPerPhase, mChunksPerPhase,
                            mChunksPerPhase, mChunksPerPhase, mChunksPerPhase};
    return mPhases[0].Cursors == done && mPhases[1].Cursors == done;
}

} // namespace dualpipe
