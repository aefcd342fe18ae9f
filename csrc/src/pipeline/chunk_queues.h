// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_PIPELINE_CHUNK_QUEUES_H
#define DUALPIPE_SRC_PIPELINE_CHUNK_QUEUES_H

#include <array>
#include <vector>

#include "utilities/tensor.h"

namespace dualpipe {

enum class ECursor : int {
    RecvF,
    ComputeF,
    SendF,
    RecvB,
    ComputeB,
    SendB
};

enum class EChunkQueue : int {
    Input,
    Output,
    OutputGrad,
    InputGrad
};

const char* cursor_name(ECursor cursor);
const char* queue_name(EChunkQueue queue);

//! The queue a cursor reads from when used with ChunkQueues::take().
[[nodiscard]] constexpr EChunkQueue queue_of(ECursor cursor) {
    switch (cursor) {
    case ECursor::RecvF:
    case ECursor::ComputeF:
        return EChunkQueue::Input;
    case ECursor::SendF:
        return EChunkQueue::Output;
    case ECursor::RecvB:
    case ECursor::ComputeB:
        return EChunkQueue::OutputGrad;
    case ECursor::SendB:
        return EChunkQueue::InputGrad;
    }
    return EChunkQueue::Input;
}

//! Progress counters of one direction.
struct ChunkCursors {
    int RecvF = 0;
    int ComputeF = 0;
    int SendF = 0;
    int RecvB = 0;
    int ComputeB = 0;
    int SendB = 0;

    [[nodiscard]] int get(ECursor cursor) const;
    int& operator[](ECursor cursor);

    bool operator==(const ChunkCursors&) const = default;
};

/**
 * @brief Per-direction chunk storage and progress cursors.
 *
 * Each of the two directions holds four append-only sequences of chunk payloads
 * (inputs, outputs, output gradients, input gradients) and six cursors. A cursor
 * counts the schedule slots of its kind that have been executed; all of them reach
 * chunks_per_phase() at the end of a complete step. For both the forward and the
 * backward pass, send <= compute <= recv holds at all times.
 *
 * Violations are scheduling bugs and raise std::logic_error.
 */
class ChunkQueues {
public:
    explicit ChunkQueues(int chunks_per_phase = 0);

    //! Drop all payloads and rewind every cursor.
    void reset(int chunks_per_phase);

    int enqueue_input(int phase, TensorList batch);
    int enqueue_output(int phase, TensorList batch);
    int enqueue_output_grad(int phase, TensorList batch);
    int enqueue_input_grad(int phase, TensorList batch);

    /**
     * @brief Read the element of queue_of(@p cursor) at the cursor position, then advance the cursor.
     *
     * @param release_slot If true, the payload is moved out and the slot is left empty.
     * @throws std::logic_error if nothing has been enqueued at the cursor position.
     */
    TensorList take(int phase, ECursor cursor, bool release_slot);

    /**
     * @brief Advance @p cursor by one slot without reading a payload.
     * @return The cursor position before advancing, i.e. the chunk id of the slot.
     */
    int advance(int phase, ECursor cursor);

    //! Empties the payload at @p index, e.g. an input that is no longer needed.
    void clear_slot(int phase, EChunkQueue queue, int index);

    [[nodiscard]] int position(int phase, ECursor cursor) const;
    [[nodiscard]] const ChunkCursors& cursors(int phase) const;
    [[nodiscard]] int chunks_per_phase() const { return mChunksPerPhase; }
    [[nodiscard]] int size(int phase, EChunkQueue queue) const;
    [[nodiscard]] const std::vector<TensorList>& queue(int phase, EChunkQueue queue) const;

    //! True if every cursor of both directions has reached chunks_per_phase().
    [[nodiscard]] bool complete() const;

private:
    struct PhaseQueues {
        std::array<std::vector<TensorList>, 4> Queues;
        ChunkCursors Cursors;
    };

    PhaseQueues& phase_queues(int phase);
    [[nodiscard]] const PhaseQueues& phase_queues(int phase) const;
    int enqueue(int phase, EChunkQueue queue, TensorList batch);
    void check_order(int phase) const;

    int mChunksPerPhase = 0;
    std::array<PhaseQueues, 2> mPhases;
};

} // namespace dualpipe

#endif //DUALPIPE_SRC_PIPELINE_CHUNK_QUEUES_H
