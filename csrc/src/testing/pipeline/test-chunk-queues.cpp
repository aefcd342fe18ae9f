// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "pipeline/chunk_queues.h"
#include "test_utils.h"

using namespace dualpipe;
using testing_utils::iota_tensor;
using testing_utils::to_vector;

TEST_CASE("chunk queues: enqueue and take in order", "[pipeline][queues]") {
    ChunkQueues queues(2);
    REQUIRE(queues.enqueue_input(0, {iota_tensor({2}, 0.f)}) == 0);
    REQUIRE(queues.enqueue_input(0, {iota_tensor({2}, 10.f)}) == 1);
    REQUIRE(queues.size(0, EChunkQueue::Input) == 2);
    REQUIRE(queues.size(1, EChunkQueue::Input) == 0);

    REQUIRE(queues.advance(0, ECursor::RecvF) == 0);
    TensorList first = queues.take(0, ECursor::ComputeF, false);
    REQUIRE(to_vector(first[0])[0] == 0.f);
    REQUIRE(queues.position(0, ECursor::ComputeF) == 1);
    // kept slots stay readable
    REQUIRE(queues.queue(0, EChunkQueue::Input)[0].size() == 1);

    queues.advance(0, ECursor::RecvF);
    TensorList second = queues.take(0, ECursor::ComputeF, true);
    REQUIRE(to_vector(second[0])[0] == 10.f);
    REQUIRE(queues.queue(0, EChunkQueue::Input)[1].empty());
}

TEST_CASE("chunk queues: full queues and missing payloads", "[pipeline][queues]") {
    ChunkQueues queues(1);
    queues.enqueue_output(1, {iota_tensor({1})});
    REQUIRE_THROWS_AS(queues.enqueue_output(1, {iota_tensor({1})}), std::logic_error);

    // nothing has been enqueued into the output-grad queue yet
    queues.advance(1, ECursor::RecvB);
    REQUIRE_THROWS_AS(queues.take(1, ECursor::ComputeB, true), std::logic_error);
    REQUIRE(queues.position(1, ECursor::ComputeB) == 0);
}

TEST_CASE("chunk queues: cursor order is enforced", "[pipeline][queues]") {
    ChunkQueues queues(2);
    REQUIRE_THROWS_AS(queues.advance(0, ECursor::ComputeF), std::logic_error);
    REQUIRE(queues.position(0, ECursor::ComputeF) == 0);

    queues.advance(0, ECursor::RecvF);
    queues.advance(0, ECursor::ComputeF);
    REQUIRE_THROWS_AS(queues.advance(0, ECursor::ComputeF), std::logic_error);
    queues.advance(0, ECursor::SendF);
    REQUIRE_THROWS_AS(queues.advance(0, ECursor::SendF), std::logic_error);

    REQUIRE_THROWS_AS(queues.advance(1, ECursor::SendB), std::logic_error);

    queues.advance(0, ECursor::RecvF);
    REQUIRE_THROWS_AS(queues.advance(0, ECursor::RecvF), std::logic_error);
    REQUIRE(queues.position(0, ECursor::RecvF) == 2);
}

TEST_CASE("chunk queues: completion needs every cursor of both phases", "[pipeline][queues]") {
    ChunkQueues queues(1);
    REQUIRE_FALSE(queues.complete());
    for (int phase = 0; phase < 2; ++phase) {
        for (ECursor c : {ECursor::RecvF, ECursor::ComputeF, ECursor::SendF,
                          ECursor::RecvB, ECursor::ComputeB, ECursor::SendB}) {
            REQUIRE_FALSE(queues.complete());
            queues.advance(phase, c);
        }
    }
    REQUIRE(queues.complete());

    queues.reset(3);
    REQUIRE(queues.chunks_per_phase() == 3);
    REQUIRE(queues.cursors(0) == ChunkCursors{});
    REQUIRE_FALSE(queues.complete());
}

TEST_CASE("chunk queues: empty configuration is trivially complete", "[pipeline][queues]") {
    ChunkQueues queues;
    REQUIRE(queues.complete());
    REQUIRE_THROWS_AS(queues.enqueue_input(0, {}), std::logic_error);
    REQUIRE_THROWS_AS(queues.reset(-1), std::invalid_argument);
}

TEST_CASE("chunk queues: invalid phases and slots", "[pipeline][queues]") {
    ChunkQueues queues(1);
    REQUIRE_THROWS_AS(queues.enqueue_input(2, {}), std::logic_error);
    REQUIRE_THROWS_AS(queues.position(-1, ECursor::RecvF), std::logic_error);
    REQUIRE_THROWS_AS(queues.clear_slot(0, EChunkQueue::Input, 0), std::out_of_range);

    queues.enqueue_input_grad(0, {iota_tensor({3})});
    queues.clear_slot(0, EChunkQueue::InputGrad, 0);
    REQUIRE(queues.queue(0, EChunkQueue::InputGrad)[0].empty());
}

TEST_CASE("chunk queues: cursors read from their queues", "[pipeline][queues]") {
    REQUIRE(queue_of(ECursor::ComputeF) == EChunkQueue::Input);
    REQUIRE(queue_of(ECursor::SendF) == EChunkQueue::Output);
    REQUIRE(queue_of(ECursor::ComputeB) == EChunkQueue::OutputGrad);
    REQUIRE(queue_of(ECursor::SendB) == EChunkQueue::InputGrad);
}
