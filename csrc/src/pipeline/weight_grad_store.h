// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Deferred weight-gradient work for zero-bubble scheduling.

#ifndef DUALPIPE_SRC_PIPELINE_WEIGHT_GRAD_STORE_H
#define DUALPIPE_SRC_PIPELINE_WEIGHT_GRAD_STORE_H

#include <cstddef>
#include <deque>
#include <functional>
#include <vector>

namespace dualpipe {

using WeightGradFn = std::function<void()>;

/**
 * @brief FIFO of deferred weight-gradient computations.
 *
 * While enabled, stages hand their weight-gradient work to put() instead of running it.
 * flush() seals everything put since the previous flush into one unit, and pop() runs
 * the oldest unit. Every flush() pushes a unit, even an empty one, so the number of
 * pop() calls a schedule makes always matches the number of zero-bubble backward chunks.
 */
class WeightGradStore {
public:
    void set_enabled(bool enabled) { mEnabled = enabled; }
    [[nodiscard]] bool enabled() const { return mEnabled; }

    //! Appends @p fn to the open unit. Throws std::logic_error if the store is disabled.
    void put(WeightGradFn fn);

    //! Runs @p fn immediately when disabled, otherwise defers it with put().
    void run_or_defer(WeightGradFn fn);

    //! Moves the open unit to the back of the queue.
    void flush();

    //! Runs the oldest unit. Throws std::logic_error if the queue is empty.
    void pop();

    //! Drops all queued and open work and disables the store.
    void clear();

    [[nodiscard]] bool empty() const { return mQueue.empty(); }
    [[nodiscard]] std::size_t size() const { return mQueue.size(); }
    [[nodiscard]] std::size_t num_cached() const { return mCache.size(); }

private:
    bool mEnabled = false;
    std::vector<WeightGradFn> mCache;
    std::deque<std::vector<WeightGradFn>> mQueue;
};

} // namespace dualpipe

#endif //DUALPIPE_SRC_PIPELINE_WEIGHT_GRAD_STORE_H
