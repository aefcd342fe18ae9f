// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/weight_grad_store.h"

#include <stdexcept>
#include <utility>

namespace dualpipe {

void WeightGradStore::put(WeightGradFn fn) {
    if (!mEnabled) {
        throw std::logic_error("WeightGradStore::put called while deferral is disabled");
    }
    mCache.push_back(std::move(fn));
}

void WeightGradStore::run_or_defer(WeightGradFn fn) {
    if (mEnabled) {
        put(std::move(fn));
    } else {
        fn();
    }
}

void WeightGradStore::flush() {
    mQueue.push_back(std::move(mCache));
    mCache.clear();
}

void WeightGradStore::pop() {
    if (mQueue.empty()) {
        throw std::logic_error("WeightGradStore::pop called on an empty queue");
    }
    std::vector<WeightGradFn> unit = std::move(mQueue.front());
    mQueue.pop_front();
    for (auto& fn : unit) {
        fn();
    }
}

void WeightGradStore::clear() {
    mEnabled = false;
    mCache.clear();
    mQueue.clear();
}

} // namespace dualpipe
