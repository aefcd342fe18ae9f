// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/pipeline/sequential_reference.h"

#include <stdexcept>

#include "pipeline/weight_grad_store.h"

namespace modules {

std::vector<float> run_sequential_reference(const std::vector<std::shared_ptr<dualpipe::IStage>>& stages,
                                            const TensorList& inputs, const TensorList& labels,
                                            int num_micro_batches, dualpipe::ICriterion& criterion, int batch_dim) {
    if (stages.empty()) {
        throw std::invalid_argument("run_sequential_reference needs at least one stage");
    }

    std::vector<TensorList> input_chunks = scatter(inputs, num_micro_batches, batch_dim);
    std::vector<TensorList> label_chunks = scatter(labels, num_micro_batches, batch_dim);

    // disabled store: weight gradients are computed during backward
    dualpipe::WeightGradStore store;
    std::vector<float> losses;
    losses.reserve(num_micro_batches);

    for (int m = 0; m < num_micro_batches; ++m) {
        std::vector<std::shared_ptr<dualpipe::StageContext>> contexts;
        TensorList x = input_chunks[m];
        for (auto& stage : stages) {
            dualpipe::ForwardResult fwd = stage->forward(x, true);
            if (!fwd.Context) {
                throw std::logic_error("Stage returned no context from a forward pass with gradients");
            }
            contexts.push_back(std::move(fwd.Context));
            x = std::move(fwd.Outputs);
        }

        dualpipe::LossResult loss = criterion.compute(x, label_chunks[m]);
        losses.push_back(loss.Loss);

        TensorList grads = std::move(loss.OutputGrads);
        for (int s = static_cast<int>(stages.size()) - 1; s >= 0; --s) {
            grads = stages[s]->backward(*contexts[s], grads, store);
        }
    }
    return losses;
}

} // namespace modules
