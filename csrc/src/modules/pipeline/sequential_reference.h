// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_MODULES_PIPELINE_SEQUENTIAL_REFERENCE_H
#define DUALPIPE_SRC_MODULES_PIPELINE_SEQUENTIAL_REFERENCE_H

#include <memory>
#include <vector>

#include "pipeline/stage.h"

namespace modules {

/**
 * @brief Single-process baseline for a pipeline run.
 *
 * Splits @p inputs and @p labels into @p num_micro_batches along @p batch_dim and runs each
 * micro-batch forward through all @p stages in order, then backward with weight gradients
 * applied immediately. Gradients accumulate in the stages.
 *
 * @return The loss of each micro-batch, in order.
 */
std::vector<float> run_sequential_reference(const std::vector<std::shared_ptr<dualpipe::IStage>>& stages,
                                            const TensorList& inputs, const TensorList& labels,
                                            int num_micro_batches, dualpipe::ICriterion& criterion, int batch_dim = 0);

} // namespace modules

#endif //DUALPIPE_SRC_MODULES_PIPELINE_SEQUENTIAL_REFERENCE_H
