// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_MODULES_PIPELINE_MSE_LOSS_H
#define DUALPIPE_SRC_MODULES_PIPELINE_MSE_LOSS_H

#include "pipeline/stage.h"

namespace modules {

//! Mean squared error over all elements of the first output and the first label.
class MSELoss : public dualpipe::ICriterion {
public:
    dualpipe::LossResult compute(const TensorList& outputs, const TensorList& labels) override;
};

} // namespace modules

#endif //DUALPIPE_SRC_MODULES_PIPELINE_MSE_LOSS_H
