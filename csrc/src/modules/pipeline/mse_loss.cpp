// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/pipeline/mse_loss.h"

#include <stdexcept>

#include <fmt/core.h>

namespace modules {

dualpipe::LossResult MSELoss::compute(const TensorList& outputs, const TensorList& labels) {
    if (outputs.empty() || labels.empty() || outputs[0].is_null() || labels[0].is_null()) {
        throw std::invalid_argument("MSELoss needs one output and one label");
    }
    const Tensor& y = outputs[0];
    const Tensor& t = labels[0];
    if (y.shape() != t.shape()) {
        throw std::invalid_argument(fmt::format("MSELoss: output has {} elements in rank {}, label has {} in rank {}",
                                                y.nelem(), y.Rank, t.nelem(), t.Rank));
    }

    const std::size_t n = y.nelem();
    const float* yp = y.get<float>();
    const float* tp = t.get<float>();

    dualpipe::LossResult result;
    Tensor grad = Tensor::allocate(ETensorDType::FP32, y.shape());
    float* gp = grad.get<float>();
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const float diff = yp[i] - tp[i];
        sum += static_cast<double>(diff) * diff;
        gp[i] = 2.f * diff / static_cast<float>(n);
    }
    result.Loss = static_cast<float>(sum / static_cast<double>(n));

    result.OutputGrads.resize(outputs.size());
    result.OutputGrads[0] = grad;
    return result;
}

} // namespace modules
