// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/pipeline/linear_stage.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>

#include <fmt/core.h>

#include "pipeline/weight_grad_store.h"
#include "utilities/utils.h"

namespace modules {

EActivation activation_from_str(std::string_view name) {
    if (iequals(name, "identity") || iequals(name, "none")) {
        return EActivation::Identity;
    }
    if (iequals(name, "tanh")) {
        return EActivation::Tanh;
    }
    throw std::invalid_argument(fmt::format("Unknown activation '{}'", name));
}

const char* activation_to_str(EActivation activation) {
    switch (activation) {
    case EActivation::Identity: return "identity";
    case EActivation::Tanh: return "tanh";
    }
    return "unknown";
}

LinearStage::LinearStage(Config config) : mConfig(config) {
    if (mConfig.hidden_size <= 0 || mConfig.num_layers <= 0) {
        throw std::invalid_argument(fmt::format("Invalid linear stage: hidden_size={}, num_layers={}",
                                                mConfig.hidden_size, mConfig.num_layers));
    }

    const long H = mConfig.hidden_size;
    const float bound = 1.f / std::sqrt(static_cast<float>(H));
    std::mt19937_64 rng(mConfig.seed);
    std::uniform_real_distribution<float> dist(-bound, bound);

    for (int l = 0; l < mConfig.num_layers; ++l) {
        Weights w{Tensor::allocate(ETensorDType::FP32, {H, H}), Tensor::allocate(ETensorDType::FP32, {H})};
        float* wp = w.weight.get<float>();
        for (std::size_t i = 0; i < w.weight.nelem(); ++i) {
            wp[i] = dist(rng);
        }
        float* bp = w.bias.get<float>();
        for (std::size_t i = 0; i < w.bias.nelem(); ++i) {
            bp[i] = dist(rng);
        }
        mWeights.push_back(std::move(w));
        mGrads.push_back(Gradients{Tensor::allocate(ETensorDType::FP32, {H, H}), Tensor::allocate(ETensorDType::FP32, {H})});
    }
}

void LinearStage::zero_grad() {
    for (auto& g : mGrads) {
        std::fill_n(g.d_weight.get<float>(), g.d_weight.nelem(), 0.f);
        std::fill_n(g.d_bias.get<float>(), g.d_bias.nelem(), 0.f);
    }
}

Tensor LinearStage::check_input(const TensorList& inputs) const {
    if (inputs.size() != 1 || inputs[0].is_null()) {
        throw std::invalid_argument(fmt::format("LinearStage expects exactly one input tensor, got {}", inputs.size()));
    }
    const Tensor& x = inputs[0];
    if (x.DType != ETensorDType::FP32 || x.Rank != 2 || x.Sizes[1] != mConfig.hidden_size) {
        throw std::invalid_argument(fmt::format("LinearStage expects fp32 (batch, {}) input, got {} of rank {} with {} features",
                                                mConfig.hidden_size, dtype_to_str(x.DType), x.Rank, x.Sizes[1]));
    }
    return x;
}

Tensor LinearStage::forward_layer(int layer, const Tensor& x) const {
    const long B = x.Sizes[0];
    const long H = mConfig.hidden_size;
    const Weights& w = mWeights[layer];
    const float* xp = x.get<float>();
    const float* wp = w.weight.get<float>();
    const float* bp = w.bias.get<float>();

    Tensor y = Tensor::allocate(ETensorDType::FP32, {B, H});
    float* yp = y.get<float>();
    for (long b = 0; b < B; ++b) {
        for (long o = 0; o < H; ++o) {
            float acc = bp[o];
            for (long i = 0; i < H; ++i) {
                acc += xp[b * H + i] * wp[o * H + i];
            }
            yp[b * H + o] = mConfig.activation == EActivation::Tanh ? std::tanh(acc) : acc;
        }
    }
    return y;
}

dualpipe::ForwardResult LinearStage::forward(const TensorList& inputs, bool requires_grad) {
    Tensor x = check_input(inputs);

    std::shared_ptr<Activations> acts;
    if (requires_grad) {
        acts = std::make_shared<Activations>();
    }
    for (int l = 0; l < mConfig.num_layers; ++l) {
        if (acts) acts->inputs.push_back(x);
        x = forward_layer(l, x);
        if (acts) acts->outputs.push_back(x);
    }
    return dualpipe::ForwardResult{TensorList{x}, acts};
}

LinearStage::BackwardCursor LinearStage::begin_backward(const dualpipe::StageContext& context, const TensorList& output_grads) const {
    const auto* acts = dynamic_cast<const Activations*>(&context);
    if (!acts || static_cast<int>(acts->outputs.size()) != mConfig.num_layers) {
        throw std::invalid_argument("LinearStage::backward called with a context it did not create");
    }
    if (output_grads.size() != 1) {
        throw std::invalid_argument(fmt::format("LinearStage expects one output gradient, got {}", output_grads.size()));
    }

    const Tensor& y = acts->outputs.back();
    Tensor grad = output_grads[0];
    if (grad.is_null()) {
        grad = Tensor::allocate(ETensorDType::FP32, y.shape());
    } else if (grad.DType != ETensorDType::FP32 || grad.shape() != y.shape()) {
        throw std::invalid_argument("LinearStage: output gradient does not match the output");
    }
    return BackwardCursor{acts, grad, mConfig.num_layers - 1};
}

void LinearStage::backward_layer(BackwardCursor& cursor, dualpipe::WeightGradStore& store) {
    const int layer = cursor.layer;
    const Tensor& x = cursor.acts->inputs[layer];
    const Tensor& y = cursor.acts->outputs[layer];
    const long B = x.Sizes[0];
    const long H = mConfig.hidden_size;

    // dz = dy * act'(z); for tanh, act'(z) = 1 - y^2
    Tensor dz = Tensor::allocate(ETensorDType::FP32, {B, H});
    float* dzp = dz.get<float>();
    const float* gp = cursor.grad.get<float>();
    const float* yp = y.get<float>();
    for (long k = 0; k < B * H; ++k) {
        dzp[k] = mConfig.activation == EActivation::Tanh ? gp[k] * (1.f - yp[k] * yp[k]) : gp[k];
    }

    // dx = dz @ W
    Tensor dx = Tensor::allocate(ETensorDType::FP32, {B, H});
    float* dxp = dx.get<float>();
    const float* wp = mWeights[layer].weight.get<float>();
    for (long b = 0; b < B; ++b) {
        for (long o = 0; o < H; ++o) {
            const float d = dzp[b * H + o];
            for (long i = 0; i < H; ++i) {
                dxp[b * H + i] += d * wp[o * H + i];
            }
        }
    }

    store.run_or_defer([this, layer, dz, x, B, H]() {
        const float* dz_data = dz.get<float>();
        const float* x_data = x.get<float>();
        float* dwp = mGrads[layer].d_weight.get<float>();
        float* dbp = mGrads[layer].d_bias.get<float>();
        for (long b = 0; b < B; ++b) {
            for (long o = 0; o < H; ++o) {
                const float g = dz_data[b * H + o];
                dbp[o] += g;
                for (long i = 0; i < H; ++i) {
                    dwp[o * H + i] += g * x_data[b * H + i];
                }
            }
        }
    });

    cursor.grad = dx;
    --cursor.layer;
}

TensorList LinearStage::backward(const dualpipe::StageContext& context, const TensorList& output_grads,
                                 dualpipe::WeightGradStore& store) {
    BackwardCursor cursor = begin_backward(context, output_grads);
    while (cursor.layer >= 0) {
        backward_layer(cursor, store);
    }
    return TensorList{cursor.grad};
}

dualpipe::OverlapResult LinearStage::forward_backward(const dualpipe::OverlapRequest& request,
                                                      dualpipe::WeightGradStore& store) {
    if (!request.ForwardInputs || !request.BackwardStage || !request.BackwardContext || !request.BackwardOutputGrads) {
        throw std::invalid_argument("Incomplete overlapped forward/backward request");
    }
    if (request.Criterion && !request.Labels) {
        throw std::invalid_argument("Overlapped forward/backward request has a criterion but no labels");
    }

    Tensor x = check_input(*request.ForwardInputs);
    auto acts = std::make_shared<Activations>();

    auto* other = dynamic_cast<LinearStage*>(request.BackwardStage);
    std::optional<BackwardCursor> bwd;
    if (other) {
        bwd = other->begin_backward(*request.BackwardContext, *request.BackwardOutputGrads);
    }

    int layer = 0;
    while (layer < mConfig.num_layers || (bwd && bwd->layer >= 0)) {
        if (layer < mConfig.num_layers) {
            acts->inputs.push_back(x);
            x = forward_layer(layer, x);
            acts->outputs.push_back(x);
            ++layer;
        }
        if (bwd && bwd->layer >= 0) {
            other->backward_layer(*bwd, store);
        }
    }

    dualpipe::OverlapResult result;
    result.Forward = dualpipe::ForwardResult{TensorList{x}, acts};
    if (request.Criterion) {
        result.Loss = request.Criterion->compute(result.Forward.Outputs, *request.Labels);
    }
    if (bwd) {
        result.InputGrads = TensorList{bwd->grad};
    } else {
        result.InputGrads = request.BackwardStage->backward(*request.BackwardContext, *request.BackwardOutputGrads, store);
    }
    return result;
}

} // namespace modules
