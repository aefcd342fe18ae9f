// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_MODULES_PIPELINE_LINEAR_STAGE_H
#define DUALPIPE_SRC_MODULES_PIPELINE_LINEAR_STAGE_H

#include <cstdint>
#include <string_view>
#include <vector>

#include "pipeline/stage.h"
#include "utilities/tensor.h"

namespace modules {

enum class EActivation {
    Identity,
    Tanh
};

EActivation activation_from_str(std::string_view name);
const char* activation_to_str(EActivation activation);

/**
 * @brief A stack of dense layers acting as one pipeline shard: y = act(x @ W^T + b), per layer.
 *
 * Works on FP32 tensors of shape (batch, hidden). Parameters are initialized from the seed,
 * so two instances with the same config hold identical weights. Gradients accumulate across
 * backward calls until zero_grad().
 *
 * Weight layout:
 * - weight: (hidden, hidden), (out_features, in_features)
 * - bias: (hidden,)
 */
class LinearStage : public dualpipe::IStage {
public:
    struct Config {
        int hidden_size;
        int num_layers = 1;
        EActivation activation = EActivation::Tanh;
        std::uint64_t seed = 0;
        bool overlap = false;       ///< Advertise fused forward/backward support
    };

    struct Weights {
        Tensor weight;
        Tensor bias;
    };

    struct Gradients {
        Tensor d_weight;
        Tensor d_bias;
    };

    //! Saved state for backward: the input and the activated output of every layer.
    struct Activations : public dualpipe::StageContext {
        std::vector<Tensor> inputs;
        std::vector<Tensor> outputs;
    };

    explicit LinearStage(Config config);

    dualpipe::ForwardResult forward(const TensorList& inputs, bool requires_grad) override;
    TensorList backward(const dualpipe::StageContext& context, const TensorList& output_grads,
                        dualpipe::WeightGradStore& store) override;

    [[nodiscard]] bool supports_overlap() const override { return mConfig.overlap; }

    /**
     * @brief Forward of this stage interleaved layer by layer with the backward of the request's stage.
     *
     * If the backward stage is another LinearStage, its layers are processed alternately with
     * the forward layers of this stage; otherwise the backward half runs after the forward half.
     */
    dualpipe::OverlapResult forward_backward(const dualpipe::OverlapRequest& request,
                                             dualpipe::WeightGradStore& store) override;

    void zero_grad();

    [[nodiscard]] const Config& config() const { return mConfig; }
    [[nodiscard]] int num_layers() const { return mConfig.num_layers; }
    [[nodiscard]] int hidden_size() const { return mConfig.hidden_size; }

    [[nodiscard]] const Weights& weights(int layer) const { return mWeights.at(layer); }
    [[nodiscard]] const Gradients& grads(int layer) const { return mGrads.at(layer); }

private:
    struct BackwardCursor {
        const Activations* acts;
        Tensor grad;
        int layer;
    };

    [[nodiscard]] Tensor check_input(const TensorList& inputs) const;
    Tensor forward_layer(int layer, const Tensor& x) const;
    BackwardCursor begin_backward(const dualpipe::StageContext& context, const TensorList& output_grads) const;
    void backward_layer(BackwardCursor& cursor, dualpipe::WeightGradStore& store);

    Config mConfig;
    std::vector<Weights> mWeights;
    std::vector<Gradients> mGrads;
};

} // namespace modules

#endif //DUALPIPE_SRC_MODULES_PIPELINE_LINEAR_STAGE_H
