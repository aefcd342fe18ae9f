// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_PIPELINE_STAGE_H
#define DUALPIPE_SRC_PIPELINE_STAGE_H

#include <memory>
#include <optional>

#include "utilities/tensor.h"

namespace dualpipe {

class IStage;
class WeightGradStore;

//! Whatever a stage needs to keep from a forward pass to run the matching backward pass.
class StageContext {
public:
    virtual ~StageContext() = default;
};

struct ForwardResult {
    TensorList Outputs;
    //! Null if the forward pass ran without gradient tracking.
    std::shared_ptr<StageContext> Context;
};

struct LossResult {
    float Loss = 0.f;
    //! Gradient of the loss with respect to each output of the last stage.
    TensorList OutputGrads;
};

class ICriterion {
public:
    virtual ~ICriterion() = default;
    virtual LossResult compute(const TensorList& outputs, const TensorList& labels) = 0;
};

/**
 * @brief Inputs of a fused forward/backward call.
 *
 * The forward half runs the stage the call is made on; the backward half runs
 * BackwardStage on the saved context of an earlier chunk of the other direction.
 */
struct OverlapRequest {
    const TensorList* ForwardInputs = nullptr;
    //! Set only if the forward chunk is a last stage and a loss should be computed.
    ICriterion* Criterion = nullptr;
    const TensorList* Labels = nullptr;

    IStage* BackwardStage = nullptr;
    const StageContext* BackwardContext = nullptr;
    const TensorList* BackwardOutputGrads = nullptr;
};

struct OverlapResult {
    ForwardResult Forward;
    std::optional<LossResult> Loss;
    TensorList InputGrads;
};

/**
 * @brief One shard of the model, executed by the pipeline for one direction.
 *
 * backward() must return the gradient with respect to each forward input (null entries
 * allowed) and must route all weight-gradient work through @p store.run_or_defer(), so
 * that the scheduler can defer it. Null entries in @p output_grads mean no gradient flows
 * into that output.
 */
class IStage {
public:
    virtual ~IStage() = default;

    virtual ForwardResult forward(const TensorList& inputs, bool requires_grad) = 0;
    virtual TensorList backward(const StageContext& context, const TensorList& output_grads, WeightGradStore& store) = 0;

    //! True if forward_backward() is implemented.
    [[nodiscard]] virtual bool supports_overlap() const { return false; }

    //! Runs the forward half and the backward half of @p request as one interleaved unit.
    virtual OverlapResult forward_backward(const OverlapRequest& request, WeightGradStore& store);
};

} // namespace dualpipe

#endif //DUALPIPE_SRC_PIPELINE_STAGE_H
