// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_PIPELINE_DUALPIPE_H
#define DUALPIPE_SRC_PIPELINE_DUALPIPE_H

#include <array>
#include <memory>
#include <optional>
#include <vector>

#include "pipeline/chunk_queues.h"
#include "pipeline/comm_batcher.h"
#include "pipeline/schedule.h"
#include "pipeline/stage.h"
#include "pipeline/topology.h"
#include "pipeline/weight_grad_store.h"
#include "utilities/tensor.h"

class Communicator;
class PipelineRunLogger;

namespace dualpipe {

enum class EOverlapMode {
    //! Combined forward/backward slots run the two halves one after the other.
    Sequential,
    //! Combined slots call IStage::forward_backward() on the forward stage.
    Fused
};

struct StepResult {
    //! Per-micro-batch losses, in micro-batch order. Only on the first and last rank, and only with a criterion.
    std::optional<std::vector<float>> Loss;
    //! Outputs of the last stage, gathered along the batch dimension. Only on the first and last rank.
    std::optional<TensorList> Outputs;
};

struct StepStats {
    std::array<ChunkCursors, 2> Cursors;
    bool WeightQueueDrained = true;
    CommStats Comm;
    int NumLosses = 0;
    std::array<long, NUM_SCHEDULE_PHASES> PhaseDurationUs{};
    //! Backward chunks per schedule phase whose weight-gradient work was deferred to a later weight slot.
    std::array<int, NUM_SCHEDULE_PHASES> DeferredWeightUnits{};
};

/**
 * @brief Bidirectional pipeline-parallel scheduler.
 *
 * Every participant holds two stages: stages[0] belongs to the direction that flows from
 * the first to the last pipeline rank, stages[1] to the direction that flows back. Micro-batches
 * are injected from both ends at once, and each participant interleaves forward, backward
 * and deferred weight-gradient work of both directions in an eight-phase program whose
 * iteration counts depend on its distance from the nearer end of the pipeline.
 *
 * One instance per participant; step() must be called collectively by all participants
 * with the same number of chunks.
 */
class DualPipe {
public:
    /**
     * @param stages The two local model shards, indexed by direction.
     * @param comm Point-to-point transport; its world size is the number of pipeline ranks.
     * @param batch_dim Dimension along which step() splits inputs and labels into micro-batches.
     * @param rank_mapping Optional communicator rank -> pipeline rank permutation.
     */
    DualPipe(std::array<std::shared_ptr<IStage>, 2> stages, Communicator& comm, int batch_dim = 0, std::vector<int> rank_mapping = {});

    //! Shapes of the tensors exchanged between neighbors, one entry per tensor of a message.
    void set_p2p_tensor_shapes(std::vector<std::vector<long>> shapes);
    void set_p2p_tensor_dtype(ETensorDType dtype);

    //! Optional; the logger must outlive every later step() call.
    void set_logger(PipelineRunLogger* logger) { mLogger = logger; }

    /**
     * @brief Runs one full pipeline step over @p num_chunks micro-batches.
     *
     * On the first rank, @p inputs feed direction 0 and @p labels belong to direction 1; on the
     * last rank it is the other way round. Each is split into num_chunks / 2 micro-batches.
     * Other ranks ignore both.
     *
     * @param criterion Required on the first and last rank unless @p forward_only.
     * @param return_outputs Keep and return the outputs of the last stage.
     * @param forward_only Skip all backward and weight-gradient work.
     *
     * @throws std::invalid_argument if a precondition is violated. Internal state is reset
     *         whenever an exception escapes, so the instance stays usable.
     */
    StepResult step(const TensorList& inputs, int num_chunks, ICriterion* criterion = nullptr,
                    const TensorList& labels = {}, bool return_outputs = false, bool forward_only = false);

    [[nodiscard]] const PipelineTopology& topology() const { return mTopology; }
    [[nodiscard]] EOverlapMode overlap_mode() const { return mOverlapMode; }
    [[nodiscard]] int batch_dim() const { return mBatchDim; }

    [[nodiscard]] const SchedulePlan& last_plan() const { return mLastPlan; }
    [[nodiscard]] const StepStats& last_step_stats() const { return mLastStats; }

private:
    struct StepState {
        ChunkQueues Queues{0};
        std::array<std::vector<std::shared_ptr<StageContext>>, 2> Contexts;
        std::array<std::vector<TensorList>, 2> Labels;
        std::vector<float> Losses;
        ICriterion* Criterion = nullptr;
        bool ReturnOutputs = false;
        bool ForwardOnly = false;
        int Phase = -1;
    };

    void reset_state();
    void load_inputs(const TensorList& inputs, const TensorList& labels, int half_num_chunks);
    void run_schedule(const SchedulePlan& plan);
    StepResult collect_result(const SchedulePlan& plan);

    [[nodiscard]] bool is_first_stage(int phys) const;
    [[nodiscard]] bool is_last_stage(int phys) const;

    void forward_compute_chunk(int phase);
    void backward_compute_chunk(int phase, bool enable_zb = false);
    void forward_backward_compute_chunk(int phase0, int phase1);

    void post_forward(int phys, int chunk_id, ForwardResult forward, std::optional<LossResult> loss);
    void post_backward(int phys, int chunk_id, TensorList input_grads);
    std::shared_ptr<StageContext> take_context(int phys, int chunk_id);

    void forward_chunk(int phase, bool recv = true, bool send = true);
    void backward_chunk(int phase, bool enable_zb = false, bool recv = true, bool send = true);
    void forward_backward_chunk(int phase0, int phase1, bool recv0 = true);

    void recv_forward(int phase);
    void send_forward(int phase);
    void recv_backward(int phase);
    void send_backward(int phase);

    void weight_chunk();
    void commit();

    std::array<std::shared_ptr<IStage>, 2> mStages;
    PipelineTopology mTopology;
    CommBatcher mBatcher;
    WeightGradStore mWeightGrads;
    EOverlapMode mOverlapMode;
    int mBatchDim;

    StepState mState;
    SchedulePlan mLastPlan;
    StepStats mLastStats;
    PipelineRunLogger* mLogger = nullptr;
};

} // namespace dualpipe

#endif //DUALPIPE_SRC_PIPELINE_DUALPIPE_H
