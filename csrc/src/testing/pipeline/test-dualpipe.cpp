// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Multi-rank tests of the bidirectional pipeline scheduler. Every participant runs as a
// thread; results are collected per rank and checked after all threads have joined.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "modules/pipeline/linear_stage.h"
#include "modules/pipeline/mse_loss.h"
#include "modules/pipeline/sequential_reference.h"
#include "pipeline/dualpipe.h"
#include "training/logging.h"
#include "utilities/comm.h"

#include "test_config.h"
#include "test_utils.h"

using namespace testing_utils;

namespace {

constexpr std::uint64_t kSeed = 1234;

struct Scenario {
    int NumRanks = 4;
    int NumChunks = 8;
    bool Overlap = false;
    bool ForwardOnly = false;
    bool ReturnOutputs = false;
    std::vector<int> RankMapping;
    int Steps = 1;
};

struct Batches {
    Tensor InputsF;
    Tensor LabelsF;
    Tensor InputsB;
    Tensor LabelsB;
};

struct RankOutcome {
    std::vector<std::optional<std::vector<float>>> Losses;  // one entry per step
    std::optional<TensorList> Outputs;
    dualpipe::StepStats Stats;
    dualpipe::SchedulePlan Plan;
    dualpipe::EOverlapMode Mode = dualpipe::EOverlapMode::Sequential;
    std::array<std::shared_ptr<modules::LinearStage>, 2> Stages;
};

struct Reference {
    std::vector<float> LossesF;
    std::vector<float> LossesB;
    std::vector<std::shared_ptr<modules::LinearStage>> Stages;
};

CommunicatorOptions comm_options() {
    CommunicatorOptions options;
    options.RecvTimeout = std::chrono::milliseconds(testing_config::get_test_config().RecvTimeoutMs);
    return options;
}

std::shared_ptr<modules::LinearStage> make_stage(int index, bool overlap) {
    const auto& cfg = testing_config::get_test_config();
    return std::make_shared<modules::LinearStage>(modules::LinearStage::Config{
        .hidden_size = cfg.Hidden,
        .num_layers = cfg.Layers,
        .activation = modules::EActivation::Tanh,
        .seed = kSeed + static_cast<std::uint64_t>(index),
        .overlap = overlap,
    });
}

Batches make_batches() {
    const auto& cfg = testing_config::get_test_config();
    const std::vector<long> shape = {cfg.Batch, cfg.Hidden};
    return {random_tensor(shape, 1), random_tensor(shape, 2), random_tensor(shape, 3), random_tensor(shape, 4)};
}

std::vector<std::vector<long>> p2p_shapes(int num_chunks) {
    const auto& cfg = testing_config::get_test_config();
    return {{cfg.Batch / (num_chunks / 2), cfg.Hidden}};
}

//! Runs @p s on one thread per rank. The result is indexed by pipeline rank.
std::vector<RankOutcome> run_scenario(const Scenario& s, const Batches& data) {
    std::vector<RankOutcome> outcomes(s.NumRanks);
    Communicator::run_communicators(s.NumRanks, comm_options(), [&](Communicator& comm) {
        dualpipe::PipelineTopology topology(s.NumRanks, comm.rank(), s.RankMapping);
        const int rank = topology.rank();
        RankOutcome& out = outcomes[rank];
        out.Stages = {make_stage(rank, s.Overlap), make_stage(s.NumRanks - 1 - rank, s.Overlap)};

        dualpipe::DualPipe pipe({out.Stages[0], out.Stages[1]}, comm, 0, s.RankMapping);
        pipe.set_p2p_tensor_shapes(p2p_shapes(s.NumChunks));
        pipe.set_p2p_tensor_dtype(ETensorDType::FP32);
        out.Mode = pipe.overlap_mode();

        TensorList inputs;
        TensorList labels;
        if (topology.is_first()) {
            inputs = {data.InputsF};
            labels = {data.LabelsB};
        } else if (topology.is_last()) {
            inputs = {data.InputsB};
            labels = {data.LabelsF};
        }

        modules::MSELoss criterion;
        for (int step = 0; step < s.Steps; ++step) {
            dualpipe::StepResult result = pipe.step(inputs, s.NumChunks, &criterion, labels, s.ReturnOutputs, s.ForwardOnly);
            out.Losses.push_back(result.Loss);
            out.Outputs = result.Outputs;
            out.Stats = pipe.last_step_stats();
            out.Plan = pipe.last_plan();
        }
    });
    return outcomes;
}

Reference run_reference(int num_ranks, int num_chunks, const Batches& data) {
    Reference ref;
    std::vector<std::shared_ptr<dualpipe::IStage>> stages;
    for (int s = 0; s < num_ranks; ++s) {
        ref.Stages.push_back(make_stage(s, false));
        stages.push_back(ref.Stages.back());
    }
    modules::MSELoss criterion;
    ref.LossesF = modules::run_sequential_reference(stages, {data.InputsF}, {data.LabelsF}, num_chunks / 2, criterion);
    ref.LossesB = modules::run_sequential_reference(stages, {data.InputsB}, {data.LabelsB}, num_chunks / 2, criterion);
    return ref;
}

//! Full-batch forward through all reference stages, in pipeline order.
std::vector<float> reference_forward(const Reference& ref, const Tensor& inputs) {
    Tensor x = inputs;
    for (const auto& stage : ref.Stages) {
        x = stage->forward({x}, false).Outputs.at(0);
    }
    return to_vector(x);
}

void require_losses(const std::vector<float>& expected, const std::optional<std::vector<float>>& actual) {
    REQUIRE(actual.has_value());
    REQUIRE(actual->size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        REQUIRE(actual->at(i) == Catch::Approx(expected[i]).margin(1e-5));
    }
}

//! Stage s is trained twice: by rank s for direction 0 and by rank N-1-s for direction 1.
void require_gradients(const Reference& ref, const std::vector<RankOutcome>& outcomes) {
    const int N = static_cast<int>(outcomes.size());
    for (int s = 0; s < N; ++s) {
        const auto& fwd = *outcomes[s].Stages[0];
        const auto& bwd = *outcomes[N - 1 - s].Stages[1];
        for (int l = 0; l < fwd.num_layers(); ++l) {
            std::vector<float> dw = to_vector(fwd.grads(l).d_weight);
            std::vector<float> db = to_vector(fwd.grads(l).d_bias);
            const std::vector<float> dw_b = to_vector(bwd.grads(l).d_weight);
            const std::vector<float> db_b = to_vector(bwd.grads(l).d_bias);
            for (std::size_t i = 0; i < dw.size(); ++i) dw[i] += dw_b[i];
            for (std::size_t i = 0; i < db.size(); ++i) db[i] += db_b[i];

            INFO("stage " << s << ", layer " << l);
            REQUIRE(max_abs_diff(dw, to_vector(ref.Stages[s]->grads(l).d_weight)) < 1e-4f);
            REQUIRE(max_abs_diff(db, to_vector(ref.Stages[s]->grads(l).d_bias)) < 1e-4f);
        }
    }
}

dualpipe::ChunkCursors all_at(int n) {
    return dualpipe::ChunkCursors{n, n, n, n, n, n};
}

} // namespace

TEST_CASE("dualpipe: training step matches the sequential reference", "[pipeline][dualpipe]") {
    const auto [N, C] = GENERATE(table<int, int>({{2, 4}, {2, 8}, {4, 8}, {4, 12}, {6, 12}, {6, 24}}));
    const bool overlap = GENERATE(false, true);
    CAPTURE(N, C, overlap);

    const Batches data = make_batches();
    Scenario s;
    s.NumRanks = N;
    s.NumChunks = C;
    s.Overlap = overlap;
    auto outcomes = run_scenario(s, data);
    const Reference ref = run_reference(N, C, data);

    require_losses(ref.LossesF, outcomes[N - 1].Losses.at(0));
    require_losses(ref.LossesB, outcomes[0].Losses.at(0));
    for (int r = 1; r < N - 1; ++r) {
        REQUIRE_FALSE(outcomes[r].Losses.at(0).has_value());
    }
    require_gradients(ref, outcomes);

    for (const auto& out : outcomes) {
        REQUIRE(out.Mode == (overlap ? dualpipe::EOverlapMode::Fused : dualpipe::EOverlapMode::Sequential));
        REQUIRE(out.Stats.Cursors[0] == all_at(C / 2));
        REQUIRE(out.Stats.Cursors[1] == all_at(C / 2));
        REQUIRE(out.Stats.WeightQueueDrained);
        REQUIRE_FALSE(out.Outputs.has_value());
    }
}

TEST_CASE("dualpipe: four ranks run their schedule and exchange each chunk once", "[pipeline][dualpipe]") {
    const Batches data = make_batches();
    Scenario s;
    s.NumRanks = 4;
    s.NumChunks = 8;
    auto outcomes = run_scenario(s, data);

    const std::array<int, 8> outer = {2, 1, 1, 1, 1, 1, 1, 1};
    const std::array<int, 8> inner = {0, 2, 0, 2, 0, 2, 0, 2};
    REQUIRE(outcomes[0].Plan.Iterations == outer);
    REQUIRE(outcomes[1].Plan.Iterations == inner);
    REQUIRE(outcomes[2].Plan.Iterations == inner);
    REQUIRE(outcomes[3].Plan.Iterations == outer);

    const int half = s.NumChunks / 2;
    for (int r = 0; r < s.NumRanks; ++r) {
        const dualpipe::CommStats& comm = outcomes[r].Stats.Comm;
        CAPTURE(r);
        // end ranks only communicate in one direction per phase, inner ranks in both
        const int expected = (r == 0 || r == s.NumRanks - 1) ? 2 * half : 4 * half;
        REQUIRE(comm.NumSent == expected);
        REQUIRE(comm.NumReceived == expected);
        REQUIRE(comm.NumCommits > 0);
    }
}

TEST_CASE("dualpipe: zero-bubble phases defer weight gradients", "[pipeline][dualpipe]") {
    const auto [N, C] = GENERATE(table<int, int>({{4, 8}, {6, 12}}));
    const bool overlap = GENERATE(false, true);
    CAPTURE(N, C, overlap);

    const Batches data = make_batches();
    Scenario s;
    s.NumRanks = N;
    s.NumChunks = C;
    s.Overlap = overlap;
    auto outcomes = run_scenario(s, data);

    const int H = N / 2;
    for (int r = 0; r < N; ++r) {
        const int h = std::min(r, N - 1 - r);
        CAPTURE(r, h);
        // nB1W1F1 and nWB0 defer every backward chunk; nB1B0 switches deferral on halfway
        // through, before the B1 chunk when h is odd and after it when h is even, which
        // defers h + 1 chunks either way
        const std::array<int, 8> expected = {0, 0, H - h - 1, 0, 0, h + 1, H - h - 1, 0};
        REQUIRE(outcomes[r].Stats.DeferredWeightUnits == expected);
        REQUIRE(outcomes[r].Stats.WeightQueueDrained);
    }

    SECTION("forward-only steps defer nothing") {
        s.ForwardOnly = true;
        for (const auto& out : run_scenario(s, data)) {
            REQUIRE(out.Stats.DeferredWeightUnits == std::array<int, 8>{});
        }
    }
}

TEST_CASE("dualpipe: forward-only step", "[pipeline][dualpipe]") {
    const auto [N, C] = GENERATE(table<int, int>({{2, 4}, {2, 12}, {4, 8}, {4, 24}, {6, 12}}));
    CAPTURE(N, C);

    const Batches data = make_batches();
    Scenario s;
    s.NumRanks = N;
    s.NumChunks = C;
    s.ForwardOnly = true;
    s.ReturnOutputs = true;
    auto outcomes = run_scenario(s, data);
    const Reference ref = run_reference(N, C, data);

    for (const auto& out : outcomes) {
        REQUIRE(out.Stats.Cursors[0] == all_at(C / 2));
        REQUIRE(out.Stats.Cursors[1] == all_at(C / 2));
        REQUIRE(out.Stats.WeightQueueDrained);
        for (int l = 0; l < out.Stages[0]->num_layers(); ++l) {
            REQUIRE(max_abs_diff(to_vector(out.Stages[0]->grads(l).d_weight),
                                 std::vector<float>(out.Stages[0]->grads(l).d_weight.nelem(), 0.f)) == 0.f);
        }
    }

    require_losses(ref.LossesF, outcomes[N - 1].Losses.at(0));
    require_losses(ref.LossesB, outcomes[0].Losses.at(0));

    REQUIRE(outcomes[N - 1].Outputs.has_value());
    REQUIRE(outcomes[0].Outputs.has_value());
    REQUIRE(max_abs_diff(to_vector(outcomes[N - 1].Outputs->at(0)), reference_forward(ref, data.InputsF)) < 1e-5f);
    REQUIRE(max_abs_diff(to_vector(outcomes[0].Outputs->at(0)), reference_forward(ref, data.InputsB)) < 1e-5f);
}

TEST_CASE("dualpipe: outputs are gathered on the end ranks", "[pipeline][dualpipe]") {
    const auto& cfg = testing_config::get_test_config();
    const Batches data = make_batches();
    Scenario s;
    s.NumRanks = 4;
    s.NumChunks = 12;
    s.ReturnOutputs = true;
    auto outcomes = run_scenario(s, data);
    const Reference ref = run_reference(s.NumRanks, s.NumChunks, data);

    for (int r : {0, 3}) {
        REQUIRE(outcomes[r].Outputs.has_value());
        const Tensor& out = outcomes[r].Outputs->at(0);
        REQUIRE(out.shape() == std::vector<long>{cfg.Batch, cfg.Hidden});
    }
    REQUIRE_FALSE(outcomes[1].Outputs.has_value());
    REQUIRE_FALSE(outcomes[2].Outputs.has_value());

    REQUIRE(max_abs_diff(to_vector(outcomes[3].Outputs->at(0)), reference_forward(ref, data.InputsF)) < 1e-5f);
    REQUIRE(max_abs_diff(to_vector(outcomes[0].Outputs->at(0)), reference_forward(ref, data.InputsB)) < 1e-5f);
    // keeping the outputs must not change the training result
    require_losses(ref.LossesF, outcomes[3].Losses.at(0));
    require_gradients(ref, outcomes);
}

TEST_CASE("dualpipe: rank mapping permutes pipeline positions", "[pipeline][dualpipe]") {
    const Batches data = make_batches();
    Scenario s;
    s.NumRanks = 4;
    s.NumChunks = 8;
    s.RankMapping = {1, 3, 0, 2};
    auto outcomes = run_scenario(s, data);
    const Reference ref = run_reference(s.NumRanks, s.NumChunks, data);

    require_losses(ref.LossesF, outcomes[3].Losses.at(0));
    require_losses(ref.LossesB, outcomes[0].Losses.at(0));
    require_gradients(ref, outcomes);
}

TEST_CASE("dualpipe: consecutive steps are independent", "[pipeline][dualpipe]") {
    const Batches data = make_batches();
    Scenario s;
    s.NumRanks = 4;
    s.NumChunks = 8;
    s.Steps = 2;
    auto outcomes = run_scenario(s, data);

    for (int r : {0, 3}) {
        REQUIRE(outcomes[r].Losses.size() == 2);
        REQUIRE(outcomes[r].Losses[0] == outcomes[r].Losses[1]);
    }
    for (const auto& out : outcomes) {
        REQUIRE(out.Stats.Cursors[0] == all_at(4));
        REQUIRE(out.Stats.WeightQueueDrained);
    }
}

TEST_CASE("dualpipe: a rejected step leaves the instance usable", "[pipeline][dualpipe]") {
    const Batches data = make_batches();
    std::vector<int> rejected(2, 0);
    std::vector<std::optional<std::vector<float>>> losses(2);

    Communicator::run_communicators(2, comm_options(), [&](Communicator& comm) {
        const int rank = comm.rank();
        dualpipe::DualPipe pipe({make_stage(rank, false), make_stage(1 - rank, false)}, comm);
        pipe.set_p2p_tensor_shapes(p2p_shapes(4));
        pipe.set_p2p_tensor_dtype(ETensorDType::FP32);

        TensorList inputs = {rank == 0 ? data.InputsF : data.InputsB};
        TensorList labels = {rank == 0 ? data.LabelsB : data.LabelsF};
        modules::MSELoss criterion;
        try {
            pipe.step(inputs, 5, &criterion, labels);
        } catch (const std::invalid_argument&) {
            rejected[rank] = 1;
        }
        losses[rank] = pipe.step(inputs, 4, &criterion, labels).Loss;
    });

    REQUIRE(rejected == std::vector<int>{1, 1});
    REQUIRE(losses[0].has_value());
    REQUIRE(losses[1].has_value());
    REQUIRE(losses[0]->size() == 2);
    REQUIRE(losses[1]->size() == 2);
}

TEST_CASE("dualpipe: step preconditions", "[pipeline][dualpipe]") {
    const Batches data = make_batches();

    // every rank fails the same check before any communication
    auto run = [&](int num_chunks, bool configure, bool with_criterion, bool with_inputs) {
        Communicator::run_communicators(2, comm_options(), [&](Communicator& comm) {
            const int rank = comm.rank();
            dualpipe::DualPipe pipe({make_stage(rank, false), make_stage(1 - rank, false)}, comm);
            if (configure) {
                pipe.set_p2p_tensor_shapes(p2p_shapes(4));
                pipe.set_p2p_tensor_dtype(ETensorDType::FP32);
            }
            TensorList inputs;
            if (with_inputs) {
                inputs = {rank == 0 ? data.InputsF : data.InputsB};
            }
            TensorList labels = {rank == 0 ? data.LabelsB : data.LabelsF};
            modules::MSELoss criterion;
            pipe.step(inputs, num_chunks, with_criterion ? &criterion : nullptr, labels);
        });
    };

    SECTION("p2p configuration missing") {
        REQUIRE_THROWS_AS(run(4, false, true, true), std::invalid_argument);
    }
    SECTION("odd number of chunks") {
        REQUIRE_THROWS_AS(run(5, true, true, true), std::invalid_argument);
    }
    SECTION("fewer chunks than twice the ranks") {
        REQUIRE_THROWS_AS(run(2, true, true, true), std::invalid_argument);
    }
    SECTION("training without criterion") {
        REQUIRE_THROWS_AS(run(4, true, false, true), std::invalid_argument);
    }
    SECTION("end ranks without inputs") {
        REQUIRE_THROWS_AS(run(4, true, true, false), std::invalid_argument);
    }
}

TEST_CASE("dualpipe: constructor validation", "[pipeline][dualpipe]") {
    auto construct = [](bool null_stage, int batch_dim) {
        Communicator::run_communicators(2, {}, [&](Communicator& comm) {
            std::shared_ptr<dualpipe::IStage> second;
            if (!null_stage) {
                second = make_stage(1, false);
            }
            dualpipe::DualPipe pipe({make_stage(0, false), second}, comm, batch_dim);
        });
    };
    REQUIRE_THROWS_AS(construct(true, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(construct(false, -1), std::invalid_argument);
    REQUIRE_NOTHROW(construct(false, 0));
}

TEST_CASE("dualpipe: schedule phases are logged", "[pipeline][dualpipe][logging]") {
    const Batches data = make_batches();
    std::vector<std::string> lines;

    Communicator::run_communicators(2, comm_options(), [&](Communicator& comm) {
        const int rank = comm.rank();
        PipelineRunLogger logger("", rank, PipelineRunLogger::SILENT);
        if (rank == 0) {
            // only rank 0 emits log lines
            logger.set_callback([&](std::string_view line) { lines.emplace_back(line); });
        }
        dualpipe::DualPipe pipe({make_stage(rank, false), make_stage(1 - rank, false)}, comm);
        pipe.set_logger(&logger);
        pipe.set_p2p_tensor_shapes(p2p_shapes(4));
        pipe.set_p2p_tensor_dtype(ETensorDType::FP32);

        TensorList inputs = {rank == 0 ? data.InputsF : data.InputsB};
        TensorList labels = {rank == 0 ? data.LabelsB : data.LabelsF};
        modules::MSELoss criterion;
        pipe.step(inputs, 4, &criterion, labels);
    });

    int plans = 0;
    int phases = 0;
    for (const auto& line : lines) {
        if (line.find(R"("log": "plan")") != std::string::npos) ++plans;
        if (line.find(R"("log": "phase")") != std::string::npos) ++phases;
    }
    REQUIRE(plans == 1);
    REQUIRE(phases == dualpipe::NUM_SCHEDULE_PHASES);
}
