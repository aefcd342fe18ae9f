// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "utilities/comm.h"
#include "utilities/tensor.h"

#include "training/logging.h"
#include "config/pipeline_config.h"
#include "pipeline/dualpipe.h"
#include "modules/pipeline/linear_stage.h"
#include "modules/pipeline/mse_loss.h"
#include "modules/pipeline/sequential_reference.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace {

//! Batches of both directions. Direction 0 enters at the first rank, direction 1 at the last.
struct PipelineData {
    Tensor InputsF;
    Tensor LabelsF;
    Tensor InputsB;
    Tensor LabelsB;
};

Tensor random_tensor(long rows, long cols, std::mt19937_64& rng) {
    std::normal_distribution<float> dist(0.f, 1.f);
    Tensor t = Tensor::allocate(ETensorDType::FP32, {rows, cols});
    float* p = t.get<float>();
    for (std::size_t i = 0; i < t.nelem(); ++i) {
        p[i] = dist(rng);
    }
    return t;
}

//! Deterministic for a given seed and step, so every rank can produce the same data.
PipelineData make_data(const PipelineConfig& cfg, int step) {
    std::mt19937_64 rng(cfg.Seed * 7919 + static_cast<std::uint64_t>(step));
    PipelineData data;
    data.InputsF = random_tensor(cfg.BatchSize, cfg.HiddenSize, rng);
    data.LabelsF = random_tensor(cfg.BatchSize, cfg.HiddenSize, rng);
    data.InputsB = random_tensor(cfg.BatchSize, cfg.HiddenSize, rng);
    data.LabelsB = random_tensor(cfg.BatchSize, cfg.HiddenSize, rng);
    return data;
}

struct LossSummary {
    double Sum = 0.0;
    int Count = 0;
};

float max_abs_diff(const Tensor& a, const Tensor& b) {
    const float* ap = a.get<float>();
    const float* bp = b.get<float>();
    float diff = 0.f;
    for (std::size_t i = 0; i < a.nelem(); ++i) {
        diff = std::max(diff, std::abs(ap[i] - bp[i]));
    }
    return diff;
}

} // namespace

/**
 * @brief Command-line driver: runs a bidirectional pipeline over in-process ranks.
 *
 * Each rank r owns the reference shard r for direction 0 and shard N-1-r for direction 1,
 * so both directions traverse the same sequence of layers.
 */
struct PipelineRunner {
    PipelineConfig Config;
    std::string ConfigFile;

    void load_config(int argc, const char** argv);
    void launch(int argc, const char** argv);

    void run_pipeline(int argc, const char** argv, Communicator& comm);

private:
    //! What a rank shares with rank 0 for the reference check.
    struct RankReport {
        std::shared_ptr<modules::LinearStage> Stages[2];
        std::vector<float> Losses;
    };

    void check_against_reference(int step, const PipelineData& data, PipelineRunLogger& logger) const;

    // indexed by pipeline rank; each rank writes only its own entry
    std::vector<RankReport> mReports;
};

void PipelineRunner::load_config(int argc, const char** argv) {
    // a config file provides the defaults that the remaining flags override
    {
        CLI::App pre;
        pre.allow_extras();
        pre.set_help_flag();
        pre.add_option("--config", ConfigFile);
        try {
            pre.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(pre.exit(e));
        }
    }
    if (!ConfigFile.empty()) {
        Config = load_pipeline_config(ConfigFile.c_str());
    }

    CLI::App app{"Bidirectional pipeline-parallel scheduler driver"};
    app.add_option("--config", ConfigFile, "JSON file with run settings; command-line flags take precedence");
    app.add_option("--ranks,--num-ranks", Config.NumRanks, "Number of pipeline ranks (even)")->check(CLI::PositiveNumber);
    app.add_option("--chunks,--num-chunks", Config.NumChunks, "Micro-batches per step over both directions")->check(CLI::PositiveNumber);
    app.add_option("--batch,--batch-size", Config.BatchSize, "Rows per direction and step")->check(CLI::PositiveNumber);
    app.add_option("--hidden,--hidden-size", Config.HiddenSize, "Feature dimension of every stage")->check(CLI::PositiveNumber);
    app.add_option("--layers,--num-layers-per-stage", Config.NumLayersPerStage, "Dense layers per stage")->check(CLI::PositiveNumber);
    app.add_option("--activation", Config.Activation, "Activation after each layer")
        ->check(CLI::IsMember({"identity", "tanh"}, CLI::ignore_case));
    app.add_option("--steps", Config.Steps, "Number of pipeline steps")->check(CLI::PositiveNumber);
    app.add_flag("--return-outputs,!--no-return-outputs", Config.ReturnOutputs, "Keep and gather the outputs of the last stages");
    app.add_flag("--forward-only,!--no-forward-only", Config.ForwardOnly, "Run inference steps without backward work");
    app.add_flag("--overlap,!--no-overlap", Config.Overlap, "Fuse forward and backward chunks of opposite directions");
    app.add_option("--rank-mapping", Config.RankMapping, "Pipeline rank of each communicator rank");
    app.add_option("--seed", Config.Seed, "Seed for weights and data");
    app.add_option("--log-file", Config.LogFile, "Where to save the JSON run log");
    app.add_option("--verbosity", Config.Verbosity, "silent, quiet, default or verbose")
        ->check(CLI::IsMember({"silent", "quiet", "default", "verbose"}, CLI::ignore_case));
    app.add_option("--recv-timeout-ms", Config.RecvTimeoutMs, "Fail a receive that waits longer than this; 0 waits forever")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--check,!--no-check", Config.Check, "Compare losses and gradients against a single-process run");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    Config.validate();
}

void PipelineRunner::launch(int argc, const char** argv) {
    mReports.assign(Config.NumRanks, RankReport{});
    CommunicatorOptions options;
    options.RecvTimeout = std::chrono::milliseconds(Config.RecvTimeoutMs);
    Communicator::run_communicators(Config.NumRanks, options,
        [&](Communicator& comm) { run_pipeline(argc, argv, comm); });
}

void PipelineRunner::run_pipeline(int argc, const char** argv, Communicator& comm) {
    const PipelineConfig& cfg = Config;
    PipelineRunLogger logger(cfg.LogFile, comm.rank(), verbosity_from_str(cfg.Verbosity));
    logger.log_cmd(argc, argv);
    logger.log_options({
        {"num_ranks", static_cast<std::int64_t>(cfg.NumRanks)},
        {"num_chunks", static_cast<std::int64_t>(cfg.NumChunks)},
        {"batch_size", static_cast<std::int64_t>(cfg.BatchSize)},
        {"hidden_size", static_cast<std::int64_t>(cfg.HiddenSize)},
        {"num_layers_per_stage", static_cast<std::int64_t>(cfg.NumLayersPerStage)},
        {"activation", cfg.Activation},
        {"steps", static_cast<std::int64_t>(cfg.Steps)},
        {"return_outputs", cfg.ReturnOutputs},
        {"forward_only", cfg.ForwardOnly},
        {"overlap", cfg.Overlap},
        {"seed", static_cast<std::int64_t>(cfg.Seed)},
        {"recv_timeout_ms", static_cast<std::int64_t>(cfg.RecvTimeoutMs)},
        {"check", cfg.Check},
    });

    const int N = cfg.NumRanks;
    dualpipe::PipelineTopology topology(N, comm.rank(), cfg.RankMapping);
    const int rank = topology.rank();

    auto make_stage = [&](int stage_index) {
        return std::make_shared<modules::LinearStage>(modules::LinearStage::Config{
            .hidden_size = cfg.HiddenSize,
            .num_layers = cfg.NumLayersPerStage,
            .activation = modules::activation_from_str(cfg.Activation),
            .seed = cfg.Seed + static_cast<std::uint64_t>(stage_index),
            .overlap = cfg.Overlap,
        });
    };
    std::shared_ptr<modules::LinearStage> stages[2] = {make_stage(rank), make_stage(N - 1 - rank)};

    dualpipe::DualPipe pipe({stages[0], stages[1]}, comm, 0, cfg.RankMapping);
    pipe.set_logger(&logger);
    pipe.set_p2p_tensor_shapes({{cfg.BatchSize / (cfg.NumChunks / 2), cfg.HiddenSize}});
    pipe.set_p2p_tensor_dtype(ETensorDType::FP32);
    logger.log_topology(topology);
    logger.log_message(0, fmt::format("{} ranks, {} chunks per step, {} overlap", N, cfg.NumChunks,
                                      pipe.overlap_mode() == dualpipe::EOverlapMode::Fused ? "fused" : "sequential"));

    modules::MSELoss criterion;

    for (int step = 0; step < cfg.Steps; ++step) {
        for (auto& stage : stages) {
            stage->zero_grad();
        }

        TensorList inputs;
        TensorList labels;
        PipelineData data;
        if (topology.is_first() || topology.is_last() || (cfg.Check && comm.rank() == 0)) {
            data = make_data(cfg, step);
        }
        if (topology.is_first()) {
            inputs = {data.InputsF};
            labels = {data.LabelsB};
        } else if (topology.is_last()) {
            inputs = {data.InputsB};
            labels = {data.LabelsF};
        }

        comm.barrier();
        auto start = std::chrono::steady_clock::now();
        dualpipe::StepResult result = pipe.step(inputs, cfg.NumChunks, &criterion, labels, cfg.ReturnOutputs, cfg.ForwardOnly);
        comm.barrier();
        int duration_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());

        LossSummary local;
        if (result.Loss) {
            for (float l : *result.Loss) {
                local.Sum += l;
            }
            local.Count = static_cast<int>(result.Loss->size());
        }
        auto summaries = comm.host_all_gather(local);
        LossSummary total;
        for (const auto& s : summaries) {
            total.Sum += s.Sum;
            total.Count += s.Count;
        }
        logger.log_step(step, duration_ms, total.Count > 0 ? static_cast<float>(total.Sum / total.Count) : 0.f, total.Count);

        if (result.Outputs && logger.verbose()) {
            const Tensor& out = result.Outputs->front();
            fmt::print("[rank {}] gathered outputs [{}, {}]\n", rank, out.Sizes[0], out.Sizes[1]);
        }

        if (cfg.Check) {
            mReports[rank] = RankReport{{stages[0], stages[1]}, result.Loss.value_or(std::vector<float>{})};
            comm.barrier();
            if (comm.rank() == 0) {
                check_against_reference(step, data, logger);
            }
            comm.barrier();
        }
    }
}

void PipelineRunner::check_against_reference(int step, const PipelineData& data, PipelineRunLogger& logger) const {
    const PipelineConfig& cfg = Config;
    const int N = cfg.NumRanks;
    const int half_num_chunks = cfg.NumChunks / 2;
    auto section = logger.log_section_start(step, "Checking against the sequential reference");

    std::vector<std::shared_ptr<dualpipe::IStage>> reference;
    std::vector<std::shared_ptr<modules::LinearStage>> linear;
    for (int s = 0; s < N; ++s) {
        linear.push_back(std::make_shared<modules::LinearStage>(modules::LinearStage::Config{
            .hidden_size = cfg.HiddenSize,
            .num_layers = cfg.NumLayersPerStage,
            .activation = modules::activation_from_str(cfg.Activation),
            .seed = cfg.Seed + static_cast<std::uint64_t>(s),
        }));
        reference.push_back(linear.back());
    }

    modules::MSELoss criterion;
    std::vector<float> losses_f = modules::run_sequential_reference(reference, {data.InputsF}, {data.LabelsF}, half_num_chunks, criterion);
    std::vector<float> losses_b = modules::run_sequential_reference(reference, {data.InputsB}, {data.LabelsB}, half_num_chunks, criterion);

    // direction 0 finishes on the last rank, direction 1 on the first
    float loss_diff = 0.f;
    auto compare_losses = [&](const std::vector<float>& expected, const std::vector<float>& actual) {
        if (expected.size() != actual.size()) {
            loss_diff = INFINITY;
            return;
        }
        for (std::size_t i = 0; i < expected.size(); ++i) {
            loss_diff = std::max(loss_diff, std::abs(expected[i] - actual[i]));
        }
    };
    compare_losses(losses_f, mReports[N - 1].Losses);
    compare_losses(losses_b, mReports[0].Losses);

    // every stage runs twice: as direction-0 shard on rank s and as direction-1 shard on rank N-1-s
    float grad_diff = 0.f;
    for (int s = 0; s < N; ++s) {
        const auto& fwd = *mReports[s].Stages[0];
        const auto& bwd = *mReports[N - 1 - s].Stages[1];
        for (int l = 0; l < cfg.NumLayersPerStage; ++l) {
            const auto& ref = linear[s]->grads(l);
            Tensor dw = copy_of(fwd.grads(l).d_weight);
            Tensor db = copy_of(fwd.grads(l).d_bias);
            float* dwp = dw.get<float>();
            float* dbp = db.get<float>();
            const float* bw = bwd.grads(l).d_weight.get<float>();
            const float* bb = bwd.grads(l).d_bias.get<float>();
            for (std::size_t i = 0; i < dw.nelem(); ++i) dwp[i] += bw[i];
            for (std::size_t i = 0; i < db.nelem(); ++i) dbp[i] += bb[i];
            grad_diff = std::max({grad_diff, max_abs_diff(dw, ref.d_weight), max_abs_diff(db, ref.d_bias)});
        }
    }

    const bool passed = loss_diff <= 1e-5f && grad_diff <= 1e-4f;
    logger.log_check(step, loss_diff, grad_diff, passed);
    if (!passed) {
        throw std::runtime_error(fmt::format("Step {}: pipeline deviates from the sequential reference (loss diff {}, grad diff {})",
                                             step, loss_diff, grad_diff));
    }
}

int main(int argc, const char** argv) {
    try {
        PipelineRunner runner;
        runner.load_config(argc, argv);
        runner.launch(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
