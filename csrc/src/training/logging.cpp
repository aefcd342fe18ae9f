// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <fmt/ranges.h>

#include "pipeline/schedule.h"
#include "pipeline/topology.h"
#include "utilities/utils.h"

/**
 * @brief Create a logger that writes a JSON array to @p file_name (rank 0 only).
 *
 * On rank 0, ensures the parent directory exists, opens the file for output,
 * and initializes it as a JSON array (writes "[ ... ]").
 *
 * @param file_name Output path for the JSON log; empty disables the file.
 * @param rank Pipeline participant; only rank 0 writes the JSON file and prints most output.
 * @param verbosity Verbosity level controlling stdout printing.
 */
PipelineRunLogger::PipelineRunLogger(const std::string& file_name, int rank, EVerbosity verbosity) :
    mFileName(file_name), mRank(rank), mVerbosity(verbosity)
{
    if(mRank == 0 && !mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        mLogFile.open(mFileName, std::fstream::out);
        if (!mLogFile.is_open()) {
            throw std::runtime_error(fmt::format("Could not open log file {}", mFileName));
        }
        mLogFile << "[\n";
        mLogFile << "\n]\n";
    }
}

PipelineRunLogger::~PipelineRunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

/**
 * @brief Log configuration options (rank 0 only).
 *
 * Each option is written as a JSON log line and, at verbose level, printed.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void PipelineRunLogger::log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options) {
    if(mRank != 0) return;

    int option_length = 0;
    for(auto& [name, value]: options) {
        option_length = std::max(option_length, static_cast<int>(name.size()));
    }

    if(mVerbosity >= VERBOSE) {
        printf("[Options]\n");
    }
    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": "{}"}})",
                                     std::chrono::system_clock::now(), name, v));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
            if(mVerbosity >= VERBOSE) {
                printf("  %-*s : %s\n", option_length, std::string(name).c_str(), fmt::format("{}", v).c_str());
            }
        };
        std::visit(log, value);
    }
    if(mVerbosity >= VERBOSE) {
        printf("\n");
    }
}

void PipelineRunLogger::log_topology(const dualpipe::PipelineTopology& topology) {
    if(mVerbosity >= VERBOSE) {
        printf("[rank %d] comm rank %d, prev %d, next %d, half rank %d%s%s\n", topology.rank(), topology.comm_rank(),
               topology.prev_rank(), topology.next_rank(), topology.half_rank(),
               topology.is_middle() ? ", middle" : "", topology.is_in_second_half() ? ", second half" : "");
    }
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "topology", "time": "{}", "rank": {}, "comm_rank": {}, "num_ranks": {}, "prev_rank": {}, "next_rank": {}, "half_rank": {}, "middle": {}}})",
                         std::chrono::system_clock::now(), topology.rank(), topology.comm_rank(), topology.num_ranks(),
                         topology.prev_rank(), topology.next_rank(), topology.half_rank(), topology.is_middle()));
}

/**
 * @brief Log the per-phase iteration counts of one participant's schedule.
 *
 * Unlike most records, plans are logged for every rank: each participant runs a
 * different schedule. Only rank 0 writes to the JSON file.
 */
void PipelineRunLogger::log_plan(int pipeline_rank, const dualpipe::SchedulePlan& plan) {
    if(mVerbosity >= VERBOSE) {
        printf("[rank %d] schedule (half rank %d): [%s], %d iterations\n", pipeline_rank, plan.HalfRank,
               fmt::format("{}", fmt::join(plan.Iterations, ", ")).c_str(), plan.total_iterations());
    }
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "plan", "time": "{}", "rank": {}, "num_ranks": {}, "num_chunks": {}, "half_rank": {}, "iterations": [{}]}})",
                         std::chrono::system_clock::now(), pipeline_rank, plan.NumRanks, plan.NumChunks, plan.HalfRank,
                         fmt::join(plan.Iterations, ", ")));
}

void PipelineRunLogger::log_phase(int pipeline_rank, int phase, int iterations, long duration_us) {
    if(mVerbosity >= VERBOSE) {
        printf("[rank %d] %-10s x%-3d %8ld us\n", pipeline_rank, dualpipe::schedule_phase_name(phase), iterations, duration_us);
    }
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "phase", "time": "{}", "rank": {}, "phase": "{}", "iterations": {}, "duration_us": {}}})",
                         std::chrono::system_clock::now(), pipeline_rank, dualpipe::schedule_phase_name(phase), iterations, duration_us));
}

/**
 * @brief Log a pipeline step (rank 0 only).
 *
 * Updates the running mean of the loss over all steps logged so far.
 *
 * @param step Step index.
 * @param duration_ms Wall time of the step.
 * @param loss Mean loss over the micro-batches of both directions.
 * @param num_micro_batches Number of losses @p loss averages; 0 for steps without a loss.
 */
void PipelineRunLogger::log_step(int step, int duration_ms, float loss, int num_micro_batches)
{
    if(mRank != 0) return;

    if (num_micro_batches > 0) {
        mTotalLoss += loss;
        ++mTotalSteps;
    }

    if(mVerbosity >= 0) {
        if (num_micro_batches == 0) {
            printf(":: step %5d | %5d ms\n", step, duration_ms);
        } else {
            printf(":: step %5d | loss %8.6f | avg %8.6f | %3d micro-batches | %5d ms\n",
                   step, loss, mTotalLoss / mTotalSteps, num_micro_batches, duration_ms);
        }
        fflush(stdout);
    }
    log_line(fmt::format(R"(  {{"log": "step", "time": "{}", "step": {}, "duration_ms": {}, "loss": {}, "micro_batches": {}}})",
        std::chrono::system_clock::now(), step, duration_ms, loss, num_micro_batches));
}

void PipelineRunLogger::log_check(int step, float max_loss_diff, float max_grad_diff, bool passed) {
    if(mRank != 0) return;
    if(mVerbosity >= 0) {
        printf("   check vs. sequential reference: %s (loss diff %.3g, grad diff %.3g)\n",
               passed ? "ok" : "MISMATCH", max_loss_diff, max_grad_diff);
    }
    log_line(fmt::format(R"(  {{"log": "check", "time": "{}", "step": {}, "max_loss_diff": {}, "max_grad_diff": {}, "passed": {}}})",
                         std::chrono::system_clock::now(), step, max_loss_diff, max_grad_diff, passed));
}

/**
 * @brief Log the command line used to start the run (rank 0 only).
 *
 * Writes a JSON line containing argv as an array of strings.
 */
void PipelineRunLogger::log_cmd(int argc, const char** argv)
{
    if(mRank != 0) return;
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "step": 0, "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += fmt::format("\"{}\"", argv[i]);
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Append a JSON object line to the log array.
 *
 * The file always ends in "\n]\n"; the closing bracket is overwritten so the
 * file is valid JSON after every line.
 */
void PipelineRunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    if(!mLogFile.is_open()) return;

    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

void PipelineRunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

/**
 * @brief Log an informational message (rank 0 only).
 */
void PipelineRunLogger::log_message(int step, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= 0) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": "{}"}})",
                         std::chrono::system_clock::now(), step, msg ));
}

/**
 * @brief Begin a timed logging section (rank 0 only).
 *
 * @return RAII_Section handle; on non-zero ranks, contains nullptr and is a no-op.
 */
PipelineRunLogger::RAII_Section PipelineRunLogger::log_section_start(int step, const std::string& info) {
    if(mRank != 0) return RAII_Section{nullptr};
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= 0) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

void PipelineRunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": "{}", "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionStep, mSectionInfo, milliseconds ));

    if(mVerbosity >= 0) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}

PipelineRunLogger::EVerbosity verbosity_from_str(std::string_view name) {
    if (iequals(name, "silent")) return PipelineRunLogger::SILENT;
    if (iequals(name, "quiet")) return PipelineRunLogger::QUIET;
    if (iequals(name, "default")) return PipelineRunLogger::DEFAULT;
    if (iequals(name, "verbose")) return PipelineRunLogger::VERBOSE;
    throw std::invalid_argument(fmt::format("Unknown verbosity '{}'", name));
}
