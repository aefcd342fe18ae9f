// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_TRAINING_LOGGING_H
#define DUALPIPE_TRAINING_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace dualpipe {
struct SchedulePlan;
class PipelineTopology;
}

class PipelineRunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    //! @p file_name may be empty, in which case no JSON log is written.
    PipelineRunLogger(const std::string& file_name, int rank, EVerbosity verbosity);
    ~PipelineRunLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options);
    void log_topology(const dualpipe::PipelineTopology& topology);
    void log_plan(int pipeline_rank, const dualpipe::SchedulePlan& plan);
    void log_phase(int pipeline_rank, int phase, int iterations, long duration_us);
    void log_step(int step, int duration_ms, float loss, int num_micro_batches);
    void log_check(int step, float max_loss_diff, float max_grad_diff, bool passed);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        RAII_Section(RAII_Section&& other) noexcept : mLogger(std::exchange(other.mLogger, nullptr)) {}
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(PipelineRunLogger* l) : mLogger(l) {}
        PipelineRunLogger* mLogger;

        friend class PipelineRunLogger;
    };

    void log_message(int step, const std::string& msg);
    RAII_Section log_section_start(int step, const std::string& info);
    void log_section_end();

    [[nodiscard]] bool verbose() const { return mVerbosity >= VERBOSE; }
    [[nodiscard]] int rank() const { return mRank; }
private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    int mRank;
    EVerbosity mVerbosity;

    // running mean of the step loss
    double mTotalLoss = 0.0;
    int mTotalSteps = 0;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we safe intermediaries
    std::string mSectionInfo;
    int mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

PipelineRunLogger::EVerbosity verbosity_from_str(std::string_view name);

#endif //DUALPIPE_TRAINING_LOGGING_H
