// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_CONFIG_PIPELINE_CONFIG_H
#define DUALPIPE_SRC_CONFIG_PIPELINE_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

struct PipelineConfig {
    int NumRanks = 4;
    int NumChunks = 16;
    int BatchSize = 32;                 ///< Rows per direction and step, split into NumChunks / 2 micro-batches
    int HiddenSize = 16;
    int NumLayersPerStage = 2;
    std::string Activation = "tanh";

    int Steps = 1;
    bool ReturnOutputs = false;
    bool ForwardOnly = false;
    bool Overlap = false;
    std::vector<int> RankMapping;       ///< Empty: identity
    std::uint64_t Seed = 42;

    std::string LogFile;
    std::string Verbosity = "default";
    int RecvTimeoutMs = 0;
    bool Check = false;

    //! Throws std::invalid_argument if the run cannot be scheduled.
    void validate() const;
};

PipelineConfig load_pipeline_config(const char* file_name);

//! Applies the keys present in @p config_json on top of @p base. Unknown keys are ignored.
PipelineConfig parse_pipeline_config(const nlohmann::json& config_json, PipelineConfig base = {});

#endif //DUALPIPE_SRC_CONFIG_PIPELINE_CONFIG_H
