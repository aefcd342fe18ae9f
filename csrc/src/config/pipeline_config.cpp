// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/pipeline_config.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "modules/pipeline/linear_stage.h"
#include "training/logging.h"
#include "utilities/utils.h"

namespace {

std::optional<std::int64_t> as_int(const nlohmann::json& value) {
    if (value.is_number_integer()) return value.get<std::int64_t>();
    if (value.is_number_unsigned()) return static_cast<std::int64_t>(value.get<std::uint64_t>());
    if (value.is_number_float()) return static_cast<std::int64_t>(value.get<double>());
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int>() != 0;
    if (value.is_string()) {
        const std::string v = value.get<std::string>();
        if (iequals(v, "true") || v == "1") return true;
        if (iequals(v, "false") || v == "0") return false;
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> get_opt(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    std::optional<T> result;
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, std::uint64_t>) {
        if (auto v = as_int(*it)) result = static_cast<T>(*v);
    } else if constexpr (std::is_same_v<T, bool>) {
        result = as_bool(*it);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) result = it->get<std::string>();
    }
    if (!result) {
        throw std::invalid_argument(fmt::format("config: invalid value for '{}': {}", key, it->dump()));
    }
    return result;
}

}  // namespace

void PipelineConfig::validate() const {
    if (NumRanks < 2 || NumRanks % 2 != 0) {
        throw std::invalid_argument(fmt::format("num_ranks must be even and at least 2, got {}", NumRanks));
    }
    if (NumChunks <= 0 || NumChunks % 2 != 0 || NumChunks < 2 * NumRanks) {
        throw std::invalid_argument(fmt::format(
            "num_chunks must be positive, even and at least twice the number of ranks (num_chunks={}, num_ranks={})",
            NumChunks, NumRanks));
    }
    if (BatchSize <= 0 || BatchSize % (NumChunks / 2) != 0) {
        throw std::invalid_argument(fmt::format("batch_size {} must be a positive multiple of num_chunks / 2 = {}",
                                                BatchSize, NumChunks / 2));
    }
    if (HiddenSize <= 0 || NumLayersPerStage <= 0 || Steps <= 0) {
        throw std::invalid_argument(fmt::format("hidden_size ({}), num_layers_per_stage ({}) and steps ({}) must be positive",
                                                HiddenSize, NumLayersPerStage, Steps));
    }
    if (RecvTimeoutMs < 0) {
        throw std::invalid_argument(fmt::format("recv_timeout_ms must not be negative, got {}", RecvTimeoutMs));
    }
    if (!RankMapping.empty() && static_cast<int>(RankMapping.size()) != NumRanks) {
        throw std::invalid_argument(fmt::format("rank_mapping has {} entries for {} ranks", RankMapping.size(), NumRanks));
    }
    if (Check && ForwardOnly) {
        throw std::invalid_argument("check compares gradients and cannot be combined with forward_only");
    }
    modules::activation_from_str(Activation);
    verbosity_from_str(Verbosity);
}

PipelineConfig parse_pipeline_config(const nlohmann::json& config_json, PipelineConfig base) {
    if (!config_json.is_object()) {
        throw std::invalid_argument("config: expected a JSON object");
    }

    PipelineConfig cfg = std::move(base);
    if (auto v = get_opt<int>(config_json, "num_ranks")) cfg.NumRanks = *v;
    if (auto v = get_opt<int>(config_json, "num_chunks")) cfg.NumChunks = *v;
    if (auto v = get_opt<int>(config_json, "batch_size")) cfg.BatchSize = *v;
    if (auto v = get_opt<int>(config_json, "hidden_size")) cfg.HiddenSize = *v;
    if (auto v = get_opt<int>(config_json, "num_layers_per_stage")) cfg.NumLayersPerStage = *v;
    if (auto v = get_opt<std::string>(config_json, "activation")) cfg.Activation = *v;

    if (auto v = get_opt<int>(config_json, "steps")) cfg.Steps = *v;
    if (auto v = get_opt<bool>(config_json, "return_outputs")) cfg.ReturnOutputs = *v;
    if (auto v = get_opt<bool>(config_json, "forward_only")) cfg.ForwardOnly = *v;
    if (auto v = get_opt<bool>(config_json, "overlap")) cfg.Overlap = *v;
    if (auto v = get_opt<std::uint64_t>(config_json, "seed")) cfg.Seed = *v;

    if (auto it = config_json.find("rank_mapping"); it != config_json.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw std::invalid_argument("config: rank_mapping must be an array");
        }
        cfg.RankMapping.clear();
        for (const auto& entry : *it) {
            auto v = as_int(entry);
            if (!v) {
                throw std::invalid_argument(fmt::format("config: invalid rank_mapping entry {}", entry.dump()));
            }
            cfg.RankMapping.push_back(static_cast<int>(*v));
        }
    }

    if (auto v = get_opt<std::string>(config_json, "log_file")) cfg.LogFile = *v;
    if (auto v = get_opt<std::string>(config_json, "verbosity")) cfg.Verbosity = *v;
    if (auto v = get_opt<int>(config_json, "recv_timeout_ms")) cfg.RecvTimeoutMs = *v;
    if (auto v = get_opt<bool>(config_json, "check")) cfg.Check = *v;
    return cfg;
}

PipelineConfig load_pipeline_config(const char* file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open config file {}", file_name));
    }

    const auto config_json = nlohmann::json::parse(file);
    return parse_pipeline_config(config_json);
}
