// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "config/pipeline_config.h"

namespace {

std::filesystem::path write_temp_json(const nlohmann::json& j, const std::string& name) {
    auto dir = std::filesystem::temp_directory_path();
    auto path = dir / name;
    std::ofstream f(path);
    REQUIRE(f.is_open());
    f << j.dump(2);
    return path;
}

} // namespace

TEST_CASE("load_pipeline_config: reads all run settings", "[config]") {
    nlohmann::json j;
    j["num_ranks"] = 6;
    j["num_chunks"] = 20;
    j["batch_size"] = 40;
    j["hidden_size"] = 8;
    j["num_layers_per_stage"] = 3;
    j["activation"] = "identity";
    j["steps"] = 2;
    j["return_outputs"] = true;
    j["forward_only"] = false;
    j["overlap"] = "true";
    j["rank_mapping"] = {5, 4, 3, 2, 1, 0};
    j["seed"] = 7;
    j["log_file"] = "run.json";
    j["verbosity"] = "verbose";
    j["recv_timeout_ms"] = 1000;
    j["check"] = 1;

    auto path = write_temp_json(j, "dualpipe_test_run_config.json");
    PipelineConfig cfg = load_pipeline_config(path.c_str());

    REQUIRE(cfg.NumRanks == 6);
    REQUIRE(cfg.NumChunks == 20);
    REQUIRE(cfg.BatchSize == 40);
    REQUIRE(cfg.HiddenSize == 8);
    REQUIRE(cfg.NumLayersPerStage == 3);
    REQUIRE(cfg.Activation == "identity");
    REQUIRE(cfg.Steps == 2);
    REQUIRE(cfg.ReturnOutputs);
    REQUIRE_FALSE(cfg.ForwardOnly);
    REQUIRE(cfg.Overlap);
    REQUIRE(cfg.RankMapping == std::vector<int>{5, 4, 3, 2, 1, 0});
    REQUIRE(cfg.Seed == 7);
    REQUIRE(cfg.LogFile == "run.json");
    REQUIRE(cfg.Verbosity == "verbose");
    REQUIRE(cfg.RecvTimeoutMs == 1000);
    REQUIRE(cfg.Check);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("parse_pipeline_config: missing keys keep the base values", "[config]") {
    PipelineConfig base;
    base.HiddenSize = 32;
    nlohmann::json j = {{"num_chunks", 24}, {"unrelated", "ignored"}};

    PipelineConfig cfg = parse_pipeline_config(j, base);
    REQUIRE(cfg.NumChunks == 24);
    REQUIRE(cfg.HiddenSize == 32);
    REQUIRE(cfg.NumRanks == PipelineConfig{}.NumRanks);
}

TEST_CASE("parse_pipeline_config: rejects malformed values", "[config]") {
    REQUIRE_THROWS_AS(parse_pipeline_config(nlohmann::json::array()), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_pipeline_config({{"num_ranks", "four"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_pipeline_config({{"overlap", "maybe"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_pipeline_config({{"activation", 3}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_pipeline_config({{"rank_mapping", 3}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_pipeline_config({{"rank_mapping", {0, "x"}}}), std::invalid_argument);
}

TEST_CASE("load_pipeline_config: missing file", "[config]") {
    REQUIRE_THROWS_AS(load_pipeline_config("/nonexistent/dualpipe_config.json"), std::runtime_error);
}

TEST_CASE("PipelineConfig::validate", "[config]") {
    PipelineConfig cfg;
    REQUIRE_NOTHROW(cfg.validate());

    SECTION("odd rank count") {
        cfg.NumRanks = 3;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("too few chunks") {
        cfg.NumChunks = 6;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("odd chunk count") {
        cfg.NumChunks = 17;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("batch not divisible into micro-batches") {
        cfg.BatchSize = 30;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("rank mapping of the wrong size") {
        cfg.RankMapping = {0, 1};
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("check without backward") {
        cfg.Check = true;
        cfg.ForwardOnly = true;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("unknown activation") {
        cfg.Activation = "relu";
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("unknown verbosity") {
        cfg.Verbosity = "loud";
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
}
