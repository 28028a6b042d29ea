/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "reelforge/types.hpp"

namespace reelforge {

// Retry and timeout policy for one stage.
struct StagePolicy {
    int retries = 0;
    Millis timeout{0};            // 0 = no deadline
    Millis backoffBase{1000};
    double backoffMultiplier = 2.0;
    Millis backoffCeiling{60000};

    // Delay before re-entering the stage after the given (1-based) failed attempt.
    [[nodiscard]] Millis delayFor(int attempt) const noexcept;
};

struct LimitsConfig {
    std::size_t maxBatchSize = 50;
    std::size_t maxTopicBytes = 512;
};

struct LaneConfig {
    int scriptWorkers = 4;
    int renderWorkers = 2;
    int uploadWorkers = 4;
};

struct GovernorConfig {
    unsigned capacity = 1;        // concurrent renders per physical GPU
    unsigned renderCost = 1;
    Millis acquireTimeout{600000};
};

struct UploadConfig {
    unsigned maxPerInterval = 10;
    Millis interval{60000};
    std::string command = "reelforge-upload";
    std::vector<std::string> tags = {"shorts"};
};

// Vertical short defaults: 1080x1920 @ 30fps, 15s.
struct RenderConfig {
    std::string ffmpeg = "ffmpeg";
    int width = 1080;
    int height = 1920;
    int fps = 30;
    double durationSeconds = 15.0;
    std::string videoCodec = "libx264";
    std::string videoBitrate = "5000k";
    std::string audioBitrate = "192k";
    int threads = 4;
    int paddingX = 60;
    int titleY = 60;
    int titleFontSize = 65;
    int captionFontSize = 55;
    std::string textColor = "white";
    std::string captionColor = "yellow";
    double musicVolume = 0.35;
};

struct GeneratorConfig {
    std::string modelPath;
    std::string promptTemplate;
};

struct AssetConfig {
    std::filesystem::path directory = "assets";
    std::vector<std::filesystem::path> fontFallbacks = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/System/Library/Fonts/Menlo.ttc",
    };
};

struct PipelineConfig {
    std::filesystem::path workspace = "workspace";
    bool resume = false;
    bool echoStatus = false;

    LimitsConfig limits;
    LaneConfig lanes;
    GovernorConfig governor;

    StagePolicy scripting{3, Millis(120000), Millis(500), 2.0, Millis(30000)};
    StagePolicy rendering{2, Millis(600000), Millis(2000), 2.0, Millis(60000)};
    StagePolicy uploading{5, Millis(120000), Millis(1000), 2.0, Millis(120000)};

    UploadConfig upload;
    RenderConfig render;
    GeneratorConfig generator;
    AssetConfig assets;

    // Policy for an attempted stage; throws ConfigError for Queued/Done/Failed.
    [[nodiscard]] const StagePolicy& policyFor(Stage stage) const;

    // Overlay values from a JSON document. Unknown keys are ignored.
    void applyJsonText(const std::string& text);
    void applyJsonFile(const std::filesystem::path& path);
    // Overlay REELFORGE_* environment variables.
    void applyEnv();
    // Throws ConfigError describing the first invalid value.
    void validate() const;

    [[nodiscard]] static PipelineConfig load(const std::filesystem::path& file);
};

[[nodiscard]] std::string defaultPromptTemplate();

}
