/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/config.hpp"
#include "reelforge/errors.hpp"
#include "reelforge/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace reelforge {

namespace {

using json = nlohmann::json;

template <typename T>
void readField(const json& obj, const char* key, T& target, const std::string& scope) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("Invalid value for " + scope + "." + key + ": " + e.what());
    }
}

void readMillis(const json& obj, const char* key, Millis& target, const std::string& scope) {
    long long value = target.count();
    readField(obj, key, value, scope);
    target = Millis(value);
}

void readPolicy(const json& stages, const char* name, StagePolicy& policy) {
    auto it = stages.find(name);
    if (it == stages.end()) {
        return;
    }
    const std::string scope = std::string("stages.") + name;
    readField(*it, "retries", policy.retries, scope);
    readMillis(*it, "timeout_ms", policy.timeout, scope);
    readMillis(*it, "backoff_base_ms", policy.backoffBase, scope);
    readField(*it, "backoff_multiplier", policy.backoffMultiplier, scope);
    readMillis(*it, "backoff_ceiling_ms", policy.backoffCeiling, scope);
}

int env_int(const char* name, int defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring non-numeric ") + name + "=" + val);
        return defv;
    }
}

std::string env_str(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

}

Millis StagePolicy::delayFor(int attempt) const noexcept {
    if (attempt < 1) {
        attempt = 1;
    }
    double delay = static_cast<double>(backoffBase.count()) *
                   std::pow(backoffMultiplier, static_cast<double>(attempt - 1));
    double ceiling = static_cast<double>(backoffCeiling.count());
    if (!std::isfinite(delay) || delay > ceiling) {
        delay = ceiling;
    }
    return Millis(static_cast<Millis::rep>(delay));
}

const StagePolicy& PipelineConfig::policyFor(Stage stage) const {
    switch (stage) {
        case Stage::Scripting: return scripting;
        case Stage::Rendering: return rendering;
        case Stage::Uploading: return uploading;
        default:
            throw ConfigError(std::string("No stage policy for stage ") + stageName(stage));
    }
}

void PipelineConfig::applyJsonText(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    std::string workspaceStr = workspace.string();
    readField(root, "workspace", workspaceStr, "config");
    workspace = workspaceStr;
    readField(root, "resume", resume, "config");
    readField(root, "echo_status", echoStatus, "config");

    if (auto it = root.find("limits"); it != root.end()) {
        readField(*it, "max_batch_size", limits.maxBatchSize, "limits");
        readField(*it, "max_topic_bytes", limits.maxTopicBytes, "limits");
    }
    if (auto it = root.find("lanes"); it != root.end()) {
        readField(*it, "script_workers", lanes.scriptWorkers, "lanes");
        readField(*it, "render_workers", lanes.renderWorkers, "lanes");
        readField(*it, "upload_workers", lanes.uploadWorkers, "lanes");
    }
    if (auto it = root.find("governor"); it != root.end()) {
        readField(*it, "capacity", governor.capacity, "governor");
        readField(*it, "render_cost", governor.renderCost, "governor");
        readMillis(*it, "acquire_timeout_ms", governor.acquireTimeout, "governor");
    }
    if (auto it = root.find("stages"); it != root.end()) {
        readPolicy(*it, "scripting", scripting);
        readPolicy(*it, "rendering", rendering);
        readPolicy(*it, "uploading", uploading);
    }
    if (auto it = root.find("upload"); it != root.end()) {
        readField(*it, "max_per_interval", upload.maxPerInterval, "upload");
        readMillis(*it, "interval_ms", upload.interval, "upload");
        readField(*it, "command", upload.command, "upload");
        readField(*it, "tags", upload.tags, "upload");
    }
    if (auto it = root.find("render"); it != root.end()) {
        const std::string scope = "render";
        readField(*it, "ffmpeg", render.ffmpeg, scope);
        readField(*it, "width", render.width, scope);
        readField(*it, "height", render.height, scope);
        readField(*it, "fps", render.fps, scope);
        readField(*it, "duration_seconds", render.durationSeconds, scope);
        readField(*it, "video_codec", render.videoCodec, scope);
        readField(*it, "video_bitrate", render.videoBitrate, scope);
        readField(*it, "audio_bitrate", render.audioBitrate, scope);
        readField(*it, "threads", render.threads, scope);
        readField(*it, "padding_x", render.paddingX, scope);
        readField(*it, "title_y", render.titleY, scope);
        readField(*it, "title_font_size", render.titleFontSize, scope);
        readField(*it, "caption_font_size", render.captionFontSize, scope);
        readField(*it, "text_color", render.textColor, scope);
        readField(*it, "caption_color", render.captionColor, scope);
        readField(*it, "music_volume", render.musicVolume, scope);
    }
    if (auto it = root.find("generator"); it != root.end()) {
        readField(*it, "model", generator.modelPath, "generator");
        readField(*it, "prompt_template", generator.promptTemplate, "generator");
    }
    if (auto it = root.find("assets"); it != root.end()) {
        std::string dir = assets.directory.string();
        readField(*it, "directory", dir, "assets");
        assets.directory = dir;
        std::vector<std::string> fallbacks;
        readField(*it, "font_fallbacks", fallbacks, "assets");
        if (!fallbacks.empty()) {
            assets.fontFallbacks.assign(fallbacks.begin(), fallbacks.end());
        }
    }
}

void PipelineConfig::applyJsonFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    applyJsonText(text);
    LOG_DEBUG("Loaded config file: " + path.string());
}

void PipelineConfig::applyEnv() {
    lanes.scriptWorkers = env_int("REELFORGE_SCRIPT_WORKERS", lanes.scriptWorkers);
    lanes.renderWorkers = env_int("REELFORGE_RENDER_WORKERS", lanes.renderWorkers);
    lanes.uploadWorkers = env_int("REELFORGE_UPLOAD_WORKERS", lanes.uploadWorkers);
    governor.capacity = static_cast<unsigned>(
        std::max(0, env_int("REELFORGE_GPU_SLOTS", static_cast<int>(governor.capacity))));
    limits.maxBatchSize = static_cast<std::size_t>(
        std::max(0, env_int("REELFORGE_MAX_BATCH", static_cast<int>(limits.maxBatchSize))));

    if (std::getenv("REELFORGE_UPLOADS_PER_MINUTE")) {
        int perMinute = env_int("REELFORGE_UPLOADS_PER_MINUTE", static_cast<int>(upload.maxPerInterval));
        upload.maxPerInterval = static_cast<unsigned>(std::max(0, perMinute));
        upload.interval = Millis(60000);
    }

    scripting.retries = env_int("REELFORGE_SCRIPT_RETRIES", scripting.retries);
    rendering.retries = env_int("REELFORGE_RENDER_RETRIES", rendering.retries);
    uploading.retries = env_int("REELFORGE_UPLOAD_RETRIES", uploading.retries);

    generator.modelPath = env_str("REELFORGE_MODEL", generator.modelPath);
    upload.command = env_str("REELFORGE_UPLOADER", upload.command);
    render.ffmpeg = env_str("REELFORGE_FFMPEG", render.ffmpeg);
}

void PipelineConfig::validate() const {
    if (workspace.empty()) {
        throw ConfigError("workspace must not be empty");
    }
    if (limits.maxBatchSize == 0) {
        throw ConfigError("limits.max_batch_size must be positive");
    }
    if (lanes.scriptWorkers < 1 || lanes.renderWorkers < 1 || lanes.uploadWorkers < 1) {
        throw ConfigError("every lane needs at least one worker");
    }
    if (governor.capacity == 0) {
        throw ConfigError("governor.capacity must be positive");
    }
    if (governor.renderCost == 0 || governor.renderCost > governor.capacity) {
        throw ConfigError("governor.render_cost must be between 1 and governor.capacity");
    }
    if (upload.maxPerInterval == 0 || upload.interval.count() <= 0) {
        throw ConfigError("upload rate limit must allow at least one submission per positive interval");
    }
    for (const auto* policy : {&scripting, &rendering, &uploading}) {
        if (policy->retries < 0) {
            throw ConfigError("stage retries must not be negative");
        }
        if (policy->backoffMultiplier < 1.0) {
            throw ConfigError("stage backoff_multiplier must be >= 1");
        }
        if (policy->backoffBase.count() < 0 || policy->backoffCeiling < policy->backoffBase) {
            throw ConfigError("stage backoff ceiling must be >= base >= 0");
        }
        if (policy->timeout.count() < 0) {
            throw ConfigError("stage timeout must not be negative");
        }
    }
    if (render.width <= 0 || render.height <= 0 || render.fps <= 0 || render.durationSeconds <= 0.0) {
        throw ConfigError("render geometry, fps and duration must be positive");
    }
}

PipelineConfig PipelineConfig::load(const std::filesystem::path& file) {
    PipelineConfig config;
    if (!file.empty()) {
        config.applyJsonFile(file);
    }
    config.applyEnv();
    config.validate();
    return config;
}

std::string defaultPromptTemplate() {
    return
        "Write the script for a 15 second vertical video about: {topic}\n"
        "Respond with a single JSON object and nothing else, using exactly these fields:\n"
        "- \"title\": a short hook, at most 8 words.\n"
        "- \"narration\": a list of 3 to 5 short sentences, spoken in order.\n"
        "- \"captions\": a list of objects {\"text\", \"start\", \"end\"} with times in seconds "
        "between 0 and 15, in order, one per narration sentence.\n"
        "Do not wrap the JSON in markdown fences and do not add explanations.\n";
}

}
