/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace reelforge {

struct CaptionCue {
    std::string text;
    double start = 0.0;
    double end = 0.0;

    bool operator==(const CaptionCue& other) const noexcept {
        return text == other.text && start == other.start && end == other.end;
    }
};

// Structured output of the text-generation step.
struct Script {
    std::string title;
    std::vector<std::string> narration;
    std::vector<CaptionCue> captions;

    [[nodiscard]] bool empty() const noexcept { return title.empty() && narration.empty(); }
    bool operator==(const Script& other) const noexcept {
        return title == other.title && narration == other.narration && captions == other.captions;
    }
};

enum class ScriptProblem : uint8_t { None, EmptyOutput, NoJson, InvalidJson, InvalidFields };

struct ScriptParseResult {
    bool ok = false;
    Script script;
    ScriptProblem problem = ScriptProblem::None;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Locate the JSON object in free-form model output: a ```json fence, then any
// fence opening with '{', then the span between the first '{' and last '}'.
// Comment lines are dropped and trailing commas removed.
[[nodiscard]] std::optional<std::string> extractJsonObject(const std::string& text);

// Trim whitespace, markdown fences and wrapping quotes from a field value.
[[nodiscard]] std::string cleanValue(const std::string& value);

// Evenly spread narration lines across the video duration.
[[nodiscard]] std::vector<CaptionCue> deriveCues(const std::vector<std::string>& lines, double durationSeconds);

// Parse and validate model output into a Script. Missing captions are derived.
[[nodiscard]] ScriptParseResult parseScript(const std::string& modelOutput, double durationSeconds);

[[nodiscard]] std::string scriptToJson(const Script& script);

// Script cache on disk (written atomically through a temp file).
[[nodiscard]] bool writeScriptFile(const std::filesystem::path& path, const Script& script) noexcept;
[[nodiscard]] std::optional<Script> readScriptFile(const std::filesystem::path& path) noexcept;

}
