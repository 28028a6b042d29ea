/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace reelforge {

// Pipeline position of a content item. Only Done and Failed are terminal.
enum class Stage : std::uint8_t { Queued, Scripting, Rendering, Uploading, Done, Failed };

enum class FailureKind : std::uint8_t {
    None,
    Generation,
    Render,
    Upload,
    ResourceTimeout,
    Timeout,
    Cancelled,
    Internal
};

using ItemId = std::string;
using BatchId = std::string;
using BatchHandle = BatchId;

using Clock = std::chrono::steady_clock;
using Millis = std::chrono::milliseconds;

[[nodiscard]] constexpr bool isTerminal(Stage stage) noexcept {
    return stage == Stage::Done || stage == Stage::Failed;
}

// Index into per-stage attempt counters; -1 for stages that are never attempted.
[[nodiscard]] constexpr int stageIndex(Stage stage) noexcept {
    switch (stage) {
        case Stage::Scripting: return 0;
        case Stage::Rendering: return 1;
        case Stage::Uploading: return 2;
        default: return -1;
    }
}

[[nodiscard]] const char* stageName(Stage stage) noexcept;
[[nodiscard]] bool parseStage(const std::string& name, Stage& out) noexcept;
[[nodiscard]] const char* failureKindName(FailureKind kind) noexcept;
[[nodiscard]] bool parseFailureKind(const std::string& name, FailureKind& out) noexcept;

[[nodiscard]] std::int64_t unixMillisNow() noexcept;

}
