/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/types.hpp"

namespace reelforge {

const char* stageName(Stage stage) noexcept {
    switch (stage) {
        case Stage::Queued: return "queued";
        case Stage::Scripting: return "scripting";
        case Stage::Rendering: return "rendering";
        case Stage::Uploading: return "uploading";
        case Stage::Done: return "done";
        case Stage::Failed: return "failed";
        default: return "unknown";
    }
}

bool parseStage(const std::string& name, Stage& out) noexcept {
    static const Stage all[] = {Stage::Queued, Stage::Scripting, Stage::Rendering,
                                Stage::Uploading, Stage::Done, Stage::Failed};
    for (Stage s : all) {
        if (name == stageName(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

const char* failureKindName(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::Generation: return "generation";
        case FailureKind::Render: return "render";
        case FailureKind::Upload: return "upload";
        case FailureKind::ResourceTimeout: return "resource_timeout";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::Cancelled: return "cancelled";
        case FailureKind::Internal: return "internal";
        default: return "unknown";
    }
}

bool parseFailureKind(const std::string& name, FailureKind& out) noexcept {
    static const FailureKind all[] = {FailureKind::None, FailureKind::Generation, FailureKind::Render,
                                      FailureKind::Upload, FailureKind::ResourceTimeout, FailureKind::Timeout,
                                      FailureKind::Cancelled, FailureKind::Internal};
    for (FailureKind k : all) {
        if (name == failureKindName(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

std::int64_t unixMillisNow() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}
