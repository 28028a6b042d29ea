/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/generator.hpp"

namespace reelforge {

const char* generationErrorName(GenerationErrorKind kind) noexcept {
    switch (kind) {
        case GenerationErrorKind::Unavailable: return "unavailable";
        case GenerationErrorKind::EmptyOutput: return "empty_output";
        case GenerationErrorKind::Malformed: return "malformed";
        case GenerationErrorKind::Timeout: return "timeout";
        case GenerationErrorKind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

}
