/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

#include "reelforge/context.hpp"
#include "reelforge/script.hpp"

namespace reelforge {

enum class GenerationErrorKind : uint8_t {
    Unavailable = 0,
    EmptyOutput,
    Malformed,
    Timeout,
    Cancelled
};

struct GenerationError {
    GenerationErrorKind kind = GenerationErrorKind::Unavailable;
    std::string message;
};

struct GenerationResult {
    bool ok = false;
    Script script;
    GenerationError error;
    explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] static GenerationResult success(Script script) {
        GenerationResult r;
        r.ok = true;
        r.script = std::move(script);
        return r;
    }
    [[nodiscard]] static GenerationResult failure(GenerationErrorKind kind, std::string message) {
        GenerationResult r;
        r.error = {kind, std::move(message)};
        return r;
    }
};

// Text-generation boundary. No retries inside: the orchestrator owns retry policy.
class ScriptGenerator {
public:
    virtual ~ScriptGenerator() = default;

    // Called once from the orchestrator thread before lane workers start.
    [[nodiscard]] virtual bool prepare(int workers) { (void)workers; return true; }

    // ctx.workerId identifies the calling script-lane worker.
    [[nodiscard]] virtual GenerationResult generate(const std::string& topic, const ActionContext& ctx) = 0;
};

[[nodiscard]] const char* generationErrorName(GenerationErrorKind kind) noexcept;

}
