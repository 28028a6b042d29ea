/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>

#include "reelforge/types.hpp"

namespace reelforge {

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

[[nodiscard]] inline CancelFlag makeCancelFlag() {
    return std::make_shared<std::atomic<bool>>(false);
}

// Deadline and cancellation handed to every collaborator call.
struct ActionContext {
    Clock::time_point deadline = Clock::time_point::max();
    CancelFlag cancelled;
    int workerId = 0;

    [[nodiscard]] bool isCancelled() const noexcept {
        return cancelled && cancelled->load();
    }
    [[nodiscard]] bool expired() const noexcept {
        return Clock::now() >= deadline;
    }
    [[nodiscard]] bool shouldStop() const noexcept {
        return isCancelled() || expired();
    }
    [[nodiscard]] Millis remaining() const noexcept {
        if (deadline == Clock::time_point::max()) {
            return Millis::max();
        }
        auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now());
        return left.count() > 0 ? left : Millis(0);
    }

    [[nodiscard]] static ActionContext withTimeout(Millis timeout, CancelFlag flag = nullptr, int worker = 0) {
        ActionContext ctx;
        if (timeout.count() > 0) {
            ctx.deadline = Clock::now() + timeout;
        }
        ctx.cancelled = std::move(flag);
        ctx.workerId = worker;
        return ctx;
    }
};

}
