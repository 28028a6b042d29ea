/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "reelforge/types.hpp"

namespace reelforge {

using LaneTask = std::function<void(const ItemId&, int workerId)>;

// Fixed-size worker lane with a FIFO queue of item ids.
class Pool {
public:
    Pool(std::string name, int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(LaneTask task);
    void stop() noexcept;
    [[nodiscard]] bool submit(const ItemId& itemId) noexcept;

private:
    void workerLoop(int workerId);

    const std::string name_;
    int workers_;
    LaneTask task_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable itemAvailable_;
    std::queue<ItemId> itemQueue_;

    std::vector<std::thread> workerThreads_;
};

}
