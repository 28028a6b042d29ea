/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/pool.hpp"
#include "reelforge/logger.hpp"

namespace reelforge {

Pool::Pool(std::string name, int workers) noexcept : name_(std::move(name)), workers_(workers) {
    LOG_DEBUG(name_ + " lane created with " + std::to_string(workers) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(LaneTask task) {
    if (running_.load()) {
        LOG_WARN(name_ + " lane already running");
        return false;
    }

    if (!task) {
        LOG_ERROR("Invalid lane task provided for " + name_);
        return false;
    }

    task_ = std::move(task);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_DEBUG(name_ + " lane started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start " + name_ + " lane: " + std::string(e.what()));
        shutdown_.store(true);
        itemAvailable_.notify_all();
        for (auto& thread : workerThreads_) {
            if (thread.joinable()) thread.join();
        }
        workerThreads_.clear();
        running_.store(false);
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping " + name_ + " lane...");

    shutdown_.store(true);
    running_.store(false);

    {
        // Publish shutdown under the queue lock so no worker misses the wakeup
        std::lock_guard<std::mutex> lock(queueMutex_);
    }
    itemAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = itemQueue_.size();
        std::queue<ItemId>().swap(itemQueue_);
    }

    LOG_DEBUG(name_ + " lane stopped" + (dropped ? " (" + std::to_string(dropped) + " queued item(s) dropped)" : ""));
}

bool Pool::submit(const ItemId& itemId) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit to stopped " + name_ + " lane: " + itemId);
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            itemQueue_.push(itemId);
        }

        itemAvailable_.notify_one();
        LOG_TRACE(name_ + " lane queued: " + itemId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue " + itemId + " on " + name_ + " lane: " + e.what());
        return false;
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName(laneThreadName(name_, workerId));
    LOG_TRACE("lane worker started");

    while (!shutdown_.load()) {
        ItemId itemId;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            itemAvailable_.wait(lock, [this] {
                return !itemQueue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }

            itemId = itemQueue_.front();
            itemQueue_.pop();
        }

        try {
            task_(itemId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR(name_ + " lane task error: " + std::string(e.what()) + " (item: " + itemId + ")");
        }
    }

    LOG_TRACE("lane worker stopped");
}

}
