/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "reelforge/assets.hpp"
#include "reelforge/config.hpp"
#include "reelforge/dispatcher.hpp"
#include "reelforge/generator.hpp"
#include "reelforge/governor.hpp"
#include "reelforge/render.hpp"
#include "reelforge/report.hpp"
#include "reelforge/store.hpp"
#include "reelforge/workspace.hpp"

namespace reelforge {

class Journal;
class Pool;
class Processor;
struct StageOutcome;

// Drives batches of topics through Scripting -> Rendering -> Uploading.
// Each stage runs on its own lane; a scheduler thread re-dispatches items
// whose next attempt is due. Single use: start() once, shutdown() once.
class Orchestrator final {
public:
    // Throws ConfigError when the configuration does not validate.
    Orchestrator(PipelineConfig config,
                 ScriptGenerator& generator,
                 RenderWorker& renderer,
                 PublishEndpoint& endpoint);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Throws InvalidBatchError for an empty or oversized batch, a blank or
    // oversized topic, or when not running.
    [[nodiscard]] BatchHandle submitBatch(const std::vector<std::string>& topics);

    // Dispatch every item whose next attempt is due. Returns how many were handed to a lane.
    std::size_t advance();

    // Fails every non-terminal item as Cancelled and stops in-flight work.
    // Idempotent; false for unknown handles.
    bool cancelBatch(const BatchHandle& handle);

    [[nodiscard]] Progress pollProgress(const BatchHandle& handle) const;
    [[nodiscard]] BatchReport report(const BatchHandle& handle) const;
    // True once every item is terminal; timeout <= 0 waits indefinitely.
    [[nodiscard]] bool waitForBatch(const BatchHandle& handle, Millis timeout) const;

    [[nodiscard]] std::vector<BatchHandle> batches() const;
    [[nodiscard]] std::optional<ContentItem> item(const ItemId& id) const;

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ResourceGovernor& governor() const noexcept { return governor_; }
    [[nodiscard]] const UploadDispatcher& dispatcher() const noexcept { return dispatcher_; }
    [[nodiscard]] const Workspace& workspace() const noexcept { return workspace_; }

private:
    const PipelineConfig config_;
    Workspace workspace_;
    ScriptGenerator& generator_;
    RenderWorker& renderer_;
    AssetStore assets_;
    ResourceGovernor governor_;
    UploadDispatcher dispatcher_;
    ItemStore store_;

    std::unique_ptr<Journal> journal_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Pool> scriptLane_;
    std::unique_ptr<Pool> renderLane_;
    std::unique_ptr<Pool> uploadLane_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> used_{false};

    // Due-queue: items whose next attempt becomes eligible at the key time.
    mutable std::mutex dueMutex_;
    std::condition_variable dueChanged_;
    std::multimap<Clock::time_point, ItemId> due_;
    bool dueDirty_ = false;
    std::thread schedulerThread_;

    void schedulerLoop();
    void schedule(const ItemId& id, Clock::time_point at);
    [[nodiscard]] bool dispatch(const ItemId& id);
    [[nodiscard]] Pool* laneFor(Stage stage) const noexcept;

    void runAttempt(const ItemId& id, int workerId);
    void applyOutcome(const ContentItem& item, Stage stage, int attempt, StageOutcome& outcome);
    void enter(const ContentItem& item, Stage next);
    void failItem(const ContentItem& item, FailureKind kind, const std::string& reason);

    [[nodiscard]] std::size_t resume();
    void echo(const ItemId& id, const std::string& state, const std::string& detail = "") const;
};

}
