/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/orchestrator.hpp"
#include "reelforge/errors.hpp"
#include "reelforge/journal.hpp"
#include "reelforge/logger.hpp"
#include "reelforge/pool.hpp"
#include "reelforge/processor.hpp"
#include <algorithm>
#include <cctype>

namespace reelforge {

namespace {

constexpr auto kIdleWait = std::chrono::seconds(1);

PipelineConfig validated(PipelineConfig config) {
    config.validate();
    return config;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

const char* laneState(Stage stage) {
    switch (stage) {
        case Stage::Scripting: return "scripting";
        case Stage::Rendering: return "rendering";
        case Stage::Uploading: return "uploading";
        default: return stageName(stage);
    }
}

}

Orchestrator::Orchestrator(PipelineConfig config,
                           ScriptGenerator& generator,
                           RenderWorker& renderer,
                           PublishEndpoint& endpoint)
    : config_(validated(std::move(config))),
      workspace_(config_.workspace),
      generator_(generator),
      renderer_(renderer),
      assets_(config_.assets),
      governor_(config_.governor.capacity),
      dispatcher_(endpoint, config_.upload) {
    LOG_DEBUG("Orchestrator created - workspace: " + workspace_.root().string() +
              ", lanes: " + std::to_string(config_.lanes.scriptWorkers) + "/" +
              std::to_string(config_.lanes.renderWorkers) + "/" +
              std::to_string(config_.lanes.uploadWorkers) +
              ", gpu slots: " + std::to_string(config_.governor.capacity));
}

Orchestrator::~Orchestrator() {
    shutdown();
}

bool Orchestrator::start() {
    if (running_.load()) {
        LOG_WARN("Orchestrator already running");
        return false;
    }
    if (used_.exchange(true)) {
        LOG_ERROR("Orchestrator cannot be restarted after shutdown");
        return false;
    }

    LOG_INFO("Starting reelforge pipeline...");

    if (!workspace_.create()) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }

    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + workspace_.root().string());
    LOG_DEBUG("Assets: " + config_.assets.directory.string());
    LOG_DEBUG("Lanes: script=" + std::to_string(config_.lanes.scriptWorkers) +
              " render=" + std::to_string(config_.lanes.renderWorkers) +
              " upload=" + std::to_string(config_.lanes.uploadWorkers));
    LOG_DEBUG("Uploads: " + std::to_string(config_.upload.maxPerInterval) + " per " +
              std::to_string(config_.upload.interval.count()) + "ms");
    LOG_DEBUG("========================================");

    try {
        journal_ = std::make_unique<Journal>(workspace_.journalFile());
        if (!journal_->isOpen()) {
            LOG_ERROR("Failed to open journal");
            return false;
        }

        if (config_.resume) {
            std::size_t resumed = resume();
            LOG_INFO("Resumed " + std::to_string(resumed) + " unfinished item(s)");
        }

        // Runner construction must happen before lane threads start
        if (!generator_.prepare(config_.lanes.scriptWorkers)) {
            LOG_ERROR("Failed to prepare script generator");
            return false;
        }

        processor_ = std::make_unique<Processor>(config_, workspace_, generator_, renderer_,
                                                 governor_, dispatcher_, assets_);

        scriptLane_ = std::make_unique<Pool>("Script", config_.lanes.scriptWorkers);
        renderLane_ = std::make_unique<Pool>("Render", config_.lanes.renderWorkers);
        uploadLane_ = std::make_unique<Pool>("Upload", config_.lanes.uploadWorkers);

        auto task = [this](const ItemId& id, int workerId) { runAttempt(id, workerId); };
        if (!scriptLane_->start(task) || !renderLane_->start(task) || !uploadLane_->start(task)) {
            LOG_ERROR("Failed to start stage lanes");
            scriptLane_->stop();
            renderLane_->stop();
            uploadLane_->stop();
            return false;
        }

        running_.store(true);
        schedulerThread_ = std::thread(&Orchestrator::schedulerLoop, this);

        LOG_DEBUG("Orchestrator started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start orchestrator: " + std::string(e.what()));
        return false;
    }
}

void Orchestrator::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down pipeline...");

    stopping_.store(true);
    running_.store(false);

    {
        std::lock_guard<std::mutex> lock(dueMutex_);
        dueDirty_ = true;
    }
    dueChanged_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }

    // Release render waiters so lane threads can drain
    governor_.shutdown();

    if (scriptLane_) scriptLane_->stop();
    if (renderLane_) renderLane_->stop();
    if (uploadLane_) uploadLane_->stop();

    LOG_INFO("Pipeline shutdown complete");
}

void Orchestrator::schedulerLoop() {
    setThreadName("Scheduler");
    LOG_DEBUG("Scheduler started");

    while (!stopping_.load()) {
        (void)advance();

        std::unique_lock<std::mutex> lock(dueMutex_);
        auto wakeAt = due_.empty() ? Clock::now() + kIdleWait : due_.begin()->first;
        dueChanged_.wait_until(lock, wakeAt, [this] { return dueDirty_ || stopping_.load(); });
        dueDirty_ = false;
    }

    LOG_DEBUG("Scheduler stopped");
}

void Orchestrator::schedule(const ItemId& id, Clock::time_point at) {
    {
        std::lock_guard<std::mutex> lock(dueMutex_);
        due_.emplace(at, id);
        dueDirty_ = true;
    }
    dueChanged_.notify_all();
}

std::size_t Orchestrator::advance() {
    if (!running_.load()) {
        return 0;
    }

    std::vector<ItemId> ready;
    {
        std::lock_guard<std::mutex> lock(dueMutex_);
        auto now = Clock::now();
        auto end = due_.upper_bound(now);
        for (auto it = due_.begin(); it != end; ++it) {
            ready.push_back(it->second);
        }
        due_.erase(due_.begin(), end);
    }

    std::size_t dispatched = 0;
    for (const auto& id : ready) {
        if (dispatch(id)) {
            ++dispatched;
        }
    }
    if (dispatched) {
        LOG_TRACE("Dispatched " + std::to_string(dispatched) + " item(s)");
    }
    return dispatched;
}

Pool* Orchestrator::laneFor(Stage stage) const noexcept {
    switch (stage) {
        case Stage::Scripting: return scriptLane_.get();
        case Stage::Rendering: return renderLane_.get();
        case Stage::Uploading: return uploadLane_.get();
        default: return nullptr;
    }
}

bool Orchestrator::dispatch(const ItemId& id) {
    auto item = store_.get(id);
    if (!item || isTerminal(item->stage) || store_.isCancelled(item->batch)) {
        return false;
    }

    if (item->stage == Stage::Queued) {
        enter(*item, Stage::Scripting);
        item = store_.get(id);
        if (!item || item->stage != Stage::Scripting) {
            return false;
        }
    }

    Pool* lane = laneFor(item->stage);
    if (!lane || !lane->submit(id)) {
        LOG_WARN("No lane accepted " + id + " in stage " + stageName(item->stage));
        return false;
    }
    return true;
}

void Orchestrator::enter(const ContentItem& item, Stage next) {
    if (!store_.enterStage(item.id, next)) {
        LOG_DEBUG("Stage change to " + std::string(stageName(next)) + " refused for " + item.id);
        return;
    }
    journal_->stageEntered(item.batch, item.id, next);
    echo(item.id, laneState(next));
}

void Orchestrator::failItem(const ContentItem& item, FailureKind kind, const std::string& reason) {
    if (!store_.fail(item.id, kind, reason)) {
        return;
    }
    journal_->itemFailed(item.batch, item.id, kind, reason);
    if (!workspace_.archiveFailed(item.id, std::string(failureKindName(kind)) + ": " + reason)) {
        LOG_WARN("Could not archive failed item " + item.id);
    }
    if (kind == FailureKind::Cancelled) {
        LOG_DEBUG("Cancelled " + item.id);
        echo(item.id, "cancelled");
    } else {
        LOG_WARN("Item " + item.id + " failed: " + reason);
        echo(item.id, "failed", reason);
    }
}

void Orchestrator::runAttempt(const ItemId& id, int workerId) {
    auto item = store_.get(id);
    if (!item || isTerminal(item->stage) || store_.isCancelled(item->batch)) {
        return;
    }

    const Stage stage = item->stage;
    int attempt = 0;
    if (!store_.beginAttempt(id, attempt)) {
        return;
    }
    journal_->attemptStarted(item->batch, id, stage, attempt);
    LOG_DEBUG(std::string(stageName(stage)) + " attempt " + std::to_string(attempt) + " for " + id);

    item = store_.get(id);
    if (!item) {
        return;
    }

    const StagePolicy& policy = config_.policyFor(stage);
    ActionContext ctx = ActionContext::withTimeout(policy.timeout, store_.cancelFlag(item->batch), workerId);

    auto started = Clock::now();
    StageOutcome outcome = processor_->process(*item, ctx);
    auto elapsed = std::chrono::duration_cast<Millis>(Clock::now() - started);
    LOG_DEBUG(std::string(stageName(stage)) + " attempt " + std::to_string(attempt) + " for " + id +
              (outcome.ok ? " succeeded" : " failed") + " in " + std::to_string(elapsed.count()) + "ms");

    applyOutcome(*item, stage, attempt, outcome);
}

void Orchestrator::applyOutcome(const ContentItem& item, Stage stage, int attempt, StageOutcome& outcome) {
    // A receipt is recorded even when the attempt overran, so the item is never published twice
    if (outcome.receipt && !item.receipt) {
        if (store_.setReceipt(item.id, *outcome.receipt)) {
            journal_->receiptRecorded(item.batch, *outcome.receipt);
        }
    }

    if (outcome.ok) {
        switch (stage) {
            case Stage::Scripting:
                if (!store_.setScript(item.id, std::move(*outcome.script), outcome.scriptPath)) {
                    return;
                }
                journal_->artifactRecorded(item.batch, item.id, "script", outcome.scriptPath);
                enter(item, Stage::Rendering);
                schedule(item.id, Clock::now());
                return;

            case Stage::Rendering:
                if (!store_.setMedia(item.id, outcome.media->path, outcome.media->durationSeconds)) {
                    return;
                }
                journal_->artifactRecorded(item.batch, item.id, "media", outcome.media->path,
                                           outcome.media->durationSeconds);
                enter(item, Stage::Uploading);
                schedule(item.id, Clock::now());
                return;

            case Stage::Uploading: {
                if (!store_.complete(item.id)) {
                    return;
                }
                journal_->itemDone(item.batch, item.id);
                auto done = store_.get(item.id);
                if (done && done->receipt && !workspace_.archiveDone(item.id, *done->receipt)) {
                    LOG_WARN("Could not archive published item " + item.id);
                }
                LOG_INFO("Item " + item.id + " published");
                echo(item.id, "done", done && done->receipt ? done->receipt->publishedUrl : "");
                return;
            }

            default:
                return;
        }
    }

    if (outcome.kind == FailureKind::Cancelled || store_.isCancelled(item.batch)) {
        failItem(item, FailureKind::Cancelled, "Cancelled");
        return;
    }

    // Leave the item where it is so a resumed run picks it up
    if (stopping_.load()) {
        LOG_DEBUG("Dropping outcome for " + item.id + " during shutdown: " + outcome.message);
        return;
    }

    const StagePolicy& policy = config_.policyFor(stage);
    if (outcome.retryable && attempt <= policy.retries) {
        Millis delay = policy.delayFor(attempt);
        if (outcome.retryAfter > delay) {
            delay = outcome.retryAfter;
        }
        journal_->retryScheduled(item.batch, item.id, stage, attempt, delay, outcome.message);
        LOG_INFO(std::string(stageName(stage)) + " attempt " + std::to_string(attempt) + " for " + item.id +
                 " failed (" + outcome.message + "), retrying in " + std::to_string(delay.count()) + "ms");
        echo(item.id, "retry", std::string(laneState(stage)) + " in " + std::to_string(delay.count()) + "ms: " +
                               outcome.message);
        schedule(item.id, Clock::now() + delay);
        return;
    }

    std::string reason = std::string(stageName(stage)) + " failed after " + std::to_string(attempt) +
                         (attempt == 1 ? " attempt: " : " attempts: ") + outcome.message;
    failItem(item, outcome.kind == FailureKind::None ? FailureKind::Internal : outcome.kind, reason);
}

BatchHandle Orchestrator::submitBatch(const std::vector<std::string>& topics) {
    if (!running_.load()) {
        throw InvalidBatchError("pipeline is not running");
    }
    if (topics.empty()) {
        throw InvalidBatchError("batch is empty");
    }
    if (topics.size() > config_.limits.maxBatchSize) {
        throw InvalidBatchError("batch has " + std::to_string(topics.size()) + " topics, limit is " +
                                std::to_string(config_.limits.maxBatchSize));
    }

    std::vector<std::string> cleaned;
    cleaned.reserve(topics.size());
    for (size_t i = 0; i < topics.size(); ++i) {
        std::string topic = trim(topics[i]);
        if (topic.empty()) {
            throw InvalidBatchError("topic " + std::to_string(i + 1) + " is empty");
        }
        if (topic.size() > config_.limits.maxTopicBytes) {
            throw InvalidBatchError("topic " + std::to_string(i + 1) + " exceeds " +
                                    std::to_string(config_.limits.maxTopicBytes) + " bytes");
        }
        cleaned.push_back(std::move(topic));
    }

    BatchId batchId = Workspace::generateBatchId();
    std::vector<ContentItem> items;
    items.reserve(cleaned.size());
    auto now = Clock::now();
    for (size_t i = 0; i < cleaned.size(); ++i) {
        ContentItem item;
        item.index = static_cast<int>(i + 1);
        item.id = Workspace::itemIdFor(batchId, item.index);
        item.batch = batchId;
        item.topic = cleaned[i];
        item.createdAt = item.updatedAt = item.stageEnteredAt = now;
        if (!workspace_.stageItem(item.id, item.topic)) {
            LOG_WARN("Could not stage workspace directory for " + item.id);
        }
        items.push_back(std::move(item));
    }

    std::vector<ItemId> ids;
    for (const auto& item : items) ids.push_back(item.id);

    journal_->batchCreated(batchId, items.size());
    for (const auto& item : items) {
        journal_->itemCreated(batchId, item.id, item.index, item.topic);
    }
    if (!store_.addBatch(batchId, std::move(items))) {
        throw InvalidBatchError("duplicate batch id " + batchId);
    }

    LOG_INFO("Batch " + batchId + " accepted with " + std::to_string(ids.size()) + " topic(s)");
    for (const auto& id : ids) {
        echo(id, "queued");
        schedule(id, now);
    }
    return batchId;
}

bool Orchestrator::cancelBatch(const BatchHandle& handle) {
    if (!store_.hasBatch(handle)) {
        return false;
    }

    if (store_.markCancelled(handle)) {
        journal_->batchCancelled(handle);
        LOG_INFO("Batch " + handle + " cancelled");
    }

    for (const auto& item : store_.itemsOf(handle)) {
        if (!isTerminal(item.stage)) {
            failItem(item, FailureKind::Cancelled, "Cancelled");
        }
    }

    governor_.wake();
    return true;
}

Progress Orchestrator::pollProgress(const BatchHandle& handle) const {
    return store_.progress(handle);
}

BatchReport Orchestrator::report(const BatchHandle& handle) const {
    BatchReport report;
    report.id = handle;
    report.cancelled = store_.isCancelled(handle);
    for (const auto& item : store_.itemsOf(handle)) {
        report.items.push_back(toItemReport(item));
    }
    report.progress = tally(report.items);
    return report;
}

bool Orchestrator::waitForBatch(const BatchHandle& handle, Millis timeout) const {
    return store_.waitUntilComplete(handle, timeout);
}

std::vector<BatchHandle> Orchestrator::batches() const {
    return store_.batchIds();
}

std::optional<ContentItem> Orchestrator::item(const ItemId& id) const {
    return store_.get(id);
}

std::size_t Orchestrator::resume() {
    JournalReplay replay = Journal::replay(workspace_.journalFile());
    if (replay.skipped) {
        LOG_WARN("Journal replay skipped " + std::to_string(replay.skipped) + " unreadable line(s)");
    }

    std::size_t resumed = 0;
    auto now = Clock::now();

    for (const auto& batchId : replay.batchOrder) {
        const JournalBatchState* batch = replay.batch(batchId);
        if (!batch || store_.hasBatch(batchId)) {
            continue;
        }

        std::vector<ContentItem> items;
        std::vector<std::pair<ItemId, std::string>> broken;
        std::vector<ItemId> pending;

        for (const JournalItemState* state : replay.itemsOf(batchId)) {
            ContentItem item;
            item.id = state->id;
            item.batch = batchId;
            item.index = state->index;
            item.topic = state->topic;
            item.stage = state->stage;
            item.attempts = state->attempts;
            item.createdAt = item.updatedAt = item.stageEnteredAt = now;
            item.scriptPath = state->scriptPath;
            item.mediaPath = state->mediaPath;
            item.mediaSeconds = state->mediaSeconds;
            item.receipt = state->receipt;
            item.failureKind = state->failureKind;
            item.reason = state->reason;

            if (item.receipt) {
                dispatcher_.restoreReceipt(*item.receipt);
            }

            if (!isTerminal(item.stage)) {
                auto cache = item.scriptPath.empty() ? workspace_.scriptFile(item.id) : item.scriptPath;
                if (auto script = readScriptFile(cache)) {
                    item.script = std::move(script);
                    item.scriptPath = cache;
                }

                std::error_code ec;
                if ((item.stage == Stage::Rendering || item.stage == Stage::Uploading) && !item.script) {
                    broken.emplace_back(item.id, "script cache missing on resume");
                } else if (item.stage == Stage::Uploading && !item.receipt &&
                           (item.mediaPath.empty() || !std::filesystem::is_regular_file(item.mediaPath, ec))) {
                    broken.emplace_back(item.id, "rendered media missing on resume");
                } else {
                    pending.push_back(item.id);
                }
            }
            items.push_back(std::move(item));
        }

        if (!store_.addBatch(batchId, std::move(items))) {
            LOG_WARN("Could not restore batch " + batchId);
            continue;
        }

        if (batch->cancelled) {
            (void)store_.markCancelled(batchId);
            for (const auto& entry : broken) {
                pending.push_back(entry.first);
            }
            for (const auto& id : pending) {
                if (auto item = store_.get(id)) failItem(*item, FailureKind::Cancelled, "Cancelled");
            }
            pending.clear();
            broken.clear();
        }
        for (const auto& entry : broken) {
            if (auto item = store_.get(entry.first)) failItem(*item, FailureKind::Internal, entry.second);
        }
        for (const auto& id : pending) {
            schedule(id, now);
            ++resumed;
        }
    }
    return resumed;
}

void Orchestrator::echo(const ItemId& id, const std::string& state, const std::string& detail) const {
    if (config_.echoStatus) {
        printStatusLine(id, state, detail);
    }
}

}
