/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/store.hpp"
#include "reelforge/logger.hpp"

namespace reelforge {

namespace {

// Successor in the pipeline order, Failed for stages without one.
constexpr Stage successor(Stage stage) noexcept {
    switch (stage) {
        case Stage::Queued: return Stage::Scripting;
        case Stage::Scripting: return Stage::Rendering;
        case Stage::Rendering: return Stage::Uploading;
        case Stage::Uploading: return Stage::Done;
        default: return Stage::Failed;
    }
}

void touch(ContentItem& item) {
    item.updatedAt = Clock::now();
}

}

ContentItem* ItemStore::find(const ItemId& id) {
    auto it = items_.find(id);
    return it == items_.end() ? nullptr : &it->second;
}

bool ItemStore::addBatch(const BatchId& id, std::vector<ContentItem> items) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id.empty() || batches_.count(id)) {
        return false;
    }
    for (const auto& item : items) {
        if (item.id.empty() || items_.count(item.id)) {
            return false;
        }
    }

    Batch batch;
    batch.id = id;
    batch.cancel = makeCancelFlag();
    batch.createdAt = Clock::now();
    for (auto& item : items) {
        item.batch = id;
        batch.items.push_back(item.id);
        items_.emplace(item.id, std::move(item));
    }
    batches_.emplace(id, std::move(batch));
    batchOrder_.push_back(id);
    return true;
}

bool ItemStore::enterStage(const ItemId& id, Stage next) {
    std::lock_guard<std::mutex> lock(mutex_);
    ContentItem* item = find(id);
    if (!item || isTerminal(item->stage) || next == Stage::Done || next == Stage::Failed) {
        return false;
    }
    if (successor(item->stage) != next) {
        LOG_WARN("Refusing transition " + std::string(stageName(item->stage)) + " -> " +
                 stageName(next) + " for " + id);
        return false;
    }
    if (next == Stage::Rendering && !item->script) {
        return false;
    }
    if (next == Stage::Uploading && item->mediaPath.empty()) {
        LOG_WARN("Refusing upload of " + id + " without rendered media");
        return false;
    }
    item->stage = next;
    item->stageEnteredAt = Clock::now();
    touch(*item);
    return true;
}

bool ItemStore::beginAttempt(const ItemId& id, int& attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    ContentItem* item = find(id);
    if (!item) return false;
    int index = stageIndex(item->stage);
    if (index < 0) return false;
    attempt = ++item->attempts[index];
    touch(*item);
    return true;
}

bool ItemStore::beginAttempt(const ItemId& id) {
    int attempt = 0;
    return beginAttempt(id, attempt);
}

bool ItemStore::setScript(const ItemId& id, Script script, const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    ContentItem* item = find(id);
    if (!item || item->stage != Stage::Scripting || script.empty()) return false;
    item->script = std::move(script);
    item->scriptPath = path;
    touch(*item);
    return true;
}

bool ItemStore::setMedia(const ItemId& id, const std::filesystem::path& path, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    ContentItem* item = find(id);
    if (!item || item->stage != Stage::Rendering || path.empty()) return false;
    item->mediaPath = path;
    item->mediaSeconds = seconds;
    touch(*item);
    return true;
}

bool ItemStore::setReceipt(const ItemId& id, const UploadReceipt& receipt) {
    std::lock_guard<std::mutex> lock(mutex_);
    ContentItem* item = find(id);
    if (!item || item->stage != Stage::Uploading || receipt.remoteId.empty()) return false;
    item->receipt = receipt;
    touch(*item);
    return true;
}

bool ItemStore::complete(const ItemId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ContentItem* item = find(id);
        if (!item || item->stage != Stage::Uploading || !item->receipt) return false;
        item->stage = Stage::Done;
        item->stageEnteredAt = Clock::now();
        touch(*item);
    }
    terminal_.notify_all();
    return true;
}

bool ItemStore::fail(const ItemId& id, FailureKind kind, const std::string& reason) {
    if (reason.empty() || kind == FailureKind::None) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ContentItem* item = find(id);
        if (!item || isTerminal(item->stage)) return false;
        item->stage = Stage::Failed;
        item->stageEnteredAt = Clock::now();
        item->failureKind = kind;
        item->reason = reason;
        touch(*item);
    }
    terminal_.notify_all();
    return true;
}

bool ItemStore::markCancelled(const BatchId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = batches_.find(id);
    if (it == batches_.end() || it->second.cancelled) return false;
    it->second.cancelled = true;
    it->second.cancel->store(true);
    return true;
}

std::optional<ContentItem> ItemStore::get(const ItemId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(id);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

std::vector<ContentItem> ItemStore::itemsOf(const BatchId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ContentItem> out;
    auto it = batches_.find(id);
    if (it == batches_.end()) return out;
    out.reserve(it->second.items.size());
    for (const auto& itemId : it->second.items) {
        out.push_back(items_.at(itemId));
    }
    return out;
}

std::optional<Batch> ItemStore::batch(const BatchId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = batches_.find(id);
    if (it == batches_.end()) return std::nullopt;
    return it->second;
}

std::vector<BatchId> ItemStore::batchIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batchOrder_;
}

bool ItemStore::hasBatch(const BatchId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_.count(id) != 0;
}

bool ItemStore::isCancelled(const BatchId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = batches_.find(id);
    return it != batches_.end() && it->second.cancelled;
}

CancelFlag ItemStore::cancelFlag(const BatchId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = batches_.find(id);
    return it == batches_.end() ? nullptr : it->second.cancel;
}

Progress ItemStore::progressLocked(const BatchId& id) const {
    Progress p;
    auto it = batches_.find(id);
    if (it == batches_.end()) return p;
    for (const auto& itemId : it->second.items) {
        const ContentItem& item = items_.at(itemId);
        ++p.total;
        switch (item.stage) {
            case Stage::Queued: ++p.queued; break;
            case Stage::Done: ++p.done; break;
            case Stage::Failed: ++p.failed; break;
            default: ++p.inFlight; break;
        }
    }
    return p;
}

Progress ItemStore::progress(const BatchId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progressLocked(id);
}

bool ItemStore::isBatchComplete(const BatchId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!batches_.count(id)) return false;
    return progressLocked(id).complete();
}

bool ItemStore::waitUntilComplete(const BatchId& id, Millis timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!batches_.count(id)) return false;
    auto done = [&] { return progressLocked(id).complete(); };
    if (timeout.count() <= 0) {
        terminal_.wait(lock, done);
        return true;
    }
    return terminal_.wait_for(lock, timeout, done);
}

}
