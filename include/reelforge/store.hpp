/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "reelforge/context.hpp"
#include "reelforge/dispatcher.hpp"
#include "reelforge/script.hpp"
#include "reelforge/types.hpp"

namespace reelforge {

struct ContentItem {
    ItemId id;
    BatchId batch;
    int index = 0;
    std::string topic;
    Stage stage = Stage::Queued;
    std::array<int, 3> attempts{{0, 0, 0}};

    Clock::time_point createdAt{};
    Clock::time_point updatedAt{};
    Clock::time_point stageEnteredAt{};

    std::optional<Script> script;
    std::filesystem::path scriptPath;
    std::filesystem::path mediaPath;
    double mediaSeconds = 0.0;
    std::optional<UploadReceipt> receipt;

    FailureKind failureKind = FailureKind::None;
    std::string reason;

    [[nodiscard]] int attemptsFor(Stage s) const noexcept {
        int i = stageIndex(s);
        return i < 0 ? 0 : attempts[i];
    }
    [[nodiscard]] int totalAttempts() const noexcept { return attempts[0] + attempts[1] + attempts[2]; }
};

struct Progress {
    std::size_t total = 0;
    std::size_t queued = 0;
    std::size_t inFlight = 0;
    std::size_t done = 0;
    std::size_t failed = 0;

    [[nodiscard]] bool complete() const noexcept { return done + failed == total; }
};

struct Batch {
    BatchId id;
    std::vector<ItemId> items;
    CancelFlag cancel;
    bool cancelled = false;
    Clock::time_point createdAt{};
};

// Owner of all item and batch state. Every mutation is a named transition
// that returns false, changing nothing, when it is not allowed. Thread-safe.
class ItemStore {
public:
    ItemStore() = default;

    ItemStore(const ItemStore&) = delete;
    ItemStore& operator=(const ItemStore&) = delete;

    // Items are taken as given (resume restores them mid-pipeline).
    [[nodiscard]] bool addBatch(const BatchId& id, std::vector<ContentItem> items);

    // Only to the immediate successor stage; Uploading requires media.
    [[nodiscard]] bool enterStage(const ItemId& id, Stage next);
    // Counts an attempt of the current stage; attempt receives its 1-based number.
    [[nodiscard]] bool beginAttempt(const ItemId& id, int& attempt);
    [[nodiscard]] bool beginAttempt(const ItemId& id);
    [[nodiscard]] bool setScript(const ItemId& id, Script script, const std::filesystem::path& path);
    [[nodiscard]] bool setMedia(const ItemId& id, const std::filesystem::path& path, double seconds);
    [[nodiscard]] bool setReceipt(const ItemId& id, const UploadReceipt& receipt);
    // Uploading -> Done; requires a receipt.
    [[nodiscard]] bool complete(const ItemId& id);
    // Any non-terminal stage -> Failed; reason must be non-empty.
    [[nodiscard]] bool fail(const ItemId& id, FailureKind kind, const std::string& reason);
    // Raises the batch flag. False for unknown or already-cancelled batches.
    [[nodiscard]] bool markCancelled(const BatchId& id);

    [[nodiscard]] std::optional<ContentItem> get(const ItemId& id) const;
    [[nodiscard]] std::vector<ContentItem> itemsOf(const BatchId& id) const;
    [[nodiscard]] std::optional<Batch> batch(const BatchId& id) const;
    [[nodiscard]] std::vector<BatchId> batchIds() const;
    [[nodiscard]] bool hasBatch(const BatchId& id) const;
    [[nodiscard]] bool isCancelled(const BatchId& id) const;
    [[nodiscard]] CancelFlag cancelFlag(const BatchId& id) const;
    [[nodiscard]] Progress progress(const BatchId& id) const;
    [[nodiscard]] bool isBatchComplete(const BatchId& id) const;

    // Blocks until every item of the batch is terminal or the timeout passes
    // (timeout <= 0 waits indefinitely).
    [[nodiscard]] bool waitUntilComplete(const BatchId& id, Millis timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable terminal_;
    std::unordered_map<ItemId, ContentItem> items_;
    std::unordered_map<BatchId, Batch> batches_;
    std::vector<BatchId> batchOrder_;

    ContentItem* find(const ItemId& id);
    [[nodiscard]] Progress progressLocked(const BatchId& id) const;
};

}
