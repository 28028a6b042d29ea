/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "reelforge/dispatcher.hpp"
#include "reelforge/types.hpp"

namespace reelforge {

// Snapshot of one item folded from its journal records.
struct JournalItemState {
    ItemId id;
    BatchId batch;
    std::string topic;
    int index = 0;
    Stage stage = Stage::Queued;
    std::array<int, 3> attempts{{0, 0, 0}};
    std::filesystem::path scriptPath;
    std::filesystem::path mediaPath;
    double mediaSeconds = 0.0;
    std::optional<UploadReceipt> receipt;
    FailureKind failureKind = FailureKind::None;
    std::string reason;
    std::int64_t createdAt = 0;
    std::int64_t updatedAt = 0;
};

struct JournalBatchState {
    BatchId id;
    std::size_t size = 0;
    bool cancelled = false;
    std::int64_t createdAt = 0;
    std::vector<ItemId> items;
};

struct JournalReplay {
    std::vector<BatchId> batchOrder;
    std::unordered_map<BatchId, JournalBatchState> batches;
    std::unordered_map<ItemId, JournalItemState> items;
    std::size_t records = 0;
    std::size_t skipped = 0;     // unreadable or unknown lines

    [[nodiscard]] const JournalItemState* item(const ItemId& id) const noexcept;
    [[nodiscard]] const JournalBatchState* batch(const BatchId& id) const noexcept;
    [[nodiscard]] std::vector<const JournalItemState*> itemsOf(const BatchId& id) const;
};

// Append-only JSON-lines log of item transitions (one record per line,
// flushed per record). Thread-safe.
class Journal {
public:
    explicit Journal(const std::filesystem::path& path);

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;
    Journal(Journal&&) = delete;
    Journal& operator=(Journal&&) = delete;

    [[nodiscard]] bool isOpen() const noexcept;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    void batchCreated(const BatchId& batch, std::size_t size);
    void itemCreated(const BatchId& batch, const ItemId& item, int index, const std::string& topic);
    void stageEntered(const BatchId& batch, const ItemId& item, Stage stage);
    void attemptStarted(const BatchId& batch, const ItemId& item, Stage stage, int attempt);
    void retryScheduled(const BatchId& batch, const ItemId& item, Stage stage, int attempt,
                        Millis delay, const std::string& reason);
    void artifactRecorded(const BatchId& batch, const ItemId& item, const std::string& kind,
                          const std::filesystem::path& path, double seconds = 0.0);
    void receiptRecorded(const BatchId& batch, const UploadReceipt& receipt);
    void itemDone(const BatchId& batch, const ItemId& item);
    void itemFailed(const BatchId& batch, const ItemId& item, FailureKind kind, const std::string& reason);
    void batchCancelled(const BatchId& batch);

    [[nodiscard]] static JournalReplay replay(const std::filesystem::path& path);

private:
    std::filesystem::path path_;
    std::ofstream out_;
    mutable std::mutex mutex_;

    void append(const std::string& line);
};

}
