/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/dispatcher.hpp"
#include "reelforge/store.hpp"

namespace reelforge {

struct ItemReport {
    ItemId id;
    int index = 0;
    std::string topic;
    Stage stage = Stage::Queued;
    std::array<int, 3> attempts{{0, 0, 0}};
    std::string scriptPath;
    std::string mediaPath;
    std::optional<UploadReceipt> receipt;
    FailureKind failureKind = FailureKind::None;
    std::string reason;
};

struct BatchReport {
    BatchId id;
    Progress progress;
    bool cancelled = false;
    std::vector<ItemReport> items;

    [[nodiscard]] std::vector<const ItemReport*> failures() const;
    [[nodiscard]] bool complete() const noexcept { return progress.complete(); }
    [[nodiscard]] bool allDone() const noexcept { return progress.total > 0 && progress.done == progress.total; }
};

[[nodiscard]] ItemReport toItemReport(const ContentItem& item);
[[nodiscard]] Progress tally(const std::vector<ItemReport>& items);

[[nodiscard]] std::string formatProgress(const Progress& progress);
// Human-readable summary: progress line, published items, then every failure with its reason.
[[nodiscard]] std::string formatReport(const BatchReport& report);

}
