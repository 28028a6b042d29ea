/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/report.hpp"

namespace reelforge {

// Read-only view of a workspace, reconstructed from its journal.
class Flow final {
public:
    explicit Flow(const std::filesystem::path& workspace) noexcept;

    [[nodiscard]] std::vector<BatchId> batches() const;
    [[nodiscard]] std::optional<BatchId> latest() const;
    [[nodiscard]] std::optional<BatchReport> report(const BatchId& id) const;

    // Archived details from done/<id>/receipt.json and failed/<id>/error.txt.
    [[nodiscard]] std::optional<UploadReceipt> receipt(const ItemId& id) const;
    [[nodiscard]] std::optional<std::string> error(const ItemId& id) const;

private:
    std::filesystem::path workspace_;

    [[nodiscard]] std::string readFile(const std::filesystem::path& path) const noexcept;
};

}
