/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "reelforge/dispatcher.hpp"
#include "reelforge/types.hpp"

namespace reelforge {

// On-disk layout of a pipeline workspace:
//   journal.jsonl
//   items/<id>/{topic.txt, script.json}   live items
//   media/<id>.mp4                        rendered media
//   done/<id>/receipt.json                archived on success
//   failed/<id>/error.txt                 archived on failure
class Workspace final {
public:
    explicit Workspace(std::filesystem::path root);

    [[nodiscard]] bool create() noexcept;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path journalFile() const { return root_ / "journal.jsonl"; }
    [[nodiscard]] std::filesystem::path itemDir(const ItemId& id) const { return root_ / "items" / id; }
    [[nodiscard]] std::filesystem::path scriptFile(const ItemId& id) const { return itemDir(id) / "script.json"; }
    [[nodiscard]] std::filesystem::path mediaFile(const ItemId& id) const { return root_ / "media" / (id + ".mp4"); }
    [[nodiscard]] std::filesystem::path doneDir(const ItemId& id) const { return root_ / "done" / id; }
    [[nodiscard]] std::filesystem::path failedDir(const ItemId& id) const { return root_ / "failed" / id; }

    // Written under a hidden name, then renamed into items/<id>.
    [[nodiscard]] bool stageItem(const ItemId& id, const std::string& topic) const noexcept;
    [[nodiscard]] bool archiveDone(const ItemId& id, const UploadReceipt& receipt) const noexcept;
    [[nodiscard]] bool archiveFailed(const ItemId& id, const std::string& error) const noexcept;

    [[nodiscard]] static BatchId generateBatchId();
    [[nodiscard]] static ItemId itemIdFor(const BatchId& batch, int index);

private:
    std::filesystem::path root_;

    [[nodiscard]] bool archive(const ItemId& id, const std::filesystem::path& dest,
                               const std::string& fileName, const std::string& content) const noexcept;
};

}
