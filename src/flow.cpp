/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/flow.hpp"
#include "reelforge/journal.hpp"
#include "reelforge/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

namespace reelforge {

Flow::Flow(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace) {
    LOG_DEBUG("Flow created for workspace: " + workspace_.string());
}

std::vector<BatchId> Flow::batches() const {
    return Journal::replay(workspace_ / "journal.jsonl").batchOrder;
}

std::optional<BatchId> Flow::latest() const {
    auto ids = batches();
    if (ids.empty()) {
        return std::nullopt;
    }
    return ids.back();
}

std::optional<BatchReport> Flow::report(const BatchId& id) const {
    JournalReplay replay = Journal::replay(workspace_ / "journal.jsonl");
    const JournalBatchState* batch = replay.batch(id);
    if (!batch) {
        return std::nullopt;
    }

    BatchReport report;
    report.id = id;
    report.cancelled = batch->cancelled;
    for (const JournalItemState* state : replay.itemsOf(id)) {
        ItemReport item;
        item.id = state->id;
        item.index = state->index;
        item.topic = state->topic;
        item.stage = state->stage;
        item.attempts = state->attempts;
        item.scriptPath = state->scriptPath.string();
        item.mediaPath = state->mediaPath.string();
        item.receipt = state->receipt;
        item.failureKind = state->failureKind;
        item.reason = state->reason;
        if (item.stage == Stage::Failed && item.reason.empty()) {
            item.reason = error(item.id).value_or("unknown failure");
        }
        report.items.push_back(std::move(item));
    }
    report.progress = tally(report.items);
    return report;
}

std::optional<UploadReceipt> Flow::receipt(const ItemId& id) const {
    auto path = workspace_ / "done" / id / "receipt.json";
    std::string content = readFile(path);
    if (content.empty()) {
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("remote_id") || !j["remote_id"].is_string()) {
        LOG_DEBUG("Unreadable receipt: " + path.string());
        return std::nullopt;
    }
    UploadReceipt receipt;
    receipt.itemId = id;
    receipt.remoteId = j["remote_id"].get<std::string>();
    if (j.contains("url") && j["url"].is_string()) {
        receipt.publishedUrl = j["url"].get<std::string>();
    }
    return receipt;
}

std::optional<std::string> Flow::error(const ItemId& id) const {
    auto path = workspace_ / "failed" / id / "error.txt";
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::string content = readFile(path);
    while (!content.empty() && (content.back() == '\n' || content.back() == '\r')) {
        content.pop_back();
    }
    return content;
}

std::string Flow::readFile(const std::filesystem::path& path) const noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) return "";
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading " + path.string() + ": " + e.what());
        return "";
    }
}

}
