/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/journal.hpp"
#include "reelforge/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

namespace reelforge {

using json = nlohmann::json;

namespace {

json record(const char* event, const BatchId& batch, const ItemId& item) {
    json j;
    j["ts"] = unixMillisNow();
    j["event"] = event;
    j["batch"] = batch;
    j["item"] = item;
    return j;
}

template <typename T>
T valueOr(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    return it->get<T>();
}

bool applyRecord(const json& j, JournalReplay& replay) {
    const std::string event = j.at("event").get<std::string>();
    const BatchId batchId = valueOr<std::string>(j, "batch", "");
    const ItemId itemId = valueOr<std::string>(j, "item", "");
    const std::int64_t ts = valueOr<std::int64_t>(j, "ts", 0);

    if (event == "batch") {
        auto& batch = replay.batches[batchId];
        if (batch.id.empty()) replay.batchOrder.push_back(batchId);
        batch.id = batchId;
        batch.size = valueOr<std::size_t>(j, "size", 0);
        batch.createdAt = ts;
        return true;
    }
    if (event == "cancelled") {
        auto it = replay.batches.find(batchId);
        if (it == replay.batches.end()) return false;
        it->second.cancelled = true;
        return true;
    }
    if (event == "created") {
        auto& item = replay.items[itemId];
        item.id = itemId;
        item.batch = batchId;
        item.topic = valueOr<std::string>(j, "topic", "");
        item.index = valueOr<int>(j, "index", 0);
        item.createdAt = ts;
        item.updatedAt = ts;
        auto& batch = replay.batches[batchId];
        if (batch.id.empty()) {
            batch.id = batchId;
            replay.batchOrder.push_back(batchId);
        }
        batch.items.push_back(itemId);
        return true;
    }

    auto it = replay.items.find(itemId);
    if (it == replay.items.end()) {
        return false;
    }
    JournalItemState& item = it->second;
    item.updatedAt = ts;

    if (event == "stage") {
        Stage stage;
        if (!parseStage(j.at("stage").get<std::string>(), stage)) return false;
        item.stage = stage;
    } else if (event == "attempt") {
        Stage stage;
        if (!parseStage(j.at("stage").get<std::string>(), stage)) return false;
        int index = stageIndex(stage);
        if (index < 0) return false;
        item.attempts[index] = std::max(item.attempts[index], j.at("attempt").get<int>());
    } else if (event == "retry") {
        // informational; the stage is unchanged
    } else if (event == "artifact") {
        const std::string kind = j.at("kind").get<std::string>();
        if (kind == "script") {
            item.scriptPath = j.at("path").get<std::string>();
        } else if (kind == "media") {
            item.mediaPath = j.at("path").get<std::string>();
            item.mediaSeconds = valueOr<double>(j, "seconds", 0.0);
        } else {
            return false;
        }
    } else if (event == "receipt") {
        UploadReceipt receipt;
        receipt.itemId = itemId;
        receipt.remoteId = j.at("remote_id").get<std::string>();
        receipt.publishedUrl = valueOr<std::string>(j, "url", "");
        item.receipt = receipt;
    } else if (event == "done") {
        item.stage = Stage::Done;
    } else if (event == "failed") {
        item.stage = Stage::Failed;
        FailureKind kind = FailureKind::Internal;
        if (!parseFailureKind(valueOr<std::string>(j, "kind", ""), kind)) kind = FailureKind::Internal;
        item.failureKind = kind;
        item.reason = valueOr<std::string>(j, "reason", "");
    } else {
        return false;
    }
    return true;
}

}

const JournalItemState* JournalReplay::item(const ItemId& id) const noexcept {
    auto it = items.find(id);
    return it == items.end() ? nullptr : &it->second;
}

const JournalBatchState* JournalReplay::batch(const BatchId& id) const noexcept {
    auto it = batches.find(id);
    return it == batches.end() ? nullptr : &it->second;
}

std::vector<const JournalItemState*> JournalReplay::itemsOf(const BatchId& id) const {
    std::vector<const JournalItemState*> out;
    auto b = batch(id);
    if (!b) return out;
    for (const auto& itemId : b->items) {
        if (auto state = item(itemId)) out.push_back(state);
    }
    return out;
}

namespace {

// True when the file is non-empty and its last byte is not a newline.
bool endsMidLine(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) return false;
    const auto size = in.tellg();
    if (size <= 0) return false;
    in.seekg(-1, std::ios::end);
    char last = '\n';
    in.get(last);
    return last != '\n';
}

}

Journal::Journal(const std::filesystem::path& path) : path_(path) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    const bool tornTail = endsMidLine(path_);
    out_.open(path_, std::ios::binary | std::ios::app);
    if (!out_) {
        LOG_ERROR("Cannot open journal: " + path_.string());
        return;
    }
    if (tornTail) {
        // Terminate the torn record so the next one starts on its own line
        LOG_WARN("Journal ends mid-record, sealing it: " + path_.string());
        out_ << '\n';
        out_.flush();
    }
    LOG_DEBUG("Journal: " + path_.string());
}

bool Journal::isOpen() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return out_.is_open() && out_.good();
}

void Journal::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_) {
        return;
    }
    out_ << line << '\n';
    out_.flush();
    if (!out_.good()) {
        LOG_ERROR("Journal write failed: " + path_.string());
    }
}

void Journal::batchCreated(const BatchId& batch, std::size_t size) {
    json j = record("batch", batch, "");
    j["size"] = size;
    append(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void Journal::itemCreated(const BatchId& batch, const ItemId& item, int index, const std::string& topic) {
    json j = record("created", batch, item);
    j["index"] = index;
    j["topic"] = topic;
    append(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void Journal::stageEntered(const BatchId& batch, const ItemId& item, Stage stage) {
    json j = record("stage", batch, item);
    j["stage"] = stageName(stage);
    append(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void Journal::attemptStarted(const BatchId& batch, const ItemId& item, Stage stage, int attempt) {
    json j = record("attempt", batch, item);
    j["stage"] = stageName(stage);
    j["attempt"] = attempt;
    append(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void Journal::retryScheduled(const BatchId& batch, const ItemId& item, Stage stage, int attempt,
                             Millis delay, const std::string& reason) {
    json j = record("retry", batch, item);
    j["stage"] = stageName(stage);
    j["attempt"] = attempt;
    j["delay_ms"] = delay.count();
    j["reason"] = reason;
    append(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void Journal::artifactRecorded(const BatchId& batch, const ItemId& item, const std::string& kind,
                               const std::filesystem::path& path, double seconds) {
    json j = record("artifact", batch, item);
    j["kind"] = kind;
    j["path"] = path.string();
    if (seconds > 0.0) j["seconds"] = seconds;
    append(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void Journal::receiptRecorded(const BatchId& batch, const UploadReceipt& receipt) {
    json j = record("receipt", batch, receipt.itemId);
    j["remote_id"] = receipt.remoteId;
    j["url"] = receipt.publishedUrl;
    append(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void Journal::itemDone(const BatchId& batch, const ItemId& item) {
    append(record("done", batch, item).dump(-1, ' ', false, json::error_handler_t::replace));
}

void Journal::itemFailed(const BatchId& batch, const ItemId& item, FailureKind kind, const std::string& reason) {
    json j = record("failed", batch, item);
    j["kind"] = failureKindName(kind);
    j["reason"] = reason;
    append(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void Journal::batchCancelled(const BatchId& batch) {
    append(record("cancelled", batch, "").dump(-1, ' ', false, json::error_handler_t::replace));
}

JournalReplay Journal::replay(const std::filesystem::path& path) {
    JournalReplay replay;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LOG_DEBUG("No journal at " + path.string());
        return replay;
    }

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;
        json j = json::parse(line, nullptr, false);
        bool applied = false;
        if (!j.is_discarded() && j.is_object() && j.contains("event")) {
            try {
                applied = applyRecord(j, replay);
            } catch (const json::exception& e) {
                LOG_DEBUG("Journal line " + std::to_string(lineNo) + ": " + e.what());
            }
        }
        if (applied) {
            ++replay.records;
        } else {
            ++replay.skipped;
            LOG_WARN("Ignoring unreadable journal line " + std::to_string(lineNo) + " in " + path.string());
        }
    }

    LOG_DEBUG("Replayed " + std::to_string(replay.records) + " journal records (" +
              std::to_string(replay.skipped) + " skipped)");
    return replay;
}

}
