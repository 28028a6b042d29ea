/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/workspace.hpp"
#include "reelforge/logger.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace reelforge {

namespace {

bool writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file) return false;
    file << content;
    file.flush();
    file.close();
    return file.good();
}

}

Workspace::Workspace(std::filesystem::path root) : root_(std::move(root)) {
}

bool Workspace::create() noexcept {
    try {
        std::filesystem::create_directories(root_ / "items");
        std::filesystem::create_directories(root_ / "media");
        std::filesystem::create_directories(root_ / "done");
        std::filesystem::create_directories(root_ / "failed");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

BatchId Workspace::generateBatchId() {
    static std::atomic<uint64_t> counter{0};

    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << unixMillisNow() << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

ItemId Workspace::itemIdFor(const BatchId& batch, int index) {
    return batch + "-" + std::to_string(index);
}

bool Workspace::stageItem(const ItemId& id, const std::string& topic) const noexcept {
    try {
        auto writing = root_ / "items" / ("." + id + ".writing");
        std::filesystem::remove_all(writing);
        std::filesystem::create_directories(writing);

        if (!writeFile(writing / "topic.txt", topic)) {
            std::error_code ec;
            std::filesystem::remove_all(writing, ec);
            return false;
        }

        std::error_code ec;
        std::filesystem::remove_all(itemDir(id), ec);
        std::filesystem::rename(writing, itemDir(id));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to stage item " + id + ": " + std::string(e.what()));
        return false;
    }
}

bool Workspace::archive(const ItemId& id, const std::filesystem::path& dest,
                        const std::string& fileName, const std::string& content) const noexcept {
    try {
        auto live = itemDir(id);
        if (!std::filesystem::exists(live)) {
            std::filesystem::create_directories(live);
        }
        if (!writeFile(live / fileName, content)) {
            LOG_WARN("Failed to write " + fileName + " for " + id);
        }

        std::error_code ec;
        std::filesystem::remove_all(dest, ec);
        std::filesystem::rename(live, dest);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to archive item " + id + ": " + std::string(e.what()));
        return false;
    }
}

bool Workspace::archiveDone(const ItemId& id, const UploadReceipt& receipt) const noexcept {
    std::string content;
    try {
        nlohmann::json j;
        j["item"] = receipt.itemId;
        j["remote_id"] = receipt.remoteId;
        j["url"] = receipt.publishedUrl;
        content = j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    } catch (const std::exception& e) {
        LOG_WARN("Cannot serialise receipt for " + id + ": " + e.what());
    }
    return archive(id, doneDir(id), "receipt.json", content);
}

bool Workspace::archiveFailed(const ItemId& id, const std::string& error) const noexcept {
    return archive(id, failedDir(id), "error.txt", error + "\n");
}

}
