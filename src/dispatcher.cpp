/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/dispatcher.hpp"
#include "reelforge/logger.hpp"
#include "reelforge/process.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <sstream>

namespace reelforge {

using json = nlohmann::json;

namespace {

constexpr auto kCancelPoll = std::chrono::milliseconds(50);

// Uploaders may log before the response; take the last line that parses as an object.
std::optional<json> lastJsonObject(const std::string& text) {
    json whole = json::parse(text, nullptr, false);
    if (!whole.is_discarded() && whole.is_object()) {
        return whole;
    }

    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        size_t start = it->find('{');
        if (start == std::string::npos) continue;
        json candidate = json::parse(it->substr(start), nullptr, false);
        if (!candidate.is_discarded() && candidate.is_object()) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string stringField(const json& object, const char* key) {
    auto it = object.find(key);
    return (it != object.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

}

const char* uploadErrorName(UploadErrorKind kind) noexcept {
    switch (kind) {
        case UploadErrorKind::QuotaExceeded: return "quota_exceeded";
        case UploadErrorKind::Transient: return "transient";
        case UploadErrorKind::Timeout: return "timeout";
        case UploadErrorKind::AuthInvalid: return "auth_invalid";
        case UploadErrorKind::ContentRejected: return "content_rejected";
        case UploadErrorKind::Duplicate: return "duplicate";
        case UploadErrorKind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

bool parseUploadErrorKind(const std::string& name, UploadErrorKind& out) noexcept {
    static const UploadErrorKind all[] = {
        UploadErrorKind::QuotaExceeded, UploadErrorKind::Transient, UploadErrorKind::Timeout,
        UploadErrorKind::AuthInvalid, UploadErrorKind::ContentRejected, UploadErrorKind::Duplicate,
        UploadErrorKind::Cancelled,
    };
    for (auto kind : all) {
        if (name == uploadErrorName(kind)) {
            out = kind;
            return true;
        }
    }
    return false;
}

CommandPublishEndpoint::CommandPublishEndpoint(UploadConfig config) : config_(std::move(config)) {
    LOG_DEBUG("Publish endpoint command: " + config_.command);
}

std::vector<std::string> CommandPublishEndpoint::buildCommand(const MediaArtifact& artifact,
                                                              const UploadMetadata& metadata) const {
    std::vector<std::string> argv = {
        config_.command,
        "--file", artifact.path.string(),
        "--title", metadata.title,
        "--description", metadata.description,
    };
    for (const auto& tag : metadata.tags) {
        argv.push_back("--tag");
        argv.push_back(tag);
    }
    return argv;
}

UploadResult CommandPublishEndpoint::parseResponse(const std::string& stdoutText, int exitCode) {
    auto response = lastJsonObject(stdoutText);
    if (!response) {
        return UploadResult::failure(UploadErrorKind::Transient,
            "uploader exited with " + std::to_string(exitCode) + " and no JSON response");
    }

    auto err = response->find("error");
    if (err != response->end()) {
        UploadErrorKind kind = UploadErrorKind::Transient;
        std::string message;
        Millis retryAfter(0);
        if (err->is_object()) {
            std::string kindName = stringField(*err, "kind");
            if (!parseUploadErrorKind(kindName, kind) || kind == UploadErrorKind::Cancelled) {
                kind = UploadErrorKind::Transient;
            }
            message = stringField(*err, "message");
            auto ra = err->find("retry_after");
            if (ra != err->end() && ra->is_number() && ra->get<double>() > 0) {
                retryAfter = Millis(static_cast<long long>(ra->get<double>() * 1000.0));
            }
        } else if (err->is_string()) {
            message = err->get<std::string>();
        }
        if (message.empty()) message = "uploader reported " + std::string(uploadErrorName(kind));
        return UploadResult::failure(kind, message, retryAfter);
    }

    std::string remoteId = stringField(*response, "remote_id");
    if (exitCode != 0 || remoteId.empty()) {
        return UploadResult::failure(UploadErrorKind::Transient,
            "uploader exited with " + std::to_string(exitCode) + " without a remote id");
    }
    UploadReceipt receipt;
    receipt.remoteId = remoteId;
    receipt.publishedUrl = stringField(*response, "url");
    return UploadResult::success(std::move(receipt));
}

UploadResult CommandPublishEndpoint::publish(const MediaArtifact& artifact,
                                             const UploadMetadata& metadata,
                                             const ActionContext& ctx) {
    CommandResult run = runCommand(buildCommand(artifact, metadata), ctx);
    if (run.cancelled) {
        return UploadResult::failure(UploadErrorKind::Cancelled, "upload cancelled");
    }
    if (run.timedOut) {
        return UploadResult::failure(UploadErrorKind::Timeout, "uploader exceeded the upload deadline");
    }
    if (!run.started) {
        return UploadResult::failure(UploadErrorKind::Transient, "failed to start uploader " + config_.command);
    }
    if (!run.err.empty()) {
        LOG_DEBUG("Uploader stderr: " + run.err);
    }
    return parseResponse(run.out, run.exitCode);
}

UploadDispatcher::UploadDispatcher(PublishEndpoint& endpoint, const UploadConfig& config)
    : endpoint_(endpoint),
      maxPerInterval_(std::max(1u, config.maxPerInterval)),
      interval_(config.interval) {
    LOG_DEBUG("Upload dispatcher: " + std::to_string(maxPerInterval_) + " per " +
              std::to_string(interval_.count()) + "ms");
}

void UploadDispatcher::pruneWindow(Clock::time_point now) {
    while (!window_.empty() && now - window_.front() >= interval_) {
        window_.pop_front();
    }
}

UploadResult UploadDispatcher::waitForSlot(std::unique_lock<std::mutex>& lock, const ActionContext& ctx) {
    while (true) {
        if (ctx.isCancelled()) {
            return UploadResult::failure(UploadErrorKind::Cancelled, "upload cancelled while waiting for a rate-limit slot");
        }
        auto now = Clock::now();
        pruneWindow(now);
        if (window_.size() < maxPerInterval_) {
            window_.push_back(now);
            return UploadResult{true, {}, {}};
        }
        if (ctx.expired()) {
            return UploadResult::failure(UploadErrorKind::Timeout, "no rate-limit slot before the upload deadline");
        }

        auto wakeAt = std::min({window_.front() + interval_, now + kCancelPoll, ctx.deadline});
        slotFreed_.wait_until(lock, wakeAt);
    }
}

UploadResult UploadDispatcher::upload(const ItemId& itemId,
                                      const MediaArtifact& artifact,
                                      const UploadMetadata& metadata,
                                      const ActionContext& ctx) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto existing = receipts_.find(itemId);
    if (existing != receipts_.end()) {
        LOG_WARN("Refusing second upload for " + itemId + " (published as " + existing->second.remoteId + ")");
        return UploadResult::failure(UploadErrorKind::Duplicate,
                                     "already published as " + existing->second.remoteId);
    }
    if (inFlight_.count(itemId)) {
        LOG_WARN("Refusing concurrent upload for " + itemId);
        return UploadResult::failure(UploadErrorKind::Duplicate, "upload already in progress");
    }

    // Reserved before waiting: the wait drops the lock
    inFlight_.insert(itemId);
    UploadResult slot = waitForSlot(lock, ctx);
    if (!slot) {
        inFlight_.erase(itemId);
        return slot;
    }
    ++submissions_;
    lock.unlock();

    UploadResult result;
    try {
        result = endpoint_.publish(artifact, metadata, ctx);
    } catch (const std::exception& e) {
        LOG_ERROR("Publish endpoint threw for " + itemId + ": " + e.what());
        result = UploadResult::failure(UploadErrorKind::Transient, std::string("endpoint error: ") + e.what());
    }

    lock.lock();
    inFlight_.erase(itemId);
    if (result) {
        result.receipt.itemId = itemId;
        receipts_[itemId] = result.receipt;
        LOG_INFO("Published " + itemId + " as " + result.receipt.remoteId);
    } else {
        LOG_DEBUG("Upload failed for " + itemId + ": " + uploadErrorName(result.error.kind) +
                  " - " + result.error.message);
    }
    return result;
}

void UploadDispatcher::restoreReceipt(const UploadReceipt& receipt) {
    std::lock_guard<std::mutex> lock(mutex_);
    receipts_[receipt.itemId] = receipt;
}

std::optional<UploadReceipt> UploadDispatcher::receiptFor(const ItemId& itemId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = receipts_.find(itemId);
    if (it == receipts_.end()) return std::nullopt;
    return it->second;
}

std::size_t UploadDispatcher::submissions() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return submissions_;
}

std::size_t UploadDispatcher::receipts() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return receipts_.size();
}

std::size_t UploadDispatcher::windowLoad() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    return static_cast<std::size_t>(std::count_if(window_.begin(), window_.end(),
        [&](const Clock::time_point& t) { return now - t < interval_; }));
}

}
