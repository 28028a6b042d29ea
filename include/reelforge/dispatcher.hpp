/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "reelforge/config.hpp"
#include "reelforge/context.hpp"
#include "reelforge/render.hpp"

namespace reelforge {

struct UploadMetadata {
    std::string title;
    std::string description;
    std::vector<std::string> tags;
};

struct UploadReceipt {
    ItemId itemId;
    std::string remoteId;
    std::string publishedUrl;
};

enum class UploadErrorKind : uint8_t {
    QuotaExceeded = 0,
    Transient,
    Timeout,
    AuthInvalid,
    ContentRejected,
    Duplicate,
    Cancelled
};

// QuotaExceeded, Transient and Timeout are worth another attempt.
[[nodiscard]] constexpr bool isRetryable(UploadErrorKind kind) noexcept {
    return kind == UploadErrorKind::QuotaExceeded ||
           kind == UploadErrorKind::Transient ||
           kind == UploadErrorKind::Timeout;
}

struct UploadError {
    UploadErrorKind kind = UploadErrorKind::Transient;
    bool retryable = true;
    std::string message;
    Millis retryAfter{0};     // 0 = endpoint gave no hint
};

struct UploadResult {
    bool ok = false;
    UploadReceipt receipt;
    UploadError error;
    explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] static UploadResult success(UploadReceipt receipt) {
        UploadResult r;
        r.ok = true;
        r.receipt = std::move(receipt);
        return r;
    }
    [[nodiscard]] static UploadResult failure(UploadErrorKind kind, std::string message,
                                              Millis retryAfter = Millis(0)) {
        UploadResult r;
        r.error = {kind, isRetryable(kind), std::move(message), retryAfter};
        return r;
    }
};

// Remote publishing boundary. One call is one submission.
class PublishEndpoint {
public:
    virtual ~PublishEndpoint() = default;

    [[nodiscard]] virtual UploadResult publish(const MediaArtifact& artifact,
                                               const UploadMetadata& metadata,
                                               const ActionContext& ctx) = 0;
};

// Runs the configured uploader and reads one JSON object from its stdout:
//   {"remote_id": "...", "url": "..."}
//   {"error": {"kind": "quota_exceeded", "message": "...", "retry_after": 30}}
// retry_after is in seconds.
class CommandPublishEndpoint final : public PublishEndpoint {
public:
    explicit CommandPublishEndpoint(UploadConfig config);

    [[nodiscard]] UploadResult publish(const MediaArtifact& artifact,
                                       const UploadMetadata& metadata,
                                       const ActionContext& ctx) override;

    [[nodiscard]] std::vector<std::string> buildCommand(const MediaArtifact& artifact,
                                                        const UploadMetadata& metadata) const;

    // Maps uploader stdout (and exit code) to a result.
    [[nodiscard]] static UploadResult parseResponse(const std::string& stdoutText, int exitCode);

private:
    const UploadConfig config_;
};

// Rate-limited, idempotent front of a PublishEndpoint. Thread-safe.
class UploadDispatcher {
public:
    UploadDispatcher(PublishEndpoint& endpoint, const UploadConfig& config);

    UploadDispatcher(const UploadDispatcher&) = delete;
    UploadDispatcher& operator=(const UploadDispatcher&) = delete;
    UploadDispatcher(UploadDispatcher&&) = delete;
    UploadDispatcher& operator=(UploadDispatcher&&) = delete;

    // Waits for a rate-limit slot (honouring ctx) before submitting. Refuses
    // with Duplicate, without contacting the endpoint, when the item already
    // has a receipt or another upload for it is in flight.
    [[nodiscard]] UploadResult upload(const ItemId& itemId,
                                      const MediaArtifact& artifact,
                                      const UploadMetadata& metadata,
                                      const ActionContext& ctx);

    void restoreReceipt(const UploadReceipt& receipt);
    [[nodiscard]] std::optional<UploadReceipt> receiptFor(const ItemId& itemId) const;

    [[nodiscard]] std::size_t submissions() const noexcept;
    [[nodiscard]] std::size_t receipts() const noexcept;
    // Submissions inside the current window.
    [[nodiscard]] std::size_t windowLoad() const noexcept;

private:
    PublishEndpoint& endpoint_;
    const unsigned maxPerInterval_;
    const Millis interval_;

    mutable std::mutex mutex_;
    std::condition_variable slotFreed_;
    std::deque<Clock::time_point> window_;
    std::unordered_map<ItemId, UploadReceipt> receipts_;
    std::unordered_set<ItemId> inFlight_;
    std::size_t submissions_ = 0;

    [[nodiscard]] UploadResult waitForSlot(std::unique_lock<std::mutex>& lock, const ActionContext& ctx);
    void pruneWindow(Clock::time_point now);
};

[[nodiscard]] const char* uploadErrorName(UploadErrorKind kind) noexcept;
[[nodiscard]] bool parseUploadErrorKind(const std::string& name, UploadErrorKind& out) noexcept;

}
