/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/processor.hpp"
#include "reelforge/logger.hpp"
#include <algorithm>
#include <ctime>
#include <iostream>
#include <mutex>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return buf;
}

const char* stateColor(const std::string& state) {
    if (state == "done" || state == "published") return "\033[32m";
    if (state == "failed" || state == "cancelled") return "\033[31m";
    if (state == "retry") return "\033[36m";
    return "\033[33m";
}

}

namespace reelforge {

void printStatusLine(const ItemId& itemId, const std::string& state, const std::string& detail) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << itemId << "  "
              << stateColor(state) << state << "\033[0m";
    if (!detail.empty()) {
        std::cout << "  " << detail;
    }
    std::cout << "\n" << std::flush;
}

Processor::Processor(const PipelineConfig& config,
                     const Workspace& workspace,
                     ScriptGenerator& generator,
                     RenderWorker& renderer,
                     ResourceGovernor& governor,
                     UploadDispatcher& dispatcher,
                     const AssetStore& assets)
    : config_(config),
      workspace_(workspace),
      generator_(generator),
      renderer_(renderer),
      governor_(governor),
      dispatcher_(dispatcher),
      assets_(assets) {
    LOG_DEBUG("Processor created for workspace: " + workspace_.root().string());
}

StageOutcome Processor::process(const ContentItem& item, const ActionContext& ctx) noexcept {
    try {
        if (ctx.isCancelled()) {
            return StageOutcome::failure(FailureKind::Cancelled, false, "Cancelled");
        }

        StageOutcome outcome;
        switch (item.stage) {
            case Stage::Scripting: outcome = script(item, ctx); break;
            case Stage::Rendering: outcome = render(item, ctx); break;
            case Stage::Uploading: outcome = upload(item, ctx); break;
            default:
                return StageOutcome::failure(FailureKind::Internal, false,
                    std::string("no attempt defined for stage ") + stageName(item.stage));
        }

        if (outcome.ok && ctx.expired()) {
            LOG_WARN(std::string(stageName(item.stage)) + " attempt for " + item.id + " finished after its deadline");
            StageOutcome late = StageOutcome::failure(FailureKind::Timeout, true,
                std::string(stageName(item.stage)) + " finished after its deadline");
            late.receipt = std::move(outcome.receipt);
            return late;
        }
        return outcome;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception in " + std::string(stageName(item.stage)) + " for " + item.id + ": " + e.what());
        return StageOutcome::failure(FailureKind::Internal, true, std::string("internal error: ") + e.what());
    }
}

StageOutcome Processor::script(const ContentItem& item, const ActionContext& ctx) {
    GenerationResult result = generator_.generate(item.topic, ctx);
    if (!result) {
        const auto& err = result.error;
        std::string message = std::string(generationErrorName(err.kind)) +
                              (err.message.empty() ? "" : ": " + err.message);
        switch (err.kind) {
            case GenerationErrorKind::Cancelled:
                return StageOutcome::failure(FailureKind::Cancelled, false, message);
            case GenerationErrorKind::Timeout:
                return StageOutcome::failure(FailureKind::Timeout, true, message);
            default:
                return StageOutcome::failure(FailureKind::Generation, true, message);
        }
    }
    if (result.script.empty() || result.script.narration.empty()) {
        return StageOutcome::failure(FailureKind::Generation, true, "malformed: script has no narration");
    }

    auto path = workspace_.scriptFile(item.id);
    if (!writeScriptFile(path, result.script)) {
        return StageOutcome::failure(FailureKind::Internal, true, "cannot write " + path.string());
    }

    StageOutcome outcome;
    outcome.ok = true;
    outcome.script = std::move(result.script);
    outcome.scriptPath = path;
    return outcome;
}

StageOutcome Processor::render(const ContentItem& item, const ActionContext& ctx) {
    if (!item.script) {
        return StageOutcome::failure(FailureKind::Internal, false, "no script to render");
    }

    auto assets = assets_.select(item.id);
    if (!assets) {
        return StageOutcome::failure(FailureKind::Render, false, "asset_missing: no background images available");
    }

    Millis waitLimit = config_.governor.acquireTimeout;
    if (ctx.deadline != Clock::time_point::max()) {
        waitLimit = std::max(Millis(1), std::min(waitLimit, ctx.remaining()));
    }
    LeaseResult grant = governor_.acquire(config_.governor.renderCost, waitLimit, ctx.cancelled);
    if (!grant) {
        switch (grant.error) {
            case LeaseError::Cancelled:
                return StageOutcome::failure(FailureKind::Cancelled, false, "Cancelled while waiting for render capacity");
            case LeaseError::ResourceTimeout:
                return StageOutcome::failure(FailureKind::ResourceTimeout, true, grant.message);
            case LeaseError::ShuttingDown:
                return StageOutcome::failure(FailureKind::Internal, true, "render capacity shut down");
            default:
                return StageOutcome::failure(FailureKind::Internal, false, grant.message);
        }
    }

    // The lease is held exactly as long as the render call runs.
    Lease lease = std::move(grant.lease);
    RenderRequest request{item.id, *item.script, *assets, workspace_.mediaFile(item.id)};
    RenderResult result = renderer_.render(request, lease, ctx);
    lease.release();

    if (!result) {
        const auto& err = result.error;
        std::string message = std::string(renderErrorName(err.kind)) +
                              (err.message.empty() ? "" : ": " + err.message);
        switch (err.kind) {
            case RenderErrorKind::Cancelled:
                return StageOutcome::failure(FailureKind::Cancelled, false, message);
            case RenderErrorKind::Timeout:
                return StageOutcome::failure(FailureKind::Timeout, true, message);
            case RenderErrorKind::AssetMissing:
                return StageOutcome::failure(FailureKind::Render, false, message);
            default:
                return StageOutcome::failure(FailureKind::Render, true, message);
        }
    }

    StageOutcome outcome;
    outcome.ok = true;
    outcome.media = result.artifact;
    return outcome;
}

UploadMetadata Processor::metadataFor(const ContentItem& item) const {
    UploadMetadata metadata;
    metadata.tags = config_.upload.tags;
    if (item.script) {
        metadata.title = item.script->title;
        for (const auto& line : item.script->narration) {
            if (!metadata.description.empty()) metadata.description += "\n";
            metadata.description += line;
        }
    }
    if (metadata.title.empty()) {
        metadata.title = item.topic;
    }
    if (!metadata.tags.empty()) {
        std::string hashtags;
        for (const auto& tag : metadata.tags) {
            hashtags += (hashtags.empty() ? "#" : " #") + tag;
        }
        metadata.description += (metadata.description.empty() ? "" : "\n\n") + hashtags;
    }
    return metadata;
}

StageOutcome Processor::upload(const ContentItem& item, const ActionContext& ctx) {
    // A previous attempt may have published after its deadline
    if (auto existing = dispatcher_.receiptFor(item.id)) {
        StageOutcome outcome;
        outcome.ok = true;
        outcome.receipt = *existing;
        return outcome;
    }
    if (item.mediaPath.empty()) {
        return StageOutcome::failure(FailureKind::Internal, false, "no rendered media to upload");
    }

    MediaArtifact artifact{item.mediaPath, item.mediaSeconds};
    UploadResult result = dispatcher_.upload(item.id, artifact, metadataFor(item), ctx);
    if (!result) {
        const auto& err = result.error;
        std::string message = std::string(uploadErrorName(err.kind)) +
                              (err.message.empty() ? "" : ": " + err.message);
        switch (err.kind) {
            case UploadErrorKind::Cancelled:
                return StageOutcome::failure(FailureKind::Cancelled, false, message);
            case UploadErrorKind::Timeout:
                return StageOutcome::failure(FailureKind::Timeout, true, message, err.retryAfter);
            default:
                return StageOutcome::failure(FailureKind::Upload, err.retryable, message, err.retryAfter);
        }
    }

    StageOutcome outcome;
    outcome.ok = true;
    outcome.receipt = result.receipt;
    return outcome;
}

}
