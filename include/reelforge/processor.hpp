/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "reelforge/assets.hpp"
#include "reelforge/config.hpp"
#include "reelforge/context.hpp"
#include "reelforge/dispatcher.hpp"
#include "reelforge/generator.hpp"
#include "reelforge/governor.hpp"
#include "reelforge/render.hpp"
#include "reelforge/store.hpp"
#include "reelforge/workspace.hpp"

namespace reelforge {

// Result of one stage attempt, with whatever the attempt produced.
struct StageOutcome {
    bool ok = false;
    bool retryable = false;
    FailureKind kind = FailureKind::None;
    std::string message;
    Millis retryAfter{0};

    std::optional<Script> script;
    std::filesystem::path scriptPath;
    std::optional<MediaArtifact> media;
    std::optional<UploadReceipt> receipt;   // also set on a late upload

    explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] static StageOutcome failure(FailureKind kind, bool retryable, std::string message,
                                              Millis retryAfter = Millis(0)) {
        StageOutcome o;
        o.kind = kind;
        o.retryable = retryable;
        o.message = std::move(message);
        o.retryAfter = retryAfter;
        return o;
    }
};

// Runs a single stage attempt for one item against the collaborators. Never
// touches item state; the orchestrator applies the outcome.
class Processor {
public:
    Processor(const PipelineConfig& config,
              const Workspace& workspace,
              ScriptGenerator& generator,
              RenderWorker& renderer,
              ResourceGovernor& governor,
              UploadDispatcher& dispatcher,
              const AssetStore& assets);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Attempt for item.stage. Collaborator exceptions become a retryable
    // Internal failure; a success returned after ctx.deadline is a Timeout.
    [[nodiscard]] StageOutcome process(const ContentItem& item, const ActionContext& ctx) noexcept;

    [[nodiscard]] UploadMetadata metadataFor(const ContentItem& item) const;

private:
    const PipelineConfig& config_;
    const Workspace& workspace_;
    ScriptGenerator& generator_;
    RenderWorker& renderer_;
    ResourceGovernor& governor_;
    UploadDispatcher& dispatcher_;
    const AssetStore& assets_;

    [[nodiscard]] StageOutcome script(const ContentItem& item, const ActionContext& ctx);
    [[nodiscard]] StageOutcome render(const ContentItem& item, const ActionContext& ctx);
    [[nodiscard]] StageOutcome upload(const ContentItem& item, const ActionContext& ctx);
};

// One colored status line on stdout: "  HH:MM:SS  <item>  <state>  <detail>".
void printStatusLine(const ItemId& itemId, const std::string& state, const std::string& detail = "");

}
