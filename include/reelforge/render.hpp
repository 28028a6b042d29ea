/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "reelforge/assets.hpp"
#include "reelforge/config.hpp"
#include "reelforge/context.hpp"
#include "reelforge/governor.hpp"
#include "reelforge/script.hpp"

namespace reelforge {

struct RenderRequest {
    ItemId itemId;
    Script script;
    AssetSet assets;
    std::filesystem::path outputPath;
};

struct MediaArtifact {
    std::filesystem::path path;
    double durationSeconds = 0.0;
};

enum class RenderErrorKind : uint8_t {
    OutOfMemory = 0,
    AssetMissing,
    EncodeFailure,
    Timeout,
    Cancelled
};

struct RenderError {
    RenderErrorKind kind = RenderErrorKind::EncodeFailure;
    std::string message;
};

struct RenderResult {
    bool ok = false;
    MediaArtifact artifact;
    RenderError error;
    explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] static RenderResult success(MediaArtifact artifact) {
        RenderResult r;
        r.ok = true;
        r.artifact = std::move(artifact);
        return r;
    }
    [[nodiscard]] static RenderResult failure(RenderErrorKind kind, std::string message) {
        RenderResult r;
        r.error = {kind, std::move(message)};
        return r;
    }
};

// Compositing/encode boundary. Implementations may be called concurrently,
// one call per held lease, and must leave no temporary files behind.
class RenderWorker {
public:
    virtual ~RenderWorker() = default;

    [[nodiscard]] virtual RenderResult render(const RenderRequest& request,
                                              const Lease& lease,
                                              const ActionContext& ctx) = 0;
};

class FfmpegRenderWorker final : public RenderWorker {
public:
    explicit FfmpegRenderWorker(RenderConfig config);

    [[nodiscard]] RenderResult render(const RenderRequest& request,
                                      const Lease& lease,
                                      const ActionContext& ctx) override;

    // Full ffmpeg argv for a request. Text overlays are read from files in
    // workDir (title.txt, cue-<n>.txt) written by writeTextFiles().
    [[nodiscard]] std::vector<std::string> buildCommand(const RenderRequest& request,
                                                        const std::filesystem::path& workDir,
                                                        const std::filesystem::path& partialPath) const;

    [[nodiscard]] bool writeTextFiles(const RenderRequest& request,
                                      const std::filesystem::path& workDir) const noexcept;

    [[nodiscard]] const RenderConfig& config() const noexcept { return config_; }

private:
    const RenderConfig config_;

    [[nodiscard]] std::string buildFilterGraph(const RenderRequest& request,
                                               const std::filesystem::path& workDir) const;
    [[nodiscard]] std::size_t charsPerLine(int fontSize) const noexcept;
};

// Greedy word wrap; words longer than width are split.
[[nodiscard]] std::string wrapText(const std::string& text, std::size_t width);

// Single-quote a value for use inside an ffmpeg filter option.
[[nodiscard]] std::string escapeFilterValue(const std::string& value);

[[nodiscard]] const char* renderErrorName(RenderErrorKind kind) noexcept;

}
