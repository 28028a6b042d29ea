/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/render.hpp"
#include "reelforge/logger.hpp"
#include "reelforge/process.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace reelforge {

namespace {

// Fixed-point rendering of seconds so the argv is identical across locales.
std::string seconds(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    return buf;
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool mentionsOutOfMemory(const std::string& stderrText) {
    std::string text = lower(stderrText);
    return text.find("out of memory") != std::string::npos ||
           text.find("cannot allocate memory") != std::string::npos ||
           text.find("cuda_error_out_of_memory") != std::string::npos;
}

std::string lastLine(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return "";
    size_t start = text.find_last_of('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

bool writeText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary);
    if (!file) return false;
    file << text;
    file.flush();
    return file.good();
}

// Removes the per-render scratch directory on every exit path.
class ScratchDir {
public:
    explicit ScratchDir(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LOG_WARN("Failed to remove " + path_.string() + ": " + ec.message());
        }
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}

std::string wrapText(const std::string& text, std::size_t width) {
    if (width == 0) width = 1;
    std::string out;
    std::istringstream paragraphs(text);
    std::string paragraph;
    bool firstParagraph = true;
    while (std::getline(paragraphs, paragraph)) {
        if (!firstParagraph) out += '\n';
        firstParagraph = false;

        std::istringstream words(paragraph);
        std::string word;
        std::string line;
        while (words >> word) {
            while (word.size() > width) {
                if (!line.empty()) {
                    out += line + '\n';
                    line.clear();
                }
                out += word.substr(0, width) + '\n';
                word.erase(0, width);
            }
            if (line.empty()) {
                line = word;
            } else if (line.size() + 1 + word.size() <= width) {
                line += ' ' + word;
            } else {
                out += line + '\n';
                line = word;
            }
        }
        out += line;
    }
    return out;
}

std::string escapeFilterValue(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

const char* renderErrorName(RenderErrorKind kind) noexcept {
    switch (kind) {
        case RenderErrorKind::OutOfMemory: return "out_of_memory";
        case RenderErrorKind::AssetMissing: return "asset_missing";
        case RenderErrorKind::EncodeFailure: return "encode_failure";
        case RenderErrorKind::Timeout: return "timeout";
        case RenderErrorKind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

FfmpegRenderWorker::FfmpegRenderWorker(RenderConfig config) : config_(std::move(config)) {
    LOG_DEBUG("Render worker: " + config_.ffmpeg + " " + std::to_string(config_.width) + "x" +
              std::to_string(config_.height) + "@" + std::to_string(config_.fps) + " " +
              seconds(config_.durationSeconds) + "s");
}

std::size_t FfmpegRenderWorker::charsPerLine(int fontSize) const noexcept {
    // Average glyph advance is roughly 0.55em for the supported fonts
    const double usable = std::max(1, config_.width - 2 * config_.paddingX);
    const double advance = std::max(1.0, fontSize * 0.55);
    return std::max<std::size_t>(8, static_cast<std::size_t>(usable / advance));
}

bool FfmpegRenderWorker::writeTextFiles(const RenderRequest& request,
                                        const std::filesystem::path& workDir) const noexcept {
    try {
        if (!writeText(workDir / "title.txt", wrapText(request.script.title, charsPerLine(config_.titleFontSize)))) {
            return false;
        }
        const auto& cues = request.script.captions;
        for (size_t i = 0; i < cues.size(); ++i) {
            auto path = workDir / ("cue-" + std::to_string(i) + ".txt");
            if (!writeText(path, wrapText(cues[i].text, charsPerLine(config_.captionFontSize)))) {
                return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write overlay text for " + request.itemId + ": " + e.what());
        return false;
    }
}

std::string FfmpegRenderWorker::buildFilterGraph(const RenderRequest& request,
                                                 const std::filesystem::path& workDir) const {
    const std::string w = std::to_string(config_.width);
    const std::string h = std::to_string(config_.height);
    const std::string font = escapeFilterValue(request.assets.font.string());

    std::string graph = "[0:v]scale=" + w + ":" + h + ":force_original_aspect_ratio=increase,crop=" +
                        w + ":" + h + ",setsar=1,fps=" + std::to_string(config_.fps) + ",format=yuv420p[v0]";

    graph += ";[v0]drawtext=fontfile=" + font +
             ":textfile=" + escapeFilterValue((workDir / "title.txt").string()) +
             ":fontsize=" + std::to_string(config_.titleFontSize) +
             ":fontcolor=" + config_.textColor +
             ":line_spacing=10:x=(w-text_w)/2:y=" + std::to_string(config_.titleY) + "[v1]";

    int label = 1;
    const auto& cues = request.script.captions;
    for (size_t i = 0; i < cues.size(); ++i) {
        const auto textFile = workDir / ("cue-" + std::to_string(i) + ".txt");
        graph += ";[v" + std::to_string(label) + "]drawtext=fontfile=" + font +
                 ":textfile=" + escapeFilterValue(textFile.string()) +
                 ":fontsize=" + std::to_string(config_.captionFontSize) +
                 ":fontcolor=" + config_.captionColor +
                 ":borderw=3:bordercolor=black:line_spacing=8:x=(w-text_w)/2:y=(h-text_h)/2" +
                 ":enable=" + escapeFilterValue("between(t," + seconds(cues[i].start) + "," + seconds(cues[i].end) + ")") +
                 "[v" + std::to_string(label + 1) + "]";
        ++label;
    }

    if (request.assets.music) {
        graph += ";[1:a]volume=" + seconds(config_.musicVolume) +
                 ",atrim=0:" + seconds(config_.durationSeconds) + ",asetpts=PTS-STARTPTS[aout]";
    } else {
        graph += ";[1:a]atrim=0:" + seconds(config_.durationSeconds) + "[aout]";
    }
    graph += ";[v" + std::to_string(label) + "]null[vout]";
    return graph;
}

std::vector<std::string> FfmpegRenderWorker::buildCommand(const RenderRequest& request,
                                                          const std::filesystem::path& workDir,
                                                          const std::filesystem::path& partialPath) const {
    const std::string duration = seconds(config_.durationSeconds);

    std::vector<std::string> argv = {
        config_.ffmpeg, "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
        "-loop", "1", "-framerate", std::to_string(config_.fps), "-t", duration,
        "-i", request.assets.background.string(),
    };

    if (request.assets.music) {
        argv.insert(argv.end(), {"-stream_loop", "-1", "-t", duration, "-i", request.assets.music->string()});
    } else {
        argv.insert(argv.end(), {"-f", "lavfi", "-t", duration, "-i", "anullsrc=channel_layout=stereo:sample_rate=44100"});
    }

    argv.insert(argv.end(), {
        "-filter_complex", buildFilterGraph(request, workDir),
        "-map", "[vout]", "-map", "[aout]",
        "-c:v", config_.videoCodec, "-b:v", config_.videoBitrate,
        "-r", std::to_string(config_.fps), "-pix_fmt", "yuv420p",
        "-threads", std::to_string(config_.threads),
        "-c:a", "aac", "-b:a", config_.audioBitrate,
        "-t", duration,
        "-map_metadata", "-1",
        "-fflags", "+bitexact", "-flags:v", "+bitexact", "-flags:a", "+bitexact",
        "-movflags", "+faststart",
        "-f", "mp4", partialPath.string(),
    });
    return argv;
}

RenderResult FfmpegRenderWorker::render(const RenderRequest& request,
                                        const Lease& lease,
                                        const ActionContext& ctx) {
    if (!lease.valid()) {
        return RenderResult::failure(RenderErrorKind::EncodeFailure, "render invoked without a lease");
    }

    std::error_code ec;
    if (request.assets.background.empty() || !std::filesystem::is_regular_file(request.assets.background, ec)) {
        return RenderResult::failure(RenderErrorKind::AssetMissing,
                                     "background image not found: " + request.assets.background.string());
    }
    if (request.assets.font.empty() || !std::filesystem::is_regular_file(request.assets.font, ec)) {
        return RenderResult::failure(RenderErrorKind::AssetMissing,
                                     "font not found: " + request.assets.font.string());
    }
    if (request.assets.music && !std::filesystem::is_regular_file(*request.assets.music, ec)) {
        return RenderResult::failure(RenderErrorKind::AssetMissing,
                                     "music file not found: " + request.assets.music->string());
    }

    const auto outputDir = request.outputPath.parent_path();
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        return RenderResult::failure(RenderErrorKind::EncodeFailure,
                                     "cannot create " + outputDir.string() + ": " + ec.message());
    }

    ScratchDir scratch(outputDir / ("." + request.itemId + ".render"));
    std::filesystem::remove_all(scratch.path(), ec);
    std::filesystem::create_directories(scratch.path(), ec);
    if (ec) {
        return RenderResult::failure(RenderErrorKind::EncodeFailure,
                                     "cannot create " + scratch.path().string() + ": " + ec.message());
    }
    if (!writeTextFiles(request, scratch.path())) {
        return RenderResult::failure(RenderErrorKind::EncodeFailure, "failed to write overlay text files");
    }

    const auto partial = scratch.path() / "partial.mp4";
    const auto argv = buildCommand(request, scratch.path(), partial);
    LOG_DEBUG("Render " + request.itemId + " (lease " + std::to_string(lease.id()) + "): " + describeCommand(argv));

    CommandResult run = runCommand(argv, ctx);
    if (run.cancelled) {
        return RenderResult::failure(RenderErrorKind::Cancelled, "render cancelled");
    }
    if (run.timedOut) {
        return RenderResult::failure(RenderErrorKind::Timeout, "ffmpeg exceeded the render deadline");
    }
    if (!run.started) {
        return RenderResult::failure(RenderErrorKind::EncodeFailure,
                                     "failed to start " + config_.ffmpeg + ": " + lastLine(run.err));
    }
    if (run.exitCode != 0) {
        if (mentionsOutOfMemory(run.err)) {
            return RenderResult::failure(RenderErrorKind::OutOfMemory, lastLine(run.err));
        }
        std::string detail = lastLine(run.err);
        return RenderResult::failure(RenderErrorKind::EncodeFailure,
                                     "ffmpeg exited with " + std::to_string(run.exitCode) +
                                     (detail.empty() ? "" : ": " + detail));
    }

    if (!std::filesystem::is_regular_file(partial, ec) || std::filesystem::file_size(partial, ec) == 0) {
        return RenderResult::failure(RenderErrorKind::EncodeFailure, "ffmpeg produced no output");
    }
    std::filesystem::rename(partial, request.outputPath, ec);
    if (ec) {
        return RenderResult::failure(RenderErrorKind::EncodeFailure,
                                     "cannot move media into place: " + ec.message());
    }

    LOG_INFO("Rendered " + request.itemId + " -> " + request.outputPath.string());
    return RenderResult::success({request.outputPath, config_.durationSeconds});
}

}
