/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <algorithm>

#include "fixtures/FakeCollaborators.hpp"
#include "reelforge/governor.hpp"
#include "reelforge/render.hpp"

namespace reelforge {
namespace {

using fakes::TempDir;
using fakes::writeFile;

bool hasArg(const std::vector<std::string>& argv, const std::string& arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

std::string argAfter(const std::vector<std::string>& argv, const std::string& flag) {
    auto it = std::find(argv.begin(), argv.end(), flag);
    return (it == argv.end() || it + 1 == argv.end()) ? std::string() : *(it + 1);
}

RenderRequest sampleRequest(const std::filesystem::path& root) {
    RenderRequest request;
    request.itemId = "b-1";
    request.script.title = "Why the sky is blue";
    request.script.narration = {"Sunlight scatters.", "Blue scatters most."};
    request.script.captions = deriveCues(request.script.narration, 15.0);
    request.assets.background = root / "bg.png";
    request.assets.font = root / "font.ttf";
    request.outputPath = root / "media" / "b-1.mp4";
    writeFile(request.assets.background, "png");
    writeFile(request.assets.font, "ttf");
    return request;
}

// Stand-in encoder: writes its last argument (the output path).
std::filesystem::path fakeEncoder(const std::filesystem::path& dir, const std::string& body) {
    auto path = dir / "fake-ffmpeg.sh";
    writeFile(path, "#!/bin/sh\n" + body + "\n");
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

TEST(RenderCommandTest, SilentTrackWhenNoMusic) {
    TempDir dir("render_cmd");
    FfmpegRenderWorker worker(RenderConfig{});
    RenderRequest request = sampleRequest(dir.path());

    auto argv = worker.buildCommand(request, dir.path() / "work", dir.path() / "work" / "partial.mp4");
    ASSERT_FALSE(argv.empty());
    EXPECT_EQ(argv.front(), "ffmpeg");
    EXPECT_EQ(argv.back(), (dir.path() / "work" / "partial.mp4").string());
    EXPECT_TRUE(hasArg(argv, "anullsrc=channel_layout=stereo:sample_rate=44100"));
    EXPECT_TRUE(hasArg(argv, "+bitexact"));
    EXPECT_EQ(argAfter(argv, "-c:v"), "libx264");
    EXPECT_EQ(argAfter(argv, "-t"), "15.000");
    EXPECT_EQ(argAfter(argv, "-pix_fmt"), "yuv420p");

    std::string graph = argAfter(argv, "-filter_complex");
    EXPECT_NE(graph.find("scale=1080:1920"), std::string::npos);
    EXPECT_NE(graph.find("title.txt"), std::string::npos);
    EXPECT_NE(graph.find("cue-0.txt"), std::string::npos);
    EXPECT_NE(graph.find("cue-1.txt"), std::string::npos);
    EXPECT_NE(graph.find("between(t,7.500,15.000)"), std::string::npos);
    EXPECT_NE(graph.find("[v3]null[vout]"), std::string::npos);
    EXPECT_NE(graph.find("[aout]"), std::string::npos);
}

TEST(RenderCommandTest, LoopsMusicUnderVideo) {
    TempDir dir("render_music");
    RenderConfig config;
    config.musicVolume = 0.5;
    FfmpegRenderWorker worker(config);
    RenderRequest request = sampleRequest(dir.path());
    request.assets.music = dir.path() / "track.mp3";

    auto argv = worker.buildCommand(request, dir.path(), dir.path() / "partial.mp4");
    EXPECT_EQ(argAfter(argv, "-stream_loop"), "-1");
    EXPECT_TRUE(hasArg(argv, (dir.path() / "track.mp3").string()));
    EXPECT_FALSE(hasArg(argv, "anullsrc=channel_layout=stereo:sample_rate=44100"));
    EXPECT_NE(argAfter(argv, "-filter_complex").find("volume=0.500"), std::string::npos);
}

TEST(RenderCommandTest, SameRequestSameCommand) {
    TempDir dir("render_same");
    FfmpegRenderWorker worker(RenderConfig{});
    RenderRequest request = sampleRequest(dir.path());
    EXPECT_EQ(worker.buildCommand(request, dir.path(), dir.path() / "p.mp4"),
              worker.buildCommand(request, dir.path(), dir.path() / "p.mp4"));
}

TEST(RenderTextTest, WrapsAtWidth) {
    EXPECT_EQ(wrapText("the quick brown fox", 9), "the quick\nbrown fox");
    EXPECT_EQ(wrapText("abcdefghij", 4), "abcd\nefgh\nij");
    EXPECT_EQ(wrapText("", 10), "");
}

TEST(RenderTextTest, QuotesFilterValues) {
    EXPECT_EQ(escapeFilterValue("/fonts/a.ttf"), "'/fonts/a.ttf'");
    EXPECT_EQ(escapeFilterValue("it's"), "'it'\\''s'");
}

// -----------------------------------------------------------------------------
// render() against a stand-in encoder
// -----------------------------------------------------------------------------
TEST(FfmpegRenderWorkerTest, RequiresLease) {
    TempDir dir("render_lease");
    FfmpegRenderWorker worker(RenderConfig{});
    RenderResult result = worker.render(sampleRequest(dir.path()), Lease{}, ActionContext{});
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, RenderErrorKind::EncodeFailure);
}

TEST(FfmpegRenderWorkerTest, MissingFontIsAssetMissing) {
    TempDir dir("render_font");
    ResourceGovernor governor(1);
    LeaseResult grant = governor.acquire(1, Millis(10));
    ASSERT_TRUE(grant);

    FfmpegRenderWorker worker(RenderConfig{});
    RenderRequest request = sampleRequest(dir.path());
    request.assets.font = dir.path() / "missing.ttf";
    RenderResult result = worker.render(request, grant.lease, ActionContext{});
    EXPECT_EQ(result.error.kind, RenderErrorKind::AssetMissing);
}

TEST(FfmpegRenderWorkerTest, MovesOutputIntoPlace) {
    TempDir dir("render_ok");
    ResourceGovernor governor(1);
    LeaseResult grant = governor.acquire(1, Millis(10));
    ASSERT_TRUE(grant);

    RenderConfig config;
    config.ffmpeg = fakeEncoder(dir.path(), "for last; do :; done\necho video > \"$last\"").string();
    FfmpegRenderWorker worker(config);
    RenderRequest request = sampleRequest(dir.path());

    RenderResult result = worker.render(request, grant.lease, ActionContext::withTimeout(Millis(5000)));
    ASSERT_TRUE(result) << result.error.message;
    EXPECT_EQ(result.artifact.path, request.outputPath);
    EXPECT_DOUBLE_EQ(result.artifact.durationSeconds, 15.0);
    EXPECT_TRUE(std::filesystem::is_regular_file(request.outputPath));
    EXPECT_FALSE(std::filesystem::exists(request.outputPath.parent_path() / ".b-1.render"));
}

TEST(FfmpegRenderWorkerTest, ClassifiesEncoderFailures) {
    TempDir dir("render_fail");
    ResourceGovernor governor(1);
    LeaseResult grant = governor.acquire(1, Millis(10));
    ASSERT_TRUE(grant);
    RenderRequest request = sampleRequest(dir.path());

    RenderConfig oom;
    oom.ffmpeg = fakeEncoder(dir.path(), "echo 'CUDA_ERROR_OUT_OF_MEMORY: out of memory' >&2\nexit 1").string();
    RenderResult oomResult = FfmpegRenderWorker(oom).render(request, grant.lease, ActionContext{});
    EXPECT_EQ(oomResult.error.kind, RenderErrorKind::OutOfMemory);

    RenderConfig broken;
    broken.ffmpeg = fakeEncoder(dir.path(), "echo 'Invalid data found' >&2\nexit 1").string();
    RenderResult brokenResult = FfmpegRenderWorker(broken).render(request, grant.lease, ActionContext{});
    EXPECT_EQ(brokenResult.error.kind, RenderErrorKind::EncodeFailure);
    EXPECT_NE(brokenResult.error.message.find("Invalid data found"), std::string::npos);

    RenderConfig silent;
    silent.ffmpeg = fakeEncoder(dir.path(), "exit 0").string();
    RenderResult silentResult = FfmpegRenderWorker(silent).render(request, grant.lease, ActionContext{});
    EXPECT_EQ(silentResult.error.kind, RenderErrorKind::EncodeFailure);

    EXPECT_FALSE(std::filesystem::exists(request.outputPath));
    EXPECT_FALSE(std::filesystem::exists(request.outputPath.parent_path() / ".b-1.render"));
}

TEST(FfmpegRenderWorkerTest, DeadlineStopsEncoder) {
    TempDir dir("render_slow");
    ResourceGovernor governor(1);
    LeaseResult grant = governor.acquire(1, Millis(10));
    ASSERT_TRUE(grant);

    RenderConfig config;
    config.ffmpeg = fakeEncoder(dir.path(), "sleep 10").string();
    RenderResult result = FfmpegRenderWorker(config).render(sampleRequest(dir.path()), grant.lease,
                                                            ActionContext::withTimeout(Millis(100)));
    EXPECT_EQ(result.error.kind, RenderErrorKind::Timeout);
}

}
}
