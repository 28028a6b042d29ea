/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <set>

#include "fixtures/FakeCollaborators.hpp"
#include "reelforge/errors.hpp"
#include "reelforge/flow.hpp"
#include "reelforge/journal.hpp"
#include "reelforge/orchestrator.hpp"

namespace reelforge {
namespace {

using fakes::FakeEndpoint;
using fakes::FakeGenerator;
using fakes::FakeRenderer;
using fakes::TempDir;
using fakes::eventually;
using fakes::testConfig;

constexpr Millis kBatchWait{10000};

ContentItem itemAt(const Orchestrator& pipeline, const BatchHandle& batch, int index) {
    auto item = pipeline.item(Workspace::itemIdFor(batch, index));
    EXPECT_TRUE(item.has_value());
    return item ? *item : ContentItem{};
}

// -----------------------------------------------------------------------------
// Happy path: every topic is scripted, rendered and published exactly once
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, PublishesEveryTopicOnce) {
    TempDir dir("orch_happy");
    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    Orchestrator pipeline(testConfig(dir.path()), generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"alpha", "beta", "gamma"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    Progress progress = pipeline.pollProgress(batch);
    EXPECT_EQ(progress.total, 3u);
    EXPECT_EQ(progress.done, 3u);
    EXPECT_EQ(progress.failed, 0u);
    EXPECT_TRUE(progress.complete());

    std::set<std::string> remoteIds;
    for (int i = 1; i <= 3; ++i) {
        ContentItem item = itemAt(pipeline, batch, i);
        EXPECT_EQ(item.stage, Stage::Done);
        EXPECT_EQ(item.index, i);
        EXPECT_EQ(item.attemptsFor(Stage::Scripting), 1);
        EXPECT_EQ(item.attemptsFor(Stage::Rendering), 1);
        EXPECT_EQ(item.attemptsFor(Stage::Uploading), 1);
        ASSERT_TRUE(item.receipt.has_value());
        remoteIds.insert(item.receipt->remoteId);
        EXPECT_EQ(endpoint.publishedCount(item.id), 1);
        EXPECT_TRUE(std::filesystem::exists(pipeline.workspace().doneDir(item.id) / "receipt.json"));
    }
    EXPECT_EQ(remoteIds.size(), 3u);
    EXPECT_EQ(renderer.withoutLease(), 0);
    EXPECT_EQ(pipeline.governor().inUse(), 0u);

    BatchReport report = pipeline.report(batch);
    EXPECT_TRUE(report.allDone());
    EXPECT_TRUE(report.failures().empty());
    EXPECT_EQ(report.items[1].topic, "beta");
}

// -----------------------------------------------------------------------------
// Retry: two malformed scripts, then success on the third attempt. The
// others finish while beta is still backing off.
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, RetriesTransientGenerationFailures) {
    TempDir dir("orch_retry");
    FakeGenerator generator;
    generator.failTimes("beta", 2);
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    config.scripting.backoffBase = Millis(500);
    config.scripting.backoffCeiling = Millis(500);
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"alpha", "beta", "gamma"});
    ASSERT_TRUE(eventually([&] {
        return itemAt(pipeline, batch, 1).stage == Stage::Done &&
               itemAt(pipeline, batch, 3).stage == Stage::Done;
    }, Millis(900)));
    EXPECT_EQ(itemAt(pipeline, batch, 2).stage, Stage::Scripting);
    EXPECT_LT(generator.callsFor("beta"), 3);

    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    EXPECT_EQ(pipeline.pollProgress(batch).done, 3u);
    ContentItem beta = itemAt(pipeline, batch, 2);
    EXPECT_EQ(beta.stage, Stage::Done);
    EXPECT_EQ(beta.attemptsFor(Stage::Scripting), 3);
    EXPECT_EQ(generator.callsFor("beta"), 3);
    EXPECT_EQ(generator.callsFor("alpha"), 1);
}

// -----------------------------------------------------------------------------
// Retry bound: retries + 1 attempts, then Failed with the stage's kind
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, FailsAfterRetriesExhausted) {
    TempDir dir("orch_exhaust");
    FakeGenerator generator;
    generator.failTimes("doomed", 100);
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    config.scripting.retries = 2;
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"fine", "doomed"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    ContentItem fine = itemAt(pipeline, batch, 1);
    ContentItem doomed = itemAt(pipeline, batch, 2);
    EXPECT_EQ(fine.stage, Stage::Done);
    EXPECT_EQ(doomed.stage, Stage::Failed);
    EXPECT_EQ(doomed.failureKind, FailureKind::Generation);
    EXPECT_EQ(doomed.attemptsFor(Stage::Scripting), 3);
    EXPECT_EQ(doomed.attemptsFor(Stage::Rendering), 0);
    EXPECT_NE(doomed.reason.find("after 3 attempts"), std::string::npos) << doomed.reason;
    EXPECT_EQ(generator.callsFor("doomed"), 3);

    BatchReport report = pipeline.report(batch);
    auto failures = report.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0]->id, doomed.id);
    EXPECT_EQ(failures[0]->failureKind, FailureKind::Generation);
}

// -----------------------------------------------------------------------------
// Zero retries: a single failed attempt is final
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, ZeroRetriesMeansOneAttempt) {
    TempDir dir("orch_zero");
    FakeGenerator generator;
    FakeRenderer renderer;
    renderer.failAlways(RenderErrorKind::EncodeFailure);
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    config.rendering.retries = 0;
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"alpha"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    ContentItem item = itemAt(pipeline, batch, 1);
    EXPECT_EQ(item.stage, Stage::Failed);
    EXPECT_EQ(item.failureKind, FailureKind::Render);
    EXPECT_EQ(item.attemptsFor(Stage::Rendering), 1);
    EXPECT_EQ(renderer.calls(), 1);
    EXPECT_TRUE(std::filesystem::exists(pipeline.workspace().failedDir(item.id) / "error.txt"));
}

// -----------------------------------------------------------------------------
// Render capacity: five items, four render workers, one GPU slot
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, RenderConcurrencyNeverExceedsCapacity) {
    TempDir dir("orch_capacity");
    FakeGenerator generator;
    FakeRenderer renderer(Millis(20));
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    config.lanes.renderWorkers = 4;
    config.governor.capacity = 1;
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"a", "b", "c", "d", "e"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    EXPECT_EQ(pipeline.pollProgress(batch).done, 5u);
    EXPECT_EQ(renderer.calls(), 5);
    EXPECT_LE(renderer.peak(), 1);
    EXPECT_LE(pipeline.governor().peakInUse(), 1u);
    EXPECT_EQ(pipeline.governor().outstanding(), 0u);
}

// -----------------------------------------------------------------------------
// Missing assets are not worth retrying
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, MissingBackgroundFailsWithoutRetry) {
    TempDir dir("orch_assets");
    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    Orchestrator pipeline(testConfig(dir.path(), false), generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"alpha"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    ContentItem item = itemAt(pipeline, batch, 1);
    EXPECT_EQ(item.stage, Stage::Failed);
    EXPECT_EQ(item.failureKind, FailureKind::Render);
    EXPECT_EQ(item.attemptsFor(Stage::Rendering), 1);
    EXPECT_EQ(renderer.calls(), 0);
}

// -----------------------------------------------------------------------------
// Non-retryable upload errors end the item on the first attempt
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, RejectedUploadIsNotRetried) {
    TempDir dir("orch_rejected");
    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    endpoint.failWith("About banned", UploadErrorKind::ContentRejected);
    Orchestrator pipeline(testConfig(dir.path()), generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"banned", "allowed"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    ContentItem banned = itemAt(pipeline, batch, 1);
    EXPECT_EQ(banned.stage, Stage::Failed);
    EXPECT_EQ(banned.failureKind, FailureKind::Upload);
    EXPECT_EQ(banned.attemptsFor(Stage::Uploading), 1);
    EXPECT_EQ(endpoint.attemptsFor(banned.id), 1);
    EXPECT_NE(banned.reason.find("content_rejected"), std::string::npos) << banned.reason;

    EXPECT_EQ(itemAt(pipeline, batch, 2).stage, Stage::Done);
}

// -----------------------------------------------------------------------------
// Quota errors wait at least the endpoint's retry-after hint
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, QuotaRetryHonoursRetryAfter) {
    TempDir dir("orch_quota");
    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    endpoint.failWith("About busy", UploadErrorKind::QuotaExceeded, 1, Millis(200));
    Orchestrator pipeline(testConfig(dir.path()), generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    auto started = Clock::now();
    BatchHandle batch = pipeline.submitBatch({"busy"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));
    auto elapsed = std::chrono::duration_cast<Millis>(Clock::now() - started);

    ContentItem item = itemAt(pipeline, batch, 1);
    EXPECT_EQ(item.stage, Stage::Done);
    EXPECT_EQ(item.attemptsFor(Stage::Uploading), 2);
    EXPECT_GE(elapsed.count(), 200);
}

// -----------------------------------------------------------------------------
// Per-attempt deadline: a hanging generator times out each attempt
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, AttemptDeadlineProducesTimeoutFailure) {
    TempDir dir("orch_timeout");
    FakeGenerator generator;
    generator.hang("stuck");
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    config.scripting.timeout = Millis(50);
    config.scripting.retries = 1;
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"stuck"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    ContentItem item = itemAt(pipeline, batch, 1);
    EXPECT_EQ(item.stage, Stage::Failed);
    EXPECT_EQ(item.failureKind, FailureKind::Timeout);
    EXPECT_EQ(item.attemptsFor(Stage::Scripting), 2);
}

// -----------------------------------------------------------------------------
// An upload that lands after its deadline is never submitted a second time
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, LateUploadIsNotRepublished) {
    TempDir dir("orch_late");
    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    endpoint.delayFirst("About slowpoke", Millis(300));
    PipelineConfig config = testConfig(dir.path());
    config.uploading.timeout = Millis(100);
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"slowpoke"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    ContentItem item = itemAt(pipeline, batch, 1);
    EXPECT_EQ(item.stage, Stage::Done);
    EXPECT_EQ(item.attemptsFor(Stage::Uploading), 2);
    EXPECT_EQ(endpoint.publishedCount(item.id), 1);
    EXPECT_EQ(pipeline.dispatcher().submissions(), 1u);
}

// -----------------------------------------------------------------------------
// Cancel: in-flight and queued items all end Failed(Cancelled)
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, CancelStopsEveryItem) {
    TempDir dir("orch_cancel");
    FakeGenerator generator;
    generator.hangAll();
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    Orchestrator pipeline(testConfig(dir.path()), generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"one", "two", "three"});
    ASSERT_TRUE(eventually([&] { return generator.calls() >= 1; }));

    EXPECT_TRUE(pipeline.cancelBatch(batch));
    EXPECT_TRUE(pipeline.waitForBatch(batch, Millis(2000)));

    Progress progress = pipeline.pollProgress(batch);
    EXPECT_EQ(progress.failed, 3u);
    for (int i = 1; i <= 3; ++i) {
        ContentItem item = itemAt(pipeline, batch, i);
        EXPECT_EQ(item.stage, Stage::Failed);
        EXPECT_EQ(item.failureKind, FailureKind::Cancelled);
        EXPECT_EQ(item.reason, "Cancelled");
    }

    // Workers that were still running must not revive anything
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(pipeline.pollProgress(batch).failed, 3u);
    EXPECT_EQ(renderer.calls(), 0);
    EXPECT_EQ(endpoint.totalPublished(), 0);

    EXPECT_TRUE(pipeline.cancelBatch(batch));
    EXPECT_TRUE(pipeline.report(batch).cancelled);
}

TEST(OrchestratorTest, CancelUnknownBatchReturnsFalse) {
    TempDir dir("orch_cancel_unknown");
    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    Orchestrator pipeline(testConfig(dir.path()), generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    EXPECT_FALSE(pipeline.cancelBatch("no-such-batch"));
}

// -----------------------------------------------------------------------------
// Batch validation
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, RejectsInvalidBatches) {
    TempDir dir("orch_invalid");
    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    config.limits.maxBatchSize = 2;
    config.limits.maxTopicBytes = 16;
    Orchestrator pipeline(config, generator, renderer, endpoint);

    EXPECT_THROW((void)pipeline.submitBatch({"alpha"}), InvalidBatchError);
    ASSERT_TRUE(pipeline.start());

    EXPECT_THROW((void)pipeline.submitBatch({}), InvalidBatchError);
    EXPECT_THROW((void)pipeline.submitBatch({"a", "b", "c"}), InvalidBatchError);
    EXPECT_THROW((void)pipeline.submitBatch({"fine", "   "}), InvalidBatchError);
    EXPECT_THROW((void)pipeline.submitBatch({std::string(17, 'x')}), InvalidBatchError);
    EXPECT_TRUE(pipeline.batches().empty());

    BatchHandle batch = pipeline.submitBatch({"  padded  "});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));
    EXPECT_EQ(itemAt(pipeline, batch, 1).topic, "padded");
}

TEST(OrchestratorTest, RejectsInvalidConfig) {
    TempDir dir("orch_config");
    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    config.governor.capacity = 0;
    EXPECT_THROW({ Orchestrator pipeline(config, generator, renderer, endpoint); }, ConfigError);
}

TEST(OrchestratorTest, CannotRestartAfterShutdown) {
    TempDir dir("orch_restart");
    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    Orchestrator pipeline(testConfig(dir.path()), generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());
    EXPECT_FALSE(pipeline.start());
    pipeline.shutdown();
    EXPECT_FALSE(pipeline.isRunning());
    EXPECT_FALSE(pipeline.start());
}

// -----------------------------------------------------------------------------
// Journal and status view agree with the live pipeline
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, JournalRecordsCompletedBatch) {
    TempDir dir("orch_journal");
    FakeGenerator generator;
    generator.failTimes("second", 1);
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    BatchHandle batch = pipeline.submitBatch({"first", "second"});
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));
    pipeline.shutdown();

    JournalReplay replay = Journal::replay(pipeline.workspace().journalFile());
    EXPECT_EQ(replay.skipped, 0u);
    ASSERT_EQ(replay.batchOrder.size(), 1u);
    EXPECT_EQ(replay.batchOrder[0], batch);
    auto items = replay.itemsOf(batch);
    ASSERT_EQ(items.size(), 2u);
    for (const auto* state : items) {
        EXPECT_EQ(state->stage, Stage::Done);
        ASSERT_TRUE(state->receipt.has_value());
        EXPECT_EQ(state->receipt->remoteId, "remote-" + state->id);
    }
    EXPECT_EQ(replay.item(Workspace::itemIdFor(batch, 2))->attempts[0], 2);

    Flow flow(config.workspace);
    auto latest = flow.latest();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(*latest, batch);
    auto report = flow.report(batch);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->allDone());
    auto receipt = flow.receipt(Workspace::itemIdFor(batch, 1));
    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(receipt->remoteId, "remote-" + Workspace::itemIdFor(batch, 1));
}

// -----------------------------------------------------------------------------
// Resume: a restarted pipeline continues from the last recorded stage
// -----------------------------------------------------------------------------
TEST(OrchestratorTest, ResumeContinuesFromRecordedStage) {
    TempDir dir("orch_resume");
    BatchHandle batch;
    {
        FakeGenerator generator;
        FakeRenderer renderer;
        renderer.failAlways(RenderErrorKind::EncodeFailure);
        FakeEndpoint endpoint;
        PipelineConfig config = testConfig(dir.path());
        config.rendering.backoffBase = Millis(60000);
        config.rendering.backoffCeiling = Millis(60000);
        Orchestrator pipeline(config, generator, renderer, endpoint);
        ASSERT_TRUE(pipeline.start());

        batch = pipeline.submitBatch({"alpha"});
        ASSERT_TRUE(eventually([&] { return renderer.calls() >= 1; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        pipeline.shutdown();

        ContentItem item = itemAt(pipeline, batch, 1);
        EXPECT_EQ(item.stage, Stage::Rendering);
        EXPECT_EQ(generator.calls(), 1);
    }

    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    config.resume = true;
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    ASSERT_EQ(pipeline.batches().size(), 1u);
    ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));

    ContentItem item = itemAt(pipeline, batch, 1);
    EXPECT_EQ(item.stage, Stage::Done);
    EXPECT_EQ(item.topic, "alpha");
    EXPECT_EQ(item.attemptsFor(Stage::Scripting), 1);
    EXPECT_EQ(item.attemptsFor(Stage::Rendering), 2);
    EXPECT_EQ(generator.calls(), 0);
    EXPECT_EQ(endpoint.publishedCount(item.id), 1);
}

TEST(OrchestratorTest, ResumeKeepsFinishedBatchesUntouched) {
    TempDir dir("orch_resume_done");
    BatchHandle batch;
    {
        FakeGenerator generator;
        FakeRenderer renderer;
        FakeEndpoint endpoint;
        Orchestrator pipeline(testConfig(dir.path()), generator, renderer, endpoint);
        ASSERT_TRUE(pipeline.start());
        batch = pipeline.submitBatch({"alpha", "beta"});
        ASSERT_TRUE(pipeline.waitForBatch(batch, kBatchWait));
    }

    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    PipelineConfig config = testConfig(dir.path());
    config.resume = true;
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    EXPECT_TRUE(pipeline.pollProgress(batch).complete());
    EXPECT_EQ(pipeline.pollProgress(batch).done, 2u);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(generator.calls(), 0);
    EXPECT_EQ(renderer.calls(), 0);
    EXPECT_EQ(endpoint.totalPublished(), 0);
    EXPECT_EQ(pipeline.dispatcher().receipts(), 2u);
}

// A batch journaled as cancelled stays cancelled, including items whose
// artifacts are gone.
TEST(OrchestratorTest, ResumeCancelledBatchCancelsEveryOpenItem) {
    TempDir dir("orch_resume_cancelled");
    PipelineConfig config = testConfig(dir.path());
    {
        Journal journal(config.workspace / "journal.jsonl");
        journal.batchCreated("b", 2);
        journal.itemCreated("b", "b-1", 1, "alpha");
        journal.itemCreated("b", "b-2", 2, "beta");
        journal.stageEntered("b", "b-1", Stage::Scripting);
        journal.stageEntered("b", "b-2", Stage::Scripting);
        journal.attemptStarted("b", "b-2", Stage::Scripting, 1);
        journal.stageEntered("b", "b-2", Stage::Rendering);
        journal.batchCancelled("b");
    }

    FakeGenerator generator;
    FakeRenderer renderer;
    FakeEndpoint endpoint;
    config.resume = true;
    Orchestrator pipeline(config, generator, renderer, endpoint);
    ASSERT_TRUE(pipeline.start());

    ASSERT_TRUE(pipeline.waitForBatch("b", kBatchWait));
    for (int i = 1; i <= 2; ++i) {
        ContentItem item = itemAt(pipeline, "b", i);
        EXPECT_EQ(item.stage, Stage::Failed);
        EXPECT_EQ(item.failureKind, FailureKind::Cancelled);
        EXPECT_EQ(item.reason, "Cancelled");
    }
    EXPECT_EQ(generator.calls(), 0);
    EXPECT_EQ(renderer.calls(), 0);
}

}
}
