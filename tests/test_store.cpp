/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <thread>

#include "reelforge/report.hpp"
#include "reelforge/store.hpp"

namespace reelforge {
namespace {

std::vector<ContentItem> freshItems(const BatchId& batch, int count) {
    std::vector<ContentItem> items;
    for (int i = 1; i <= count; ++i) {
        ContentItem item;
        item.id = batch + "-" + std::to_string(i);
        item.index = i;
        item.topic = "topic " + std::to_string(i);
        items.push_back(item);
    }
    return items;
}

Script tinyScript() {
    Script script;
    script.title = "T";
    script.narration = {"line"};
    return script;
}

// Walks one item from Queued to Done through every legal transition.
void publish(ItemStore& store, const ItemId& id) {
    ASSERT_TRUE(store.enterStage(id, Stage::Scripting));
    ASSERT_TRUE(store.beginAttempt(id));
    ASSERT_TRUE(store.setScript(id, tinyScript(), "/ws/items/" + id + "/script.json"));
    ASSERT_TRUE(store.enterStage(id, Stage::Rendering));
    ASSERT_TRUE(store.beginAttempt(id));
    ASSERT_TRUE(store.setMedia(id, "/ws/media/" + id + ".mp4", 15.0));
    ASSERT_TRUE(store.enterStage(id, Stage::Uploading));
    ASSERT_TRUE(store.beginAttempt(id));
    ASSERT_TRUE(store.setReceipt(id, {id, "yt-" + id, ""}));
    ASSERT_TRUE(store.complete(id));
}

TEST(ItemStoreTest, FollowsPipelineOrder) {
    ItemStore store;
    ASSERT_TRUE(store.addBatch("b", freshItems("b", 1)));

    EXPECT_FALSE(store.enterStage("b-1", Stage::Rendering));
    EXPECT_FALSE(store.beginAttempt("b-1"));
    ASSERT_TRUE(store.enterStage("b-1", Stage::Scripting));
    EXPECT_FALSE(store.enterStage("b-1", Stage::Scripting));

    // Rendering needs a script, Uploading needs media
    EXPECT_FALSE(store.enterStage("b-1", Stage::Rendering));
    EXPECT_FALSE(store.setMedia("b-1", "/x.mp4", 1.0));
    ASSERT_TRUE(store.setScript("b-1", tinyScript(), "/s.json"));
    ASSERT_TRUE(store.enterStage("b-1", Stage::Rendering));
    EXPECT_FALSE(store.enterStage("b-1", Stage::Uploading));
    EXPECT_FALSE(store.setReceipt("b-1", {"b-1", "yt", ""}));
    ASSERT_TRUE(store.setMedia("b-1", "/x.mp4", 1.0));
    ASSERT_TRUE(store.enterStage("b-1", Stage::Uploading));

    // Done needs a receipt
    EXPECT_FALSE(store.complete("b-1"));
    EXPECT_FALSE(store.enterStage("b-1", Stage::Done));
    ASSERT_TRUE(store.setReceipt("b-1", {"b-1", "yt", ""}));
    ASSERT_TRUE(store.complete("b-1"));
    EXPECT_EQ(store.get("b-1")->stage, Stage::Done);
}

TEST(ItemStoreTest, CountsAttemptsPerStage) {
    ItemStore store;
    ASSERT_TRUE(store.addBatch("b", freshItems("b", 1)));
    ASSERT_TRUE(store.enterStage("b-1", Stage::Scripting));

    int attempt = 0;
    ASSERT_TRUE(store.beginAttempt("b-1", attempt));
    EXPECT_EQ(attempt, 1);
    ASSERT_TRUE(store.beginAttempt("b-1", attempt));
    EXPECT_EQ(attempt, 2);

    auto item = store.get("b-1");
    EXPECT_EQ(item->attemptsFor(Stage::Scripting), 2);
    EXPECT_EQ(item->attemptsFor(Stage::Rendering), 0);
    EXPECT_EQ(item->totalAttempts(), 2);
}

TEST(ItemStoreTest, TerminalStatesAreFinal) {
    ItemStore store;
    ASSERT_TRUE(store.addBatch("b", freshItems("b", 2)));
    publish(store, "b-1");

    EXPECT_FALSE(store.fail("b-1", FailureKind::Upload, "too late"));
    EXPECT_FALSE(store.fail("b-2", FailureKind::Internal, ""));
    EXPECT_FALSE(store.fail("b-2", FailureKind::None, "no kind"));
    ASSERT_TRUE(store.fail("b-2", FailureKind::Render, "render: out_of_memory"));
    EXPECT_FALSE(store.fail("b-2", FailureKind::Cancelled, "Cancelled"));
    EXPECT_FALSE(store.enterStage("b-2", Stage::Scripting));

    auto failed = store.get("b-2");
    EXPECT_EQ(failed->failureKind, FailureKind::Render);
    EXPECT_EQ(failed->reason, "render: out_of_memory");
}

TEST(ItemStoreTest, RejectsDuplicateBatchesAndItems) {
    ItemStore store;
    ASSERT_TRUE(store.addBatch("b", freshItems("b", 2)));
    EXPECT_FALSE(store.addBatch("b", freshItems("c", 1)));
    EXPECT_FALSE(store.addBatch("c", freshItems("b", 1)));
    EXPECT_FALSE(store.hasBatch("c"));
    EXPECT_EQ(store.batchIds().size(), 1u);
}

TEST(ItemStoreTest, CancelRaisesSharedFlagOnce) {
    ItemStore store;
    ASSERT_TRUE(store.addBatch("b", freshItems("b", 1)));
    CancelFlag flag = store.cancelFlag("b");
    ASSERT_TRUE(flag);
    EXPECT_FALSE(flag->load());

    EXPECT_TRUE(store.markCancelled("b"));
    EXPECT_TRUE(flag->load());
    EXPECT_TRUE(store.isCancelled("b"));
    EXPECT_FALSE(store.markCancelled("b"));
    EXPECT_FALSE(store.markCancelled("unknown"));
}

TEST(ItemStoreTest, ProgressAndCompletionWait) {
    ItemStore store;
    ASSERT_TRUE(store.addBatch("b", freshItems("b", 3)));
    ASSERT_TRUE(store.enterStage("b-2", Stage::Scripting));

    Progress progress = store.progress("b");
    EXPECT_EQ(progress.total, 3u);
    EXPECT_EQ(progress.queued, 2u);
    EXPECT_EQ(progress.inFlight, 1u);
    EXPECT_FALSE(store.waitUntilComplete("b", Millis(20)));

    std::thread finisher([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        publish(store, "b-1");
        (void)store.fail("b-2", FailureKind::Generation, "malformed");
        (void)store.fail("b-3", FailureKind::Cancelled, "Cancelled");
    });
    EXPECT_TRUE(store.waitUntilComplete("b", Millis(5000)));
    finisher.join();

    progress = store.progress("b");
    EXPECT_EQ(progress.done, 1u);
    EXPECT_EQ(progress.failed, 2u);
    EXPECT_TRUE(store.isBatchComplete("b"));
}

// -----------------------------------------------------------------------------
// Reports
// -----------------------------------------------------------------------------
TEST(BatchReportTest, ListsFailuresWithReasons) {
    ItemStore store;
    ASSERT_TRUE(store.addBatch("b", freshItems("b", 2)));
    publish(store, "b-1");
    ASSERT_TRUE(store.fail("b-2", FailureKind::Upload, "Uploading failed after 1 attempt: auth_invalid"));

    BatchReport report;
    report.id = "b";
    for (const auto& item : store.itemsOf("b")) {
        report.items.push_back(toItemReport(item));
    }
    report.progress = tally(report.items);

    EXPECT_TRUE(report.complete());
    EXPECT_FALSE(report.allDone());
    ASSERT_EQ(report.failures().size(), 1u);
    EXPECT_EQ(report.failures()[0]->id, "b-2");

    std::string text = formatReport(report);
    EXPECT_NE(text.find("b-2"), std::string::npos);
    EXPECT_NE(text.find("auth_invalid"), std::string::npos);
    EXPECT_NE(text.find("yt-b-1"), std::string::npos);
}

}
}
