/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

#include "fixtures/FakeCollaborators.hpp"
#include "reelforge/dispatcher.hpp"

namespace reelforge {
namespace {

using fakes::FakeEndpoint;

UploadConfig rateConfig(unsigned perInterval, Millis interval) {
    UploadConfig config;
    config.maxPerInterval = perInterval;
    config.interval = interval;
    return config;
}

MediaArtifact mediaFor(const std::string& id) {
    return {"/tmp/media/" + id + ".mp4", 15.0};
}

UploadMetadata metadataFor(const std::string& topic) {
    UploadMetadata metadata;
    metadata.title = "About " + topic;
    metadata.description = "line";
    metadata.tags = {"shorts"};
    return metadata;
}

class ThrowingEndpoint : public PublishEndpoint {
public:
    UploadResult publish(const MediaArtifact&, const UploadMetadata&, const ActionContext&) override {
        throw std::runtime_error("connection reset");
    }
};

TEST(UploadDispatcherTest, RecordsReceiptAndRefusesDuplicates) {
    FakeEndpoint endpoint;
    UploadDispatcher dispatcher(endpoint, rateConfig(10, Millis(1000)));
    ActionContext ctx = ActionContext::withTimeout(Millis(1000));

    UploadResult first = dispatcher.upload("b-1", mediaFor("b-1"), metadataFor("x"), ctx);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.receipt.itemId, "b-1");
    EXPECT_EQ(first.receipt.remoteId, "remote-b-1");

    UploadResult second = dispatcher.upload("b-1", mediaFor("b-1"), metadataFor("x"), ctx);
    EXPECT_FALSE(second);
    EXPECT_EQ(second.error.kind, UploadErrorKind::Duplicate);
    EXPECT_FALSE(second.error.retryable);
    EXPECT_EQ(endpoint.attemptsFor("b-1"), 1);
    EXPECT_EQ(dispatcher.submissions(), 1u);

    auto receipt = dispatcher.receiptFor("b-1");
    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(receipt->remoteId, "remote-b-1");
}

TEST(UploadDispatcherTest, RestoredReceiptBlocksUpload) {
    FakeEndpoint endpoint;
    UploadDispatcher dispatcher(endpoint, rateConfig(10, Millis(1000)));
    dispatcher.restoreReceipt({"b-7", "yt-7", "https://example.invalid/7"});

    UploadResult result = dispatcher.upload("b-7", mediaFor("b-7"), metadataFor("x"), ActionContext{});
    EXPECT_EQ(result.error.kind, UploadErrorKind::Duplicate);
    EXPECT_EQ(endpoint.attemptsFor("b-7"), 0);
    EXPECT_EQ(dispatcher.receipts(), 1u);
}

// -----------------------------------------------------------------------------
// Rate limit: at most maxPerInterval submissions in any window
// -----------------------------------------------------------------------------
TEST(UploadDispatcherTest, WaitsForSlidingWindow) {
    FakeEndpoint endpoint;
    UploadDispatcher dispatcher(endpoint, rateConfig(2, Millis(200)));
    ActionContext ctx = ActionContext::withTimeout(Millis(5000));

    auto started = Clock::now();
    ASSERT_TRUE(dispatcher.upload("b-1", mediaFor("b-1"), metadataFor("1"), ctx));
    ASSERT_TRUE(dispatcher.upload("b-2", mediaFor("b-2"), metadataFor("2"), ctx));
    EXPECT_EQ(dispatcher.windowLoad(), 2u);
    ASSERT_TRUE(dispatcher.upload("b-3", mediaFor("b-3"), metadataFor("3"), ctx));
    auto elapsed = std::chrono::duration_cast<Millis>(Clock::now() - started);

    EXPECT_GE(elapsed.count(), 180);
    EXPECT_EQ(dispatcher.submissions(), 3u);
}

TEST(UploadDispatcherTest, DeadlineWhileWaitingIsTimeout) {
    FakeEndpoint endpoint;
    UploadDispatcher dispatcher(endpoint, rateConfig(1, Millis(60000)));
    ASSERT_TRUE(dispatcher.upload("b-1", mediaFor("b-1"), metadataFor("1"), ActionContext{}));

    UploadResult result = dispatcher.upload("b-2", mediaFor("b-2"), metadataFor("2"),
                                            ActionContext::withTimeout(Millis(50)));
    EXPECT_EQ(result.error.kind, UploadErrorKind::Timeout);
    EXPECT_TRUE(result.error.retryable);
    EXPECT_EQ(endpoint.attemptsFor("b-2"), 0);
}

TEST(UploadDispatcherTest, CancelWhileWaitingIsCancelled) {
    FakeEndpoint endpoint;
    UploadDispatcher dispatcher(endpoint, rateConfig(1, Millis(60000)));
    ASSERT_TRUE(dispatcher.upload("b-1", mediaFor("b-1"), metadataFor("1"), ActionContext{}));

    CancelFlag cancel = makeCancelFlag();
    UploadResult result;
    std::thread waiter([&] {
        result = dispatcher.upload("b-2", mediaFor("b-2"), metadataFor("2"),
                                   ActionContext::withTimeout(Millis(0), cancel));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    cancel->store(true);
    waiter.join();

    EXPECT_EQ(result.error.kind, UploadErrorKind::Cancelled);
    EXPECT_FALSE(result.error.retryable);
}

// Two uploads of one item queued behind the rate limit publish it once.
TEST(UploadDispatcherTest, QueuedDuplicatePublishesOnce) {
    FakeEndpoint endpoint;
    UploadDispatcher dispatcher(endpoint, rateConfig(1, Millis(300)));
    ASSERT_TRUE(dispatcher.upload("b-0", mediaFor("b-0"), metadataFor("0"), ActionContext{}));

    UploadResult first;
    UploadResult second;
    std::thread a([&] {
        first = dispatcher.upload("b-1", mediaFor("b-1"), metadataFor("1"), ActionContext::withTimeout(Millis(5000)));
    });
    std::thread b([&] {
        second = dispatcher.upload("b-1", mediaFor("b-1"), metadataFor("1"), ActionContext::withTimeout(Millis(5000)));
    });
    a.join();
    b.join();

    EXPECT_NE(static_cast<bool>(first), static_cast<bool>(second));
    const UploadResult& refused = first ? second : first;
    EXPECT_EQ(refused.error.kind, UploadErrorKind::Duplicate);
    EXPECT_EQ(endpoint.publishedCount("b-1"), 1);
    EXPECT_EQ(endpoint.totalPublished(), 2);
    EXPECT_EQ(dispatcher.submissions(), 2u);
}

TEST(UploadDispatcherTest, FailedWaitReleasesItem) {
    FakeEndpoint endpoint;
    UploadDispatcher dispatcher(endpoint, rateConfig(1, Millis(200)));
    ASSERT_TRUE(dispatcher.upload("b-1", mediaFor("b-1"), metadataFor("1"), ActionContext{}));

    UploadResult early = dispatcher.upload("b-2", mediaFor("b-2"), metadataFor("2"),
                                           ActionContext::withTimeout(Millis(20)));
    EXPECT_EQ(early.error.kind, UploadErrorKind::Timeout);

    UploadResult later = dispatcher.upload("b-2", mediaFor("b-2"), metadataFor("2"),
                                           ActionContext::withTimeout(Millis(5000)));
    ASSERT_TRUE(later) << later.error.message;
    EXPECT_EQ(endpoint.publishedCount("b-2"), 1);
}

TEST(UploadDispatcherTest, EndpointExceptionIsTransient) {
    ThrowingEndpoint endpoint;
    UploadDispatcher dispatcher(endpoint, rateConfig(10, Millis(1000)));

    UploadResult result = dispatcher.upload("b-1", mediaFor("b-1"), metadataFor("1"), ActionContext{});
    EXPECT_EQ(result.error.kind, UploadErrorKind::Transient);
    EXPECT_TRUE(result.error.retryable);
    EXPECT_NE(result.error.message.find("connection reset"), std::string::npos);
    EXPECT_FALSE(dispatcher.receiptFor("b-1").has_value());
}

// -----------------------------------------------------------------------------
// Uploader command protocol
// -----------------------------------------------------------------------------
TEST(CommandPublishEndpointTest, ParsesSuccess) {
    UploadResult result = CommandPublishEndpoint::parseResponse(
        "uploading...\n{\"remote_id\": \"abc123\", \"url\": \"https://youtu.be/abc123\"}\n", 0);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.receipt.remoteId, "abc123");
    EXPECT_EQ(result.receipt.publishedUrl, "https://youtu.be/abc123");
}

TEST(CommandPublishEndpointTest, ParsesQuotaWithRetryAfter) {
    UploadResult result = CommandPublishEndpoint::parseResponse(
        "{\"error\": {\"kind\": \"quota_exceeded\", \"message\": \"daily quota\", \"retry_after\": 30}}", 1);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, UploadErrorKind::QuotaExceeded);
    EXPECT_TRUE(result.error.retryable);
    EXPECT_EQ(result.error.retryAfter, Millis(30000));
    EXPECT_EQ(result.error.message, "daily quota");
}

TEST(CommandPublishEndpointTest, ParsesFatalKinds) {
    UploadResult auth = CommandPublishEndpoint::parseResponse("{\"error\": {\"kind\": \"auth_invalid\"}}", 1);
    EXPECT_EQ(auth.error.kind, UploadErrorKind::AuthInvalid);
    EXPECT_FALSE(auth.error.retryable);

    UploadResult rejected = CommandPublishEndpoint::parseResponse(
        "{\"error\": {\"kind\": \"content_rejected\", \"message\": \"policy\"}}", 1);
    EXPECT_EQ(rejected.error.kind, UploadErrorKind::ContentRejected);
    EXPECT_FALSE(rejected.error.retryable);
}

TEST(CommandPublishEndpointTest, UnknownOrMissingResponseIsTransient) {
    EXPECT_EQ(CommandPublishEndpoint::parseResponse("{\"error\": {\"kind\": \"gremlins\"}}", 1).error.kind,
              UploadErrorKind::Transient);
    EXPECT_EQ(CommandPublishEndpoint::parseResponse("Traceback (most recent call last)", 1).error.kind,
              UploadErrorKind::Transient);
    EXPECT_EQ(CommandPublishEndpoint::parseResponse("{\"url\": \"x\"}", 0).error.kind,
              UploadErrorKind::Transient);
    EXPECT_EQ(CommandPublishEndpoint::parseResponse("{\"remote_id\": \"x\"}", 2).error.kind,
              UploadErrorKind::Transient);
}

TEST(CommandPublishEndpointTest, BuildsUploaderArguments) {
    UploadConfig config;
    config.command = "my-uploader";
    CommandPublishEndpoint endpoint(config);

    auto argv = endpoint.buildCommand(mediaFor("b-1"), metadataFor("cats"));
    std::vector<std::string> expected = {
        "my-uploader", "--file", "/tmp/media/b-1.mp4", "--title", "About cats",
        "--description", "line", "--tag", "shorts",
    };
    EXPECT_EQ(argv, expected);
}

TEST(UploadErrorKindTest, NamesRoundTrip) {
    UploadErrorKind kind = UploadErrorKind::Transient;
    ASSERT_TRUE(parseUploadErrorKind("content_rejected", kind));
    EXPECT_EQ(kind, UploadErrorKind::ContentRejected);
    EXPECT_FALSE(parseUploadErrorKind("nope", kind));
    EXPECT_FALSE(isRetryable(UploadErrorKind::Duplicate));
    EXPECT_TRUE(isRetryable(UploadErrorKind::QuotaExceeded));
}

}
}
