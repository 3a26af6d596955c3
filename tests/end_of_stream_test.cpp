// SPDX-License-Identifier: MIT

// tests/end_of_stream_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>

#include "lib/stream/chunked_publisher.hpp"
#include "src/end_of_stream.hpp"
#include "tests/test_subscriber.hpp"

using namespace xfer_pipe;
using xfer_pipe::test_support::ManualSubscription;
using xfer_pipe::test_support::RecordingByteSink;

TEST(EndOfStreamTest, FutureResolvesOnCompletion) {
    auto inner = std::make_shared<RecordingByteSink>();
    auto [sink, done] = WrapWithEndOfStreamFuture(inner);

    EXPECT_EQ(done.wait_for(std::chrono::seconds(0)), std::future_status::timeout);

    ChunkedPublisher<ByteChunk> body({ToChunk("part1"), ToChunk("part2")});
    body.Subscribe(sink);

    ASSERT_EQ(done.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    auto result = done.get();
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(inner->Body(), "part1part2");
    EXPECT_EQ(inner->complete_count, 1);
}

TEST(EndOfStreamTest, FutureCarriesStreamError) {
    auto inner = std::make_shared<RecordingByteSink>();
    auto [sink, done] = WrapWithEndOfStreamFuture(inner);

    ChunkedPublisher<ByteChunk> body({ToChunk("x")}, Error{ErrorCode::UpstreamFailed, "peer reset"});
    body.Subscribe(sink);

    auto result = done.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::UpstreamFailed);
    EXPECT_EQ(inner->errors.size(), 1u);
}

TEST(EndOfStreamTest, CancelResolvesWithCancelled) {
    auto inner = std::make_shared<RecordingByteSink>(1);
    auto [sink, done] = WrapWithEndOfStreamFuture(inner);

    auto upstream = std::make_shared<ManualSubscription>();
    sink->OnSubscribe(upstream);
    inner->Cancel();

    auto result = done.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(upstream->cancel_count, 1);
}

TEST(EndOfStreamTest, ResponseMetadataIsForwarded) {
    auto inner = std::make_shared<RecordingByteSink>();
    auto [sink, done] = WrapWithEndOfStreamFuture(inner);

    sink->OnResponse(ResponseMetadata{.content_length = 3, .etag = "\"abc\""});

    ASSERT_EQ(inner->responses.size(), 1u);
    EXPECT_EQ(inner->responses[0].content_length, 3u);
}

TEST(EndOfStreamTest, CallbackFiresOnlyOnce) {
    int calls = 0;
    auto inner = std::make_shared<RecordingByteSink>();
    auto sink = EndOfStreamSink::Create(inner, [&](StreamResult) { ++calls; });

    auto upstream = std::make_shared<ManualSubscription>();
    sink->OnSubscribe(upstream);
    sink->OnComplete();
    sink->Cancel();
    sink->OnError(Error{ErrorCode::UpstreamFailed, "late"});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(inner->TerminalCount(), 1);
}
