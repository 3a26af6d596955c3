// SPDX-License-Identifier: MIT

// tests/delegating_subscriber_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <expected>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "lib/stream/chunked_publisher.hpp"
#include "lib/stream/delegating_subscriber.hpp"
#include "lib/stream/error.hpp"
#include "tests/test_subscriber.hpp"

using namespace xfer_pipe;
using xfer_pipe::test_support::ManualSubscription;
using xfer_pipe::test_support::RecordingSubscriber;

namespace {

using Pair = std::vector<int>;

// Groups ints into pairs; a leftover single is flushed on completion.
// Negative input is rejected.
class Pairer : public DelegatingSubscriber<Pairer, int, Pair>,
               public std::enable_shared_from_this<Pairer> {
public:
    static std::shared_ptr<Pairer> Create(std::shared_ptr<Subscriber<Pair>> downstream) {
        struct MakeSharedEnabler : public Pairer {
            explicit MakeSharedEnabler(std::shared_ptr<Subscriber<Pair>> ds)
                : Pairer(std::move(ds)) {}
        };
        return std::make_shared<MakeSharedEnabler>(std::move(downstream));
    }

    std::expected<std::optional<Pair>, Error> OnItem(int value) {
        if (value < 0) {
            return std::unexpected(Error{ErrorCode::InvalidArgument, "negative"});
        }
        if (!half_) {
            half_ = value;
            return std::optional<Pair>{};
        }
        Pair pair{*half_, value};
        half_.reset();
        return std::optional<Pair>{std::move(pair)};
    }

    std::optional<Pair> TakePending() {
        if (!half_) return std::nullopt;
        Pair last{*half_};
        half_.reset();
        return last;
    }

    void DiscardPending() { half_.reset(); }

    void AfterComplete() { ++after_complete; }
    void AfterError(const Error&) { ++after_error; }
    void AfterCancel() { ++after_cancel; }

    bool HasPending() const { return half_.has_value(); }

    int after_complete = 0;
    int after_error = 0;
    int after_cancel = 0;

protected:
    explicit Pairer(std::shared_ptr<Subscriber<Pair>> downstream)
        : DelegatingSubscriber(std::move(downstream)) {}

private:
    std::optional<int> half_;
};

struct Harness {
    explicit Harness(uint64_t initial_request = 0)
        : upstream(std::make_shared<ManualSubscription>()),
          downstream(std::make_shared<RecordingSubscriber<Pair>>(initial_request)),
          pairer(Pairer::Create(downstream)) {
        pairer->OnSubscribe(upstream);
    }

    std::shared_ptr<ManualSubscription> upstream;
    std::shared_ptr<RecordingSubscriber<Pair>> downstream;
    std::shared_ptr<Pairer> pairer;
};

}  // namespace

TEST(DelegatingSubscriberTest, HandsItselfDownstreamAsSubscription) {
    Harness h;
    EXPECT_EQ(h.downstream->subscribe_count, 1);
    EXPECT_EQ(h.downstream->subscription.get(), static_cast<Subscription*>(h.pairer.get()));
}

TEST(DelegatingSubscriberTest, ForwardsRequestUpstream) {
    Harness h;
    h.downstream->Request(3);
    EXPECT_EQ(h.upstream->requests, std::vector<uint64_t>{3});
    EXPECT_EQ(h.pairer->OutstandingDemand(), 3u);
}

TEST(DelegatingSubscriberTest, ItemWithoutOutputRequestsReplacement) {
    Harness h(1);
    h.pairer->OnNext(1);

    EXPECT_TRUE(h.downstream->items.empty());
    EXPECT_EQ(h.upstream->requests, (std::vector<uint64_t>{1, 1}));

    h.pairer->OnNext(2);
    ASSERT_EQ(h.downstream->items.size(), 1u);
    EXPECT_EQ(h.downstream->items[0], (Pair{1, 2}));
    EXPECT_EQ(h.upstream->requests.size(), 2u);
    EXPECT_EQ(h.pairer->OutstandingDemand(), 0u);
}

TEST(DelegatingSubscriberTest, CompletionFlushesPendingThenCompletes) {
    Harness h(kUnboundedDemand);
    h.pairer->OnNext(7);
    h.pairer->OnComplete();

    ASSERT_EQ(h.downstream->items.size(), 1u);
    EXPECT_EQ(h.downstream->items[0], Pair{7});
    EXPECT_EQ(h.downstream->complete_count, 1);
    EXPECT_EQ(h.pairer->after_complete, 1);
}

TEST(DelegatingSubscriberTest, CompletionWithoutPendingCompletesDirectly) {
    Harness h;
    h.pairer->OnComplete();

    EXPECT_TRUE(h.downstream->items.empty());
    EXPECT_EQ(h.downstream->complete_count, 1);
    EXPECT_TRUE(h.pairer->IsFinalized());
}

TEST(DelegatingSubscriberTest, FlushWaitsForDemand) {
    Harness h(1);
    h.pairer->OnNext(1);
    h.pairer->OnNext(2);
    h.pairer->OnNext(3);  // No demand left; 3 stays pending
    h.pairer->OnComplete();

    EXPECT_TRUE(h.pairer->IsCompletionDeferred());
    EXPECT_EQ(h.downstream->items.size(), 1u);
    EXPECT_EQ(h.downstream->complete_count, 0);

    h.downstream->Request(1);

    EXPECT_FALSE(h.pairer->IsCompletionDeferred());
    ASSERT_EQ(h.downstream->items.size(), 2u);
    EXPECT_EQ(h.downstream->items[1], Pair{3});
    EXPECT_EQ(h.downstream->complete_count, 1);

    // A later request does not flush twice
    h.downstream->Request(1);
    EXPECT_EQ(h.downstream->items.size(), 2u);
    EXPECT_EQ(h.downstream->complete_count, 1);
}

TEST(DelegatingSubscriberTest, CancelDropsDeferredFlush) {
    Harness h(1);
    h.pairer->OnNext(1);
    h.pairer->OnNext(2);
    h.pairer->OnNext(3);
    h.pairer->OnComplete();
    ASSERT_TRUE(h.pairer->IsCompletionDeferred());

    h.downstream->Cancel();
    h.downstream->Request(1);

    EXPECT_EQ(h.downstream->items.size(), 1u);
    EXPECT_EQ(h.downstream->TerminalCount(), 0);
}

TEST(DelegatingSubscriberTest, UpstreamErrorDiscardsPending) {
    Harness h(kUnboundedDemand);
    h.pairer->OnNext(5);
    h.pairer->OnError(Error{ErrorCode::UpstreamFailed, "boom"});

    EXPECT_TRUE(h.downstream->items.empty());
    ASSERT_EQ(h.downstream->errors.size(), 1u);
    EXPECT_EQ(h.downstream->errors[0].code, ErrorCode::UpstreamFailed);
    EXPECT_EQ(h.downstream->complete_count, 0);
    EXPECT_FALSE(h.pairer->HasPending());
    EXPECT_EQ(h.pairer->after_error, 1);
}

TEST(DelegatingSubscriberTest, CancelStopsSignalsAndDiscardsPending) {
    Harness h(kUnboundedDemand);
    h.pairer->OnNext(1);

    h.downstream->Cancel();
    EXPECT_EQ(h.upstream->cancel_count, 1);
    EXPECT_EQ(h.pairer->after_cancel, 1);

    h.pairer->OnNext(2);
    h.pairer->OnComplete();

    EXPECT_TRUE(h.downstream->items.empty());
    EXPECT_EQ(h.downstream->TerminalCount(), 0);
    EXPECT_FALSE(h.pairer->HasPending());
}

TEST(DelegatingSubscriberTest, CancelIsIdempotent) {
    Harness h;
    h.downstream->Cancel();
    h.downstream->Cancel();
    EXPECT_EQ(h.upstream->cancel_count, 1);
    EXPECT_EQ(h.pairer->after_cancel, 1);
}

TEST(DelegatingSubscriberTest, TransformErrorCancelsUpstreamAndFailsDownstream) {
    Harness h(kUnboundedDemand);
    h.pairer->OnNext(1);
    h.pairer->OnNext(-1);

    EXPECT_EQ(h.upstream->cancel_count, 1);
    ASSERT_EQ(h.downstream->errors.size(), 1u);
    EXPECT_EQ(h.downstream->errors[0].code, ErrorCode::InvalidArgument);

    // Items already in flight upstream are dropped
    h.pairer->OnNext(2);
    h.pairer->OnNext(3);
    h.pairer->OnComplete();
    EXPECT_TRUE(h.downstream->items.empty());
    EXPECT_EQ(h.downstream->TerminalCount(), 1);
}

TEST(DelegatingSubscriberTest, SignalsAfterTerminalAreDropped) {
    Harness h(kUnboundedDemand);
    h.pairer->OnComplete();
    h.pairer->OnNext(1);
    h.pairer->OnNext(2);
    h.pairer->OnError(Error{ErrorCode::UpstreamFailed, "late"});

    EXPECT_TRUE(h.downstream->items.empty());
    EXPECT_EQ(h.downstream->complete_count, 1);
    EXPECT_TRUE(h.downstream->errors.empty());
}

TEST(DelegatingSubscriberTest, EmissionPastDemandFailsWithInvalidDemand) {
    Harness h;
    // Misbehaving upstream: delivers without any request
    h.pairer->OnNext(1);
    h.pairer->OnNext(2);

    EXPECT_TRUE(h.downstream->items.empty());
    ASSERT_EQ(h.downstream->errors.size(), 1u);
    EXPECT_EQ(h.downstream->errors[0].code, ErrorCode::InvalidDemand);
    EXPECT_EQ(h.upstream->cancel_count, 1);
}

TEST(DelegatingSubscriberTest, ZeroRequestIsForwardedUpstream) {
    Harness h;
    h.downstream->Request(0);
    EXPECT_EQ(h.upstream->requests, std::vector<uint64_t>{0});
    EXPECT_EQ(h.pairer->OutstandingDemand(), 0u);
}

TEST(DelegatingSubscriberTest, SecondUpstreamIsCancelled) {
    Harness h;
    auto other = std::make_shared<ManualSubscription>();
    h.pairer->OnSubscribe(other);

    EXPECT_EQ(other->cancel_count, 1);
    EXPECT_EQ(h.upstream->cancel_count, 0);
    EXPECT_EQ(h.downstream->subscribe_count, 1);
}

TEST(TransformPublisherTest, StacksOverPublisher) {
    auto source = std::make_shared<ChunkedPublisher<int>>(std::vector<int>{1, 2, 3, 4, 5});
    auto pairs = std::make_shared<TransformPublisher<int, Pair>>(
        source, [](std::shared_ptr<Subscriber<Pair>> downstream) {
            return Pairer::Create(std::move(downstream));
        });
    auto subscriber = std::make_shared<RecordingSubscriber<Pair>>();
    pairs->Subscribe(subscriber);

    ASSERT_EQ(subscriber->items.size(), 3u);
    EXPECT_EQ(subscriber->items[0], (Pair{1, 2}));
    EXPECT_EQ(subscriber->items[1], (Pair{3, 4}));
    EXPECT_EQ(subscriber->items[2], Pair{5});
    EXPECT_EQ(subscriber->complete_count, 1);
}

TEST(TransformPublisherTest, OneRequestAtATimeHonoursDemand) {
    auto source = std::make_shared<ChunkedPublisher<int>>(std::vector<int>{1, 2, 3, 4, 5});
    auto pairs = std::make_shared<TransformPublisher<int, Pair>>(
        source, [](std::shared_ptr<Subscriber<Pair>> downstream) {
            return Pairer::Create(std::move(downstream));
        });
    auto subscriber = std::make_shared<RecordingSubscriber<Pair>>(1);
    subscriber->on_next = [](RecordingSubscriber<Pair>& self) { self.Request(1); };
    pairs->Subscribe(subscriber);

    ASSERT_EQ(subscriber->items.size(), 3u);
    EXPECT_EQ(subscriber->items[2], Pair{5});
    EXPECT_EQ(subscriber->complete_count, 1);
    EXPECT_TRUE(subscriber->errors.empty());
}

TEST(DelegatingSubscriberConcurrencyTest, RequestRacingCompletionFlushesExactlyOnce) {
    constexpr int kIterations = 2000;
    for (int i = 0; i < kIterations; ++i) {
        Harness h(0);
        h.pairer->OnNext(i);

        std::atomic<bool> go{false};
        std::thread requester([&] {
            while (!go.load()) {}
            h.pairer->Request(1);
        });
        std::thread completer([&] {
            while (!go.load()) {}
            h.pairer->OnComplete();
        });
        go.store(true);
        requester.join();
        completer.join();

        ASSERT_EQ(h.downstream->items.size(), 1u) << "iteration " << i;
        EXPECT_EQ(h.downstream->items[0], (Pair{i}));
        EXPECT_EQ(h.downstream->complete_count, 1);
        EXPECT_TRUE(h.downstream->errors.empty());
        EXPECT_EQ(h.pairer->after_complete, 1);
        EXPECT_FALSE(h.pairer->IsCompletionDeferred());
    }
}

TEST(DelegatingSubscriberConcurrencyTest, CancelRacingDeferredFlushNeverFlushesAfterwards) {
    constexpr int kIterations = 2000;
    for (int i = 0; i < kIterations; ++i) {
        Harness h(0);
        h.pairer->OnNext(i);
        h.pairer->OnComplete();
        ASSERT_TRUE(h.pairer->IsCompletionDeferred());

        std::atomic<bool> go{false};
        std::thread requester([&] {
            while (!go.load()) {}
            h.pairer->Request(1);
        });
        std::thread canceller([&] {
            while (!go.load()) {}
            h.pairer->Cancel();
        });
        go.store(true);
        requester.join();
        canceller.join();

        // Either the flush won the race or the cancel dropped it; never both
        // a dropped flush and a completion, and never more than one of each
        auto delivered = h.downstream->items.size();
        EXPECT_LE(delivered, 1u) << "iteration " << i;
        EXPECT_LE(h.downstream->complete_count, static_cast<int>(delivered));
        EXPECT_TRUE(h.downstream->errors.empty());
        EXPECT_FALSE(h.pairer->IsCompletionDeferred());
        EXPECT_EQ(h.upstream->cancel_count, 1);

        // Once cancelled, further demand releases nothing
        h.pairer->Request(1);
        EXPECT_EQ(h.downstream->items.size(), delivered);
        EXPECT_LE(h.downstream->complete_count, 1);
    }
}
