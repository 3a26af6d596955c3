// SPDX-License-Identifier: MIT

// lib/stream/flow.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <cstdint>
#include <limits>
#include <memory>

#include "lib/stream/error.hpp"

namespace xfer_pipe {

/// Demand value meaning "no limit". Accumulated demand saturates here.
inline constexpr uint64_t kUnboundedDemand = std::numeric_limits<uint64_t>::max();

/// Consumer-to-producer control handle for one subscription.
///
/// Request() grants credit: the producer may deliver at most the cumulative
/// requested number of items before the next Request(). Cancel() asks the
/// producer to stop; no terminal signal is required after it.
///
/// Thread safety: both methods may be called from any thread, including from
/// inside the subscriber's own OnNext().
class Subscription {
public:
    virtual ~Subscription() = default;

    /// Grant @p n more items of demand. n == 0 is a protocol violation and
    /// fails the subscription with ErrorCode::InvalidDemand.
    virtual void Request(uint64_t n) = 0;

    /// Stop delivery. Idempotent.
    virtual void Cancel() = 0;
};

/// Receiving side of a flow-controlled channel.
///
/// Signals arrive sequentially (never concurrently) for one subscription:
/// OnSubscribe, then zero or more OnNext bounded by demand, then at most one of
/// OnError / OnComplete. Nothing follows a terminal signal.
template<typename T>
class Subscriber {
public:
    using ItemType = T;

    virtual ~Subscriber() = default;

    virtual void OnSubscribe(std::shared_ptr<Subscription> subscription) = 0;
    virtual void OnNext(T item) = 0;
    virtual void OnError(const Error& e) = 0;
    virtual void OnComplete() = 0;
};

/// Producing side of a flow-controlled channel.
template<typename T>
class Publisher {
public:
    using ItemType = T;

    virtual ~Publisher() = default;

    /// Attach @p subscriber. Single-subscriber publishers reject a second call
    /// by signalling ErrorCode::AlreadySubscribed to the new subscriber.
    virtual void Subscribe(std::shared_ptr<Subscriber<T>> subscriber) = 0;
};

// Concept for anything that can sit downstream of a Publisher<T>
template<typename S, typename T>
concept SubscriberOf = std::derived_from<S, Subscriber<T>>;

// Concept for anything that can sit upstream of a Subscriber<T>
template<typename P, typename T>
concept PublisherOf = std::derived_from<P, Publisher<T>>;

/// Saturating demand counter shared between the Request() side and the
/// delivery side of a producer.
///
/// Add() and Outstanding() are sequentially consistent: a deferred completion
/// pairs them with its own seq_cst flag so that of a racing Request() and
/// OnComplete(), at least one sees the other.
class DemandCounter {
public:
    /// Add @p n, saturating at kUnboundedDemand. Returns the previous value.
    uint64_t Add(uint64_t n) noexcept {
        uint64_t current = value_.load(std::memory_order_acquire);
        for (;;) {
            uint64_t next = (n > kUnboundedDemand - current) ? kUnboundedDemand : current + n;
            if (value_.compare_exchange_weak(current, next, std::memory_order_seq_cst)) {
                return current;
            }
        }
    }

    /// Consume one unit of demand. Returns false if none is outstanding.
    /// Unbounded demand is never decremented.
    bool TryTake() noexcept {
        uint64_t current = value_.load(std::memory_order_acquire);
        for (;;) {
            if (current == 0) return false;
            if (current == kUnboundedDemand) return true;
            if (value_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel)) {
                return true;
            }
        }
    }

    uint64_t Outstanding() const noexcept { return value_.load(std::memory_order_seq_cst); }

private:
    std::atomic<uint64_t> value_{0};
};

/// Subscription handed to a rejected subscriber. Ignores all signals.
class InertSubscription final : public Subscription {
public:
    void Request(uint64_t) override {}
    void Cancel() override {}
};

/// Reject @p subscriber: hand it an inert subscription, then fail it with @p e.
template<typename T>
void RejectSubscriber(Subscriber<T>& subscriber, const Error& e) {
    subscriber.OnSubscribe(std::make_shared<InertSubscription>());
    subscriber.OnError(e);
}

/// Claim flag for single-subscriber publishers.
class SubscribeOnce {
public:
    /// Returns true for the first caller only.
    [[nodiscard]] bool TryClaim() noexcept {
        return !claimed_.exchange(true, std::memory_order_acq_rel);
    }

    bool IsClaimed() const noexcept { return claimed_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> claimed_{false};
};

}  // namespace xfer_pipe
