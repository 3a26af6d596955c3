// SPDX-License-Identifier: MIT

// lib/stream/delegating_subscriber.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <cstdio>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "lib/stream/flow.hpp"

namespace xfer_pipe {

// CRTP base for transforms inserted between an upstream producer and a
// downstream subscriber.
//
// Acts as Subscriber<In> toward upstream and as the Subscription handed to
// downstream, so Request()/Cancel() pass straight through to the upstream
// subscription.
//
// Demand accounting: every upstream item yields at most one downstream item.
// An item that yields nothing is replaced by Request(1) upstream, so upstream
// items in flight always equal outstanding downstream demand.
//
// Terminal handling:
// - OnComplete flushes pending state as one final item, then completes. If
//   downstream has no demand left for the flush, completion is deferred until
//   the next Request().
// - OnError discards pending state and forwards immediately.
// - Exactly one of OnComplete/OnError reaches downstream.
// - After Cancel() nothing reaches downstream and pending state is discarded.
//
// Derived classes must implement:
// - std::expected<std::optional<Out>, Error> OnItem(In&&)
//     value with item  -> emit it
//     empty optional   -> nothing yet, request a replacement
//     error            -> cancel upstream, fail downstream
// Derived classes may implement:
// - std::optional<Out> TakePending()   - final flush on completion
// - void DiscardPending()              - drop buffered state
// - void AfterComplete() / AfterError(const Error&) / AfterCancel()
//
// Pending state is owned by the upstream delivery thread. OnItem, TakePending
// and DiscardPending only run on that thread.
template<typename Derived, typename In, typename Out, typename Interface = Subscriber<In>>
    requires std::derived_from<Interface, Subscriber<In>>
class DelegatingSubscriber : public Interface, public Subscription {
public:
    explicit DelegatingSubscriber(std::shared_ptr<Subscriber<Out>> downstream)
        : downstream_(std::move(downstream)) {}

    // =========================================================================
    // Subscriber<In> (upstream -> this)
    // =========================================================================

    void OnSubscribe(std::shared_ptr<Subscription> upstream) override {
        if (!upstream) return;
        if (upstream_) {
            // Only one upstream per transform
            upstream->Cancel();
            return;
        }
        upstream_ = std::move(upstream);
        auto self = static_cast<Derived*>(this)->shared_from_this();
        downstream_->OnSubscribe(std::move(self));
    }

    void OnNext(In item) override {
        if (ShouldDrop("OnNext")) return;
        auto& self = static_cast<Derived&>(*this);

        auto result = self.OnItem(std::move(item));
        if (!result) {
            FailFromTransform(result.error());
            return;
        }
        if (!result->has_value()) {
            upstream_->Request(1);
            return;
        }
        Emit(std::move(**result));
    }

    void OnError(const Error& e) override {
        if (ShouldDrop("OnError")) return;
        upstream_done_ = true;
        static_cast<Derived&>(*this).DiscardPending();
        EmitError(e);
    }

    void OnComplete() override {
        if (ShouldDrop("OnComplete")) return;
        upstream_done_ = true;

        auto pending = static_cast<Derived&>(*this).TakePending();
        if (!pending) {
            EmitDone();
            return;
        }
        pending_flush_ = std::move(pending);
        done_pending_.store(true);
        CompleteDeferred();
    }

    // =========================================================================
    // Subscription (downstream -> this)
    // =========================================================================

    void Request(uint64_t n) override {
        if (n == 0) {
            // Upstream owns demand validation and fails the stream through us
            upstream_->Request(0);
            return;
        }
        demand_.Add(n);
        upstream_->Request(n);
        CompleteDeferred();
    }

    void Cancel() override {
        if (cancelled_.exchange(true)) return;
        if (done_pending_.exchange(false)) {
            pending_flush_.reset();
        }
        upstream_->Cancel();
        if (!finalized_.load()) {
            static_cast<Derived&>(*this).AfterCancel();
        }
    }

    // =========================================================================
    // State queries
    // =========================================================================

    bool IsCancelled() const { return cancelled_.load(); }
    bool IsFinalized() const { return finalized_.load(); }
    bool IsCompletionDeferred() const { return done_pending_.load(); }
    uint64_t OutstandingDemand() const { return demand_.Outstanding(); }

    // Default hooks, hidden by Derived where needed
    std::optional<Out> TakePending() { return std::nullopt; }
    void DiscardPending() {}
    void AfterComplete() {}
    void AfterError(const Error&) {}
    void AfterCancel() {}

private:
    // Returns true if the signal must not reach downstream.
    bool ShouldDrop(const char* signal) {
        if (cancelled_.load()) {
            static_cast<Derived&>(*this).DiscardPending();
            return true;
        }
        if (upstream_done_) {
            fmt::print(stderr, "DelegatingSubscriber: {} after terminal signal, dropped\n", signal);
            return true;
        }
        // Finalized by our own failure; upstream may still have items in flight
        return finalized_.load();
    }

    void Emit(Out item) {
        if (!demand_.TryTake()) {
            FailFromTransform(Error{ErrorCode::InvalidDemand,
                "Upstream delivered an item without outstanding demand"});
            return;
        }
        downstream_->OnNext(std::move(item));
        if (cancelled_.load()) {
            static_cast<Derived&>(*this).DiscardPending();
        }
    }

    void FailFromTransform(const Error& e) {
        upstream_->Cancel();
        static_cast<Derived&>(*this).DiscardPending();
        EmitError(e);
    }

    // Runs the deferred flush exactly once, on whichever thread first sees
    // both a pending completion and outstanding demand.
    void CompleteDeferred() {
        if (!done_pending_.load()) return;
        if (demand_.Outstanding() == 0) return;
        if (!done_pending_.exchange(false)) return;

        auto item = std::move(pending_flush_);
        pending_flush_.reset();
        if (cancelled_.load() || !item) return;

        demand_.TryTake();
        downstream_->OnNext(std::move(*item));
        if (cancelled_.load()) return;
        EmitDone();
    }

    void EmitDone() {
        if (finalized_.exchange(true)) return;
        auto downstream = std::move(downstream_);
        downstream->OnComplete();
        static_cast<Derived&>(*this).AfterComplete();
    }

    void EmitError(const Error& e) {
        if (finalized_.exchange(true)) return;
        auto downstream = std::move(downstream_);
        downstream->OnError(e);
        static_cast<Derived&>(*this).AfterError(e);
    }

    std::shared_ptr<Subscriber<Out>> downstream_;   // Released on terminal signal
    std::shared_ptr<Subscription> upstream_;

    DemandCounter demand_;                  // Outstanding downstream demand
    std::optional<Out> pending_flush_;      // Final item awaiting demand
    bool upstream_done_ = false;            // Delivery thread only
    std::atomic<bool> done_pending_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finalized_{false};
};

// TransformPublisher - exposes a transform as a Publisher so decorators stack.
//
// Each Subscribe() builds a fresh transform around the new subscriber and
// subscribes it upstream. Single-subscriber rules are those of the upstream.
template<typename In, typename Out>
class TransformPublisher : public Publisher<Out> {
public:
    using Factory = std::function<std::shared_ptr<Subscriber<In>>(std::shared_ptr<Subscriber<Out>>)>;

    TransformPublisher(std::shared_ptr<Publisher<In>> upstream, Factory factory)
        : upstream_(std::move(upstream)), factory_(std::move(factory)) {}

    void Subscribe(std::shared_ptr<Subscriber<Out>> subscriber) override {
        if (!subscriber) return;
        upstream_->Subscribe(factory_(std::move(subscriber)));
    }

private:
    std::shared_ptr<Publisher<In>> upstream_;
    Factory factory_;
};

}  // namespace xfer_pipe
