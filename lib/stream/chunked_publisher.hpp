// SPDX-License-Identifier: MIT

// lib/stream/chunked_publisher.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/flow.hpp"

namespace xfer_pipe {

// ChunkedPublisher - single-subscriber producer over an in-memory sequence.
//
// Emits items strictly within granted demand. Emission is serialized by a
// work-in-progress counter, so Request() may be called re-entrantly from
// OnNext() or concurrently from another thread without recursion or
// overlapping signals. After the last item it signals either OnComplete or,
// if constructed with a terminal error, OnError.
template<typename T>
class ChunkedPublisher : public Publisher<T> {
public:
    explicit ChunkedPublisher(std::vector<T> items,
                              std::optional<Error> terminal_error = std::nullopt)
        : items_(std::move(items)), terminal_error_(std::move(terminal_error)) {}

    void Subscribe(std::shared_ptr<Subscriber<T>> subscriber) override {
        if (!subscriber) return;
        if (!once_.TryClaim()) {
            RejectSubscriber(*subscriber, Error{ErrorCode::AlreadySubscribed,
                "ChunkedPublisher supports a single subscriber"});
            return;
        }
        auto emitter = std::make_shared<Emitter>(std::move(items_), std::move(terminal_error_),
                                                 subscriber);
        subscriber->OnSubscribe(emitter);
        emitter->Drain();
    }

private:
    class Emitter final : public Subscription {
    public:
        Emitter(std::vector<T> items, std::optional<Error> terminal_error,
                std::shared_ptr<Subscriber<T>> subscriber)
            : items_(std::move(items)),
              terminal_error_(std::move(terminal_error)),
              subscriber_(std::move(subscriber)) {}

        void Request(uint64_t n) override {
            if (n == 0) {
                invalid_demand_.store(true, std::memory_order_release);
            } else {
                demand_.Add(n);
            }
            Drain();
        }

        void Cancel() override {
            cancelled_.store(true, std::memory_order_release);
            Drain();
        }

        void Drain() {
            if (wip_.fetch_add(1, std::memory_order_acq_rel) != 0) return;
            int missed = 1;
            for (;;) {
                DrainOnce();
                missed = wip_.fetch_sub(missed, std::memory_order_acq_rel) - missed;
                if (missed == 0) break;
            }
        }

    private:
        void DrainOnce() {
            if (!subscriber_) return;
            if (cancelled_.load(std::memory_order_acquire)) {
                subscriber_.reset();
                return;
            }
            if (invalid_demand_.load(std::memory_order_acquire)) {
                auto s = std::move(subscriber_);
                s->OnError(Error{ErrorCode::InvalidDemand, "Request(0) is not allowed"});
                return;
            }
            while (next_ < items_.size()) {
                if (cancelled_.load(std::memory_order_acquire)) {
                    subscriber_.reset();
                    return;
                }
                if (!demand_.TryTake()) return;
                subscriber_->OnNext(std::move(items_[next_++]));
            }
            auto s = std::move(subscriber_);
            if (terminal_error_) {
                s->OnError(*terminal_error_);
            } else {
                s->OnComplete();
            }
        }

        std::vector<T> items_;
        std::size_t next_ = 0;
        std::optional<Error> terminal_error_;
        std::shared_ptr<Subscriber<T>> subscriber_;  // Released on terminal or cancel

        DemandCounter demand_;
        std::atomic<int> wip_{0};
        std::atomic<bool> cancelled_{false};
        std::atomic<bool> invalid_demand_{false};
    };

    std::vector<T> items_;
    std::optional<Error> terminal_error_;
    SubscribeOnce once_;
};

}  // namespace xfer_pipe
