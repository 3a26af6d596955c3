// SPDX-License-Identifier: MIT

// lib/stream/generator_publisher.hpp
#pragma once

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/flow.hpp"

namespace xfer_pipe {

// GeneratorPublisher - producer that pulls items from a generator on demand.
//
// The generator returns the next item, an empty optional at end of stream, or
// an error. It runs at most one item ahead of demand, so a source is never
// read much faster than the consumer asks. Completion does not wait for
// demand.
//
// Each Subscribe() obtains a fresh generator from the factory, so the
// publisher can be subscribed more than once. A factory error rejects that
// subscriber. Emission uses the same work-in-progress drain as
// ChunkedPublisher.
template<typename T>
class GeneratorPublisher : public Publisher<T> {
public:
    using Generator = std::function<std::expected<std::optional<T>, Error>()>;
    using GeneratorFactory = std::function<std::expected<Generator, Error>()>;

    explicit GeneratorPublisher(GeneratorFactory factory) : factory_(std::move(factory)) {}

    void Subscribe(std::shared_ptr<Subscriber<T>> subscriber) override {
        if (!subscriber) return;
        auto generator = factory_();
        if (!generator) {
            RejectSubscriber(*subscriber, generator.error());
            return;
        }
        auto emitter = std::make_shared<Emitter>(std::move(*generator), subscriber);
        subscriber->OnSubscribe(emitter);
        emitter->Drain();
    }

private:
    class Emitter final : public Subscription {
    public:
        Emitter(Generator generator, std::shared_ptr<Subscriber<T>> subscriber)
            : generator_(std::move(generator)), subscriber_(std::move(subscriber)) {}

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
            while (subscriber_) {
                if (cancelled_.load(std::memory_order_acquire)) {
                    Release();
                    return;
                }
                if (invalid_demand_.load(std::memory_order_acquire)) {
                    Release()->OnError(Error{ErrorCode::InvalidDemand, "Request(0) is not allowed"});
                    return;
                }
                if (!staged_) {
                    auto next = generator_();
                    if (!next) {
                        Release()->OnError(next.error());
                        return;
                    }
                    if (!next->has_value()) {
                        Release()->OnComplete();
                        return;
                    }
                    staged_ = std::move(**next);
                }
                if (!demand_.TryTake()) return;

                T item = std::move(*staged_);
                staged_.reset();
                subscriber_->OnNext(std::move(item));
            }
        }

        // Drop the generator (closing whatever it holds) and hand back the subscriber
        std::shared_ptr<Subscriber<T>> Release() {
            generator_ = nullptr;
            staged_.reset();
            return std::move(subscriber_);
        }

        Generator generator_;
        std::optional<T> staged_;                     // Pulled but not yet delivered
        std::shared_ptr<Subscriber<T>> subscriber_;   // Released on terminal or cancel

        DemandCounter demand_;
        std::atomic<int> wip_{0};
        std::atomic<bool> cancelled_{false};
        std::atomic<bool> invalid_demand_{false};
    };

    GeneratorFactory factory_;
};

}  // namespace xfer_pipe
