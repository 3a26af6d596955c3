// SPDX-License-Identifier: MIT

// src/progress_tracking.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>

#include "lib/stream/delegating_subscriber.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/flow.hpp"
#include "src/byte_stream.hpp"
#include "src/transfer_monitor.hpp"

namespace xfer_pipe {

// ProgressTrackingSubscriber - identity transform that counts bytes.
//
// Every chunk is tallied on the monitor (and listeners notified) before it is
// forwarded unchanged. A stream failure fails the monitor. Success is only
// known once the engine reports its outcome, so completion and cancellation
// leave the terminal notification to the front end.
class ProgressTrackingSubscriber
    : public DelegatingSubscriber<ProgressTrackingSubscriber, ByteChunk, ByteChunk>,
      public std::enable_shared_from_this<ProgressTrackingSubscriber> {
public:
    static std::shared_ptr<ProgressTrackingSubscriber> Create(
        std::shared_ptr<Subscriber<ByteChunk>> downstream,
        std::shared_ptr<TransferMonitor> monitor) {
        struct MakeSharedEnabler : public ProgressTrackingSubscriber {
            MakeSharedEnabler(std::shared_ptr<Subscriber<ByteChunk>> ds,
                              std::shared_ptr<TransferMonitor> m)
                : ProgressTrackingSubscriber(std::move(ds), std::move(m)) {}
        };
        return std::make_shared<MakeSharedEnabler>(std::move(downstream), std::move(monitor));
    }

    std::expected<std::optional<ByteChunk>, Error> OnItem(ByteChunk chunk) {
        monitor_->AddBytes(chunk.size());
        return std::optional<ByteChunk>{std::move(chunk)};
    }

    void AfterError(const Error& e) { monitor_->Fail(e); }

protected:
    ProgressTrackingSubscriber(std::shared_ptr<Subscriber<ByteChunk>> downstream,
                               std::shared_ptr<TransferMonitor> monitor)
        : DelegatingSubscriber(std::move(downstream)), monitor_(std::move(monitor)) {}

private:
    std::shared_ptr<TransferMonitor> monitor_;
};

// ProgressTrackingSource - instrumented upload body.
//
// Wraps a ByteSource; each subscriber is wrapped in a
// ProgressTrackingSubscriber. ContentLength() is passed through, and the
// front end seeds the monitor's total from it.
class ProgressTrackingSource : public ByteSource {
public:
    ProgressTrackingSource(std::shared_ptr<ByteSource> inner, std::shared_ptr<TransferMonitor> monitor)
        : inner_(std::move(inner)), monitor_(std::move(monitor)) {}

    void Subscribe(std::shared_ptr<Subscriber<ByteChunk>> subscriber) override {
        if (!subscriber) return;
        inner_->Subscribe(ProgressTrackingSubscriber::Create(std::move(subscriber), monitor_));
    }

    std::optional<uint64_t> ContentLength() const override { return inner_->ContentLength(); }

private:
    std::shared_ptr<ByteSource> inner_;
    std::shared_ptr<TransferMonitor> monitor_;
};

// ProgressTrackingSink - instrumented download destination.
//
// Takes the total size from the response's content length, tallies every
// chunk, then forwards everything unchanged to the wrapped sink. As with the
// source, only a stream failure resolves the monitor here.
class ProgressTrackingSink
    : public DelegatingSubscriber<ProgressTrackingSink, ByteChunk, ByteChunk, ByteSink>,
      public std::enable_shared_from_this<ProgressTrackingSink> {
public:
    static std::shared_ptr<ProgressTrackingSink> Create(std::shared_ptr<ByteSink> inner,
                                                        std::shared_ptr<TransferMonitor> monitor) {
        struct MakeSharedEnabler : public ProgressTrackingSink {
            MakeSharedEnabler(std::shared_ptr<ByteSink> i, std::shared_ptr<TransferMonitor> m)
                : ProgressTrackingSink(std::move(i), std::move(m)) {}
        };
        return std::make_shared<MakeSharedEnabler>(std::move(inner), std::move(monitor));
    }

    void OnResponse(const ResponseMetadata& metadata) override {
        if (metadata.content_length) {
            monitor_->SetTotalBytes(*metadata.content_length);
        }
        if (inner_) inner_->OnResponse(metadata);
    }

    std::expected<std::optional<ByteChunk>, Error> OnItem(ByteChunk chunk) {
        monitor_->AddBytes(chunk.size());
        return std::optional<ByteChunk>{std::move(chunk)};
    }

    void AfterComplete() { inner_.reset(); }

    void AfterError(const Error& e) {
        inner_.reset();
        monitor_->Fail(e);
    }

protected:
    ProgressTrackingSink(std::shared_ptr<ByteSink> inner, std::shared_ptr<TransferMonitor> monitor)
        : DelegatingSubscriber(inner), inner_(std::move(inner)), monitor_(std::move(monitor)) {}

private:
    std::shared_ptr<ByteSink> inner_;
    std::shared_ptr<TransferMonitor> monitor_;
};

}  // namespace xfer_pipe
