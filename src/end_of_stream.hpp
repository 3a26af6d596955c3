// SPDX-License-Identifier: MIT

// src/end_of_stream.hpp
#pragma once

#include <atomic>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <utility>

#include "lib/stream/delegating_subscriber.hpp"
#include "lib/stream/error.hpp"
#include "src/byte_stream.hpp"

namespace xfer_pipe {

/// Outcome of a byte stream: success or the error that ended it.
using StreamResult = std::expected<void, Error>;

// EndOfStreamSink - pass-through ByteSink that reports how its stream ended.
//
// The callback fires exactly once: on completion, on failure, or on
// cancellation (as ErrorCode::Cancelled), after the wrapped sink has seen the
// corresponding signal.
class EndOfStreamSink
    : public DelegatingSubscriber<EndOfStreamSink, ByteChunk, ByteChunk, ByteSink>,
      public std::enable_shared_from_this<EndOfStreamSink> {
public:
    using Callback = std::function<void(StreamResult)>;

    static std::shared_ptr<EndOfStreamSink> Create(std::shared_ptr<ByteSink> inner, Callback on_end) {
        struct MakeSharedEnabler : public EndOfStreamSink {
            MakeSharedEnabler(std::shared_ptr<ByteSink> i, Callback cb)
                : EndOfStreamSink(std::move(i), std::move(cb)) {}
        };
        return std::make_shared<MakeSharedEnabler>(std::move(inner), std::move(on_end));
    }

    void OnResponse(const ResponseMetadata& metadata) override {
        if (inner_) inner_->OnResponse(metadata);
    }

    std::expected<std::optional<ByteChunk>, Error> OnItem(ByteChunk chunk) {
        return std::optional<ByteChunk>{std::move(chunk)};
    }

    void AfterComplete() {
        inner_.reset();
        Finish(StreamResult{});
    }

    void AfterError(const Error& e) {
        inner_.reset();
        Finish(std::unexpected(e));
    }

    void AfterCancel() {
        Finish(std::unexpected(Error{ErrorCode::Cancelled, "Stream cancelled by consumer"}));
    }

protected:
    EndOfStreamSink(std::shared_ptr<ByteSink> inner, Callback on_end)
        : DelegatingSubscriber(inner), inner_(std::move(inner)), on_end_(std::move(on_end)) {}

private:
    void Finish(StreamResult result) {
        if (fired_.exchange(true)) return;
        if (on_end_) on_end_(std::move(result));
    }

    std::shared_ptr<ByteSink> inner_;
    Callback on_end_;
    std::atomic<bool> fired_{false};
};

/// Wrap @p sink and return it with a future resolved at end of stream.
///
/// The future tracks the body stream itself, independent of when the
/// surrounding request completes.
inline std::pair<std::shared_ptr<ByteSink>, std::future<StreamResult>>
WrapWithEndOfStreamFuture(std::shared_ptr<ByteSink> sink) {
    auto promise = std::make_shared<std::promise<StreamResult>>();
    auto future = promise->get_future();
    auto wrapped = EndOfStreamSink::Create(std::move(sink), [promise](StreamResult result) {
        promise->set_value(std::move(result));
    });
    return {std::move(wrapped), std::move(future)};
}

}  // namespace xfer_pipe
