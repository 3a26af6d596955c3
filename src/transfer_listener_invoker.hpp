// SPDX-License-Identifier: MIT

// src/transfer_listener_invoker.hpp
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "src/transfer_listener.hpp"

namespace xfer_pipe {

/// Fans lifecycle events out to a fixed, ordered set of listeners.
///
/// Each listener call is isolated: an exception is caught, passed to the
/// failure reporter, and the next listener still runs. Nothing propagates to
/// the caller. The listener set is immutable after construction, so
/// concurrent invocations need no locking and none is held during a callback.
class TransferListenerInvoker {
public:
    using FailureReporter = std::function<void(std::string_view)>;

    explicit TransferListenerInvoker(std::vector<std::shared_ptr<TransferListener>> listeners,
                                     FailureReporter reporter = {});

    void TransferInitiated(const TransferContext& ctx) const;
    void BytesTransferred(const TransferContext& ctx) const;
    void TransferComplete(const TransferContext& ctx) const;
    void TransferFailed(const TransferFailedContext& ctx) const;

    std::size_t size() const { return listeners_.size(); }

    /// Reporter that writes to stderr.
    static void ReportToStderr(std::string_view message);

private:
    // Hands @p message to the reporter; a throwing reporter falls back to stderr
    void Report(const std::string& message) const;

    template<typename Fn>
    void ForEach(std::string_view event, Fn&& fn) const;

    std::vector<std::shared_ptr<TransferListener>> listeners_;
    FailureReporter reporter_;
};

}  // namespace xfer_pipe
