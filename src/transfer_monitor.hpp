// SPDX-License-Identifier: MIT

// src/transfer_monitor.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "lib/stream/error.hpp"
#include "src/transfer_listener.hpp"
#include "src/transfer_listener_invoker.hpp"
#include "src/transfer_progress.hpp"

namespace xfer_pipe {

// TransferMonitor - per-transfer progress state plus listener fan-out.
//
// Shared by the instrumented endpoints and the transfer front end. Each
// progress update publishes a snapshot and then notifies listeners with
// exactly that snapshot, outside any lock. Terminal notification
// (Complete or Fail) happens at most once, whichever caller gets there first.
class TransferMonitor {
public:
    TransferMonitor(TransferRequestInfo request,
                    std::shared_ptr<const TransferListenerInvoker> invoker,
                    TransferProgressSnapshot initial = {});

    /// Notify TransferInitiated with the current snapshot.
    void Initiated();

    /// Record @p bytes more transferred and notify BytesTransferred.
    TransferProgressSnapshot AddBytes(uint64_t bytes);

    /// Set the total size if it is not known yet. Later calls are ignored.
    void SetTotalBytes(uint64_t total);

    /// Notify TransferComplete. Returns false if already terminal.
    bool Complete();

    /// Notify TransferFailed with @p e. Returns false if already terminal.
    bool Fail(const Error& e);

    bool IsTerminal() const { return terminal_.load(std::memory_order_acquire); }

    TransferProgressSnapshot Snapshot() const { return progress_.Snapshot(); }

    const TransferRequestInfo& request() const { return request_; }

private:
    TransferContext MakeContext(const TransferProgressSnapshot& snapshot) const {
        return TransferContext{request_, snapshot};
    }

    TransferRequestInfo request_;
    std::shared_ptr<const TransferListenerInvoker> invoker_;
    TransferProgress progress_;
    std::atomic<bool> terminal_{false};
};

}  // namespace xfer_pipe
