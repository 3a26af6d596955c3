// SPDX-License-Identifier: MIT

// src/transfer_monitor.cpp
#include "src/transfer_monitor.hpp"

#include <utility>

namespace xfer_pipe {

TransferMonitor::TransferMonitor(TransferRequestInfo request,
                                 std::shared_ptr<const TransferListenerInvoker> invoker,
                                 TransferProgressSnapshot initial)
    : request_(std::move(request)),
      invoker_(std::move(invoker)),
      progress_(initial) {}

void TransferMonitor::Initiated() {
    if (invoker_) invoker_->TransferInitiated(MakeContext(progress_.Snapshot()));
}

TransferProgressSnapshot TransferMonitor::AddBytes(uint64_t bytes) {
    auto snapshot = progress_.UpdateAndGet(
        [bytes](TransferProgressSnapshot::Builder& b) { b.AddBytesTransferred(bytes); });
    if (invoker_) invoker_->BytesTransferred(MakeContext(snapshot));
    return snapshot;
}

void TransferMonitor::SetTotalBytes(uint64_t total) {
    progress_.UpdateAndGet([total](TransferProgressSnapshot::Builder& b) {
        if (!b.TotalBytes()) b.TotalBytes(total);
    });
}

bool TransferMonitor::Complete() {
    if (terminal_.exchange(true, std::memory_order_acq_rel)) return false;
    if (invoker_) invoker_->TransferComplete(MakeContext(progress_.Snapshot()));
    return true;
}

bool TransferMonitor::Fail(const Error& e) {
    if (terminal_.exchange(true, std::memory_order_acq_rel)) return false;
    if (invoker_) invoker_->TransferFailed(TransferFailedContext{MakeContext(progress_.Snapshot()), e});
    return true;
}

}  // namespace xfer_pipe
