// SPDX-License-Identifier: MIT

// src/transfer_progress.cpp
#include "src/transfer_progress.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace xfer_pipe {

TransferProgressSnapshot TransferProgress::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

TransferProgressSnapshot TransferProgress::UpdateAndGet(const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto builder = snapshot_.ToBuilder();
    mutator(builder);
    auto next = builder.Build();

    if (next.BytesTransferred() < snapshot_.BytesTransferred()) {
        throw std::logic_error(fmt::format(
            "TransferProgress: bytes_transferred would decrease from {} to {}",
            snapshot_.BytesTransferred(), next.BytesTransferred()));
    }
    auto total = snapshot_.TotalBytes();
    if (total && next.TotalBytes() != total) {
        throw std::logic_error(fmt::format(
            "TransferProgress: total_bytes already set to {}", *total));
    }

    snapshot_ = next;
    return snapshot_;
}

}  // namespace xfer_pipe
