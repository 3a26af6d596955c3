// SPDX-License-Identifier: MIT

// src/transfer_listener.hpp
#pragma once

#include <string>
#include <string_view>

#include "lib/stream/error.hpp"
#include "src/transfer_progress.hpp"

namespace xfer_pipe {

enum class TransferDirection { Upload, Download };

constexpr std::string_view to_string(TransferDirection d) {
    switch (d) {
        case TransferDirection::Upload: return "upload";
        case TransferDirection::Download: return "download";
    }
    return "unknown";
}

/// Identifies the transfer a listener callback belongs to.
struct TransferRequestInfo {
    TransferDirection direction = TransferDirection::Upload;
    std::string bucket;
    std::string key;
};

/// Immutable context passed to TransferListener callbacks.
struct TransferContext {
    TransferRequestInfo request;
    TransferProgressSnapshot progress;
};

/// Context for TransferListener::TransferFailed().
struct TransferFailedContext {
    TransferContext transfer;
    Error error;
};

/// Receives lifecycle events for a transfer.
///
/// Callbacks run on whatever thread drives the transfer (often an I/O
/// thread). Implementations must be fast and must not block. BytesTransferred
/// may fire very often. A listener attached to concurrent transfers must be
/// thread-safe. Exceptions thrown from a callback are reported and otherwise
/// ignored; they never affect the transfer.
///
/// Causal order per transfer: TransferInitiated, then BytesTransferred zero
/// or more times, then one of TransferComplete / TransferFailed.
class TransferListener {
public:
    virtual ~TransferListener() = default;

    virtual void TransferInitiated(const TransferContext&) {}
    virtual void BytesTransferred(const TransferContext&) {}
    virtual void TransferComplete(const TransferContext&) {}
    virtual void TransferFailed(const TransferFailedContext&) {}
};

}  // namespace xfer_pipe
