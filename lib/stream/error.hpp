// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace xfer_pipe {

/// Error codes for all stream and transfer operations.
enum class ErrorCode {
    // Protocol
    AlreadySubscribed,     ///< Subscribe() called on a publisher that already has a subscriber
    InvalidDemand,         ///< Request(0) received
    BufferOverflow,        ///< Pending partial record exceeded its size limit

    // Stream
    UpstreamFailed,        ///< Producer side failed without a more specific code
    Cancelled,             ///< Stream was cancelled before it completed

    // I/O
    IoError,               ///< File read/write failed (see os_errno)

    // Validation
    InvalidArgument,       ///< Request parameter missing or malformed
    UnsupportedResource,   ///< Bucket identifier names a resource the manager cannot serve

    // Transfer
    TransferFailed,        ///< Engine reported a failure
    NotFound,              ///< Object does not exist
};

/// Error payload delivered to OnError callbacks and std::expected results.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "protocol", "io").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::AlreadySubscribed:
        case ErrorCode::InvalidDemand:
        case ErrorCode::BufferOverflow:
            return "protocol";
        case ErrorCode::UpstreamFailed:
        case ErrorCode::Cancelled:
            return "stream";
        case ErrorCode::IoError:
            return "io";
        case ErrorCode::InvalidArgument:
        case ErrorCode::UnsupportedResource:
            return "validation";
        case ErrorCode::TransferFailed:
        case ErrorCode::NotFound:
            return "transfer";
    }
    return "unknown";
}

}  // namespace xfer_pipe
