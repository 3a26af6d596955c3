// SPDX-License-Identifier: MIT

// src/transfer_progress.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace xfer_pipe {

/// Immutable point-in-time view of a transfer's progress.
class TransferProgressSnapshot {
public:
    /// Mutable copy of a snapshot, used by TransferProgress::UpdateAndGet().
    class Builder {
    public:
        Builder() = default;
        explicit Builder(const TransferProgressSnapshot& s)
            : bytes_transferred_(s.bytes_transferred_), total_bytes_(s.total_bytes_) {}

        Builder& BytesTransferred(uint64_t bytes) { bytes_transferred_ = bytes; return *this; }
        Builder& AddBytesTransferred(uint64_t bytes) { bytes_transferred_ += bytes; return *this; }
        Builder& TotalBytes(uint64_t bytes) { total_bytes_ = bytes; return *this; }

        uint64_t BytesTransferred() const { return bytes_transferred_; }
        std::optional<uint64_t> TotalBytes() const { return total_bytes_; }

        TransferProgressSnapshot Build() const {
            return TransferProgressSnapshot(bytes_transferred_, total_bytes_);
        }

    private:
        uint64_t bytes_transferred_ = 0;
        std::optional<uint64_t> total_bytes_;
    };

    TransferProgressSnapshot() = default;
    TransferProgressSnapshot(uint64_t bytes_transferred, std::optional<uint64_t> total_bytes)
        : bytes_transferred_(bytes_transferred), total_bytes_(total_bytes) {}

    uint64_t BytesTransferred() const { return bytes_transferred_; }
    std::optional<uint64_t> TotalBytes() const { return total_bytes_; }

    /// Fraction transferred in [0, 1+], if the total is known and non-zero.
    /// An empty transfer with a known total of zero reports 1.0.
    std::optional<double> RatioTransferred() const {
        if (!total_bytes_) return std::nullopt;
        if (*total_bytes_ == 0) return 1.0;
        return static_cast<double>(bytes_transferred_) / static_cast<double>(*total_bytes_);
    }

    /// Bytes left, if the total is known. Never negative.
    std::optional<uint64_t> BytesRemaining() const {
        if (!total_bytes_) return std::nullopt;
        return *total_bytes_ > bytes_transferred_ ? *total_bytes_ - bytes_transferred_ : 0;
    }

    Builder ToBuilder() const { return Builder(*this); }

    bool operator==(const TransferProgressSnapshot&) const = default;

private:
    uint64_t bytes_transferred_ = 0;
    std::optional<uint64_t> total_bytes_;
};

/// Thread-safe holder of the current progress snapshot for one transfer.
///
/// Invariants enforced by UpdateAndGet():
/// - bytes_transferred never decreases
/// - total_bytes never changes once set
/// A mutator that breaks either throws std::logic_error and nothing is
/// published.
class TransferProgress {
public:
    using Mutator = std::function<void(TransferProgressSnapshot::Builder&)>;

    explicit TransferProgress(TransferProgressSnapshot initial = {})
        : snapshot_(initial) {}

    TransferProgress(const TransferProgress&) = delete;
    TransferProgress& operator=(const TransferProgress&) = delete;

    /// Latest published snapshot. Safe from any thread.
    TransferProgressSnapshot Snapshot() const;

    /// Apply @p mutator to the current snapshot and publish the result
    /// atomically with respect to other callers.
    TransferProgressSnapshot UpdateAndGet(const Mutator& mutator);

private:
    mutable std::mutex mutex_;
    TransferProgressSnapshot snapshot_;
};

}  // namespace xfer_pipe
