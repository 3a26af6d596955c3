// SPDX-License-Identifier: MIT

// lib/stream/line_splitter.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "lib/stream/delegating_subscriber.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/flow.hpp"

namespace xfer_pipe {

/// Lines completed by one upstream chunk, in input order.
using LineBatch = std::vector<std::string>;

/// Configuration for LineSplitter.
struct LineSplitterConfig {
    std::string delimiter = "\n";                       ///< Record separator (non-empty)
    std::size_t max_record_size = 16 * 1024 * 1024;     ///< Cap on the pending partial record

    /// Unix line endings.
    static LineSplitterConfig Lf() { return LineSplitterConfig{}; }

    /// Network / Windows line endings.
    static LineSplitterConfig Crlf() {
        return LineSplitterConfig{.delimiter = "\r\n"};
    }
};

// LineSplitter - splits a text stream into delimited records.
//
// Each upstream chunk is appended to a buffer. Complete lines are emitted as
// one LineBatch; a trailing partial line stays buffered for the next chunk.
// A chunk that completes no line emits nothing and requests one more chunk.
// On completion a non-empty buffer is emitted as a final one-line batch.
//
// Empty records between adjacent delimiters are preserved. A single trailing
// delimiter produces no trailing empty record, so joining every emitted record
// with the delimiter reproduces the input minus that delimiter.
//
// buffer_ is touched only from upstream signals (single writer).
class LineSplitter : public DelegatingSubscriber<LineSplitter, std::string, LineBatch>,
                     public std::enable_shared_from_this<LineSplitter> {
public:
    // Factory method for shared_from_this safety
    static std::shared_ptr<LineSplitter> Create(std::shared_ptr<Subscriber<LineBatch>> downstream,
                                                LineSplitterConfig config = {}) {
        struct MakeSharedEnabler : public LineSplitter {
            MakeSharedEnabler(std::shared_ptr<Subscriber<LineBatch>> ds, LineSplitterConfig c)
                : LineSplitter(std::move(ds), std::move(c)) {}
        };
        return std::make_shared<MakeSharedEnabler>(std::move(downstream), std::move(config));
    }

    /// Wrap @p upstream so every subscriber receives line batches.
    static std::shared_ptr<Publisher<LineBatch>> Lines(std::shared_ptr<Publisher<std::string>> upstream,
                                                       LineSplitterConfig config = {}) {
        if (config.delimiter.empty()) {
            throw std::invalid_argument("LineSplitter delimiter must not be empty");
        }
        return std::make_shared<TransformPublisher<std::string, LineBatch>>(
            std::move(upstream),
            [config](std::shared_ptr<Subscriber<LineBatch>> downstream) {
                return Create(std::move(downstream), config);
            });
    }

    std::expected<std::optional<LineBatch>, Error> OnItem(std::string chunk) {
        const std::string& delim = config_.delimiter;

        // The buffer never holds a whole delimiter, but may hold its prefix
        std::size_t search_from = buffer_.size() >= delim.size() ? buffer_.size() - delim.size() + 1 : 0;
        buffer_ += chunk;

        std::size_t pos = buffer_.find(delim, search_from);
        if (pos == std::string::npos) {
            if (buffer_.size() > config_.max_record_size) {
                return std::unexpected(Overflow());
            }
            return std::optional<LineBatch>{};
        }

        LineBatch lines;
        std::size_t start = 0;
        while (pos != std::string::npos) {
            lines.emplace_back(buffer_, start, pos - start);
            start = pos + delim.size();
            pos = buffer_.find(delim, start);
        }

        if (start == buffer_.size()) {
            buffer_.clear();
        } else {
            buffer_.erase(0, start);
            if (buffer_.size() > config_.max_record_size) {
                return std::unexpected(Overflow());
            }
        }
        return std::optional<LineBatch>{std::move(lines)};
    }

    std::optional<LineBatch> TakePending() {
        if (buffer_.empty()) return std::nullopt;
        LineBatch last;
        last.push_back(std::move(buffer_));
        buffer_.clear();
        return last;
    }

    void DiscardPending() {
        buffer_.clear();
    }

    /// Bytes of the current partial record.
    std::size_t PendingSize() const { return buffer_.size(); }

    const LineSplitterConfig& config() const { return config_; }

protected:
    LineSplitter(std::shared_ptr<Subscriber<LineBatch>> downstream, LineSplitterConfig config)
        : DelegatingSubscriber(std::move(downstream)), config_(std::move(config)) {
        if (config_.delimiter.empty()) {
            throw std::invalid_argument("LineSplitter delimiter must not be empty");
        }
    }

private:
    Error Overflow() const {
        return Error{ErrorCode::BufferOverflow,
            "Line exceeds " + std::to_string(config_.max_record_size) + " bytes"};
    }

    LineSplitterConfig config_;
    std::string buffer_;
};

}  // namespace xfer_pipe
