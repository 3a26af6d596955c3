// SPDX-License-Identifier: MIT

// src/byte_stream.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/flow.hpp"

namespace xfer_pipe {

/// Owned block of bytes flowing through a transfer.
using ByteChunk = std::vector<std::byte>;

inline ByteChunk ToChunk(std::string_view text) {
    ByteChunk chunk(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        chunk[i] = static_cast<std::byte>(text[i]);
    }
    return chunk;
}

inline std::string ToString(const ByteChunk& chunk) {
    return std::string(reinterpret_cast<const char*>(chunk.data()), chunk.size());
}

/// Upload body: a byte producer that may know its length up front.
class ByteSource : public Publisher<ByteChunk> {
public:
    /// Total bytes the source will produce, if known before streaming.
    virtual std::optional<uint64_t> ContentLength() const = 0;
};

/// Response metadata delivered to a ByteSink before the body streams.
struct ResponseMetadata {
    std::optional<uint64_t> content_length;
    std::string etag;
};

/// Download destination: a byte consumer that also sees response metadata.
///
/// OnResponse() is called at most once, before OnSubscribe().
class ByteSink : public Subscriber<ByteChunk> {
public:
    virtual void OnResponse(const ResponseMetadata& metadata) = 0;

    /// Failure the sink recorded (a failed write or close, or the stream
    /// error it was handed), if any. A sink can fail while finishing a stream
    /// that completed cleanly.
    virtual std::optional<Error> LastError() const { return std::nullopt; }
};

}  // namespace xfer_pipe
