// SPDX-License-Identifier: MIT

// src/transfer_engine.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>

#include "lib/stream/error.hpp"
#include "src/byte_stream.hpp"

namespace xfer_pipe {

/// Bucket and key of a stored object.
struct ObjectRef {
    std::string bucket;
    std::string key;
};

struct PutObjectResult {
    std::string etag;
    uint64_t content_length = 0;
};

struct GetObjectResult {
    std::string etag;
    uint64_t content_length = 0;
};

/// Moves object bodies between a byte endpoint and storage.
///
/// The engine subscribes to the upload source, or drives the download sink,
/// and reports the outcome exactly once through the callback. The callback may
/// run on any thread, possibly before PutObject()/GetObject() returns.
/// Request-level failures (missing object, rejected upload) are reported
/// through the callback, not thrown.
class TransferEngine {
public:
    using PutCallback = std::function<void(std::expected<PutObjectResult, Error>)>;
    using GetCallback = std::function<void(std::expected<GetObjectResult, Error>)>;

    virtual ~TransferEngine() = default;

    virtual void PutObject(const ObjectRef& object,
                           std::shared_ptr<ByteSource> body,
                           PutCallback callback) = 0;

    /// OnResponse() is delivered to @p sink before the body streams.
    virtual void GetObject(const ObjectRef& object,
                           std::shared_ptr<ByteSink> sink,
                           GetCallback callback) = 0;
};

}  // namespace xfer_pipe
