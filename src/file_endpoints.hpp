// SPDX-License-Identifier: MIT

// src/file_endpoints.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

#include "lib/stream/error.hpp"
#include "lib/stream/flow.hpp"
#include "lib/stream/generator_publisher.hpp"
#include "src/byte_stream.hpp"

namespace xfer_pipe {

struct FileSourceConfig {
    std::size_t chunk_size = 64 * 1024;  // Bytes per emitted chunk
};

// FileByteSource - upload body read from a local file.
//
// The file is opened per subscription and read one chunk ahead of demand.
// Open and read failures fail the subscriber with ErrorCode::IoError.
// ContentLength() is the file size at the time of the call.
class FileByteSource : public ByteSource {
public:
    explicit FileByteSource(std::filesystem::path path, FileSourceConfig config = {});

    void Subscribe(std::shared_ptr<Subscriber<ByteChunk>> subscriber) override;

    std::optional<uint64_t> ContentLength() const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    FileSourceConfig config_;
    GeneratorPublisher<ByteChunk> publisher_;
};

// FileByteSink - download destination that writes the body to a local file.
//
// The file is created (or truncated) on subscribe and chunks are requested
// one at a time. On a write failure the upstream is cancelled and the error
// is kept for LastError(). A stream that ends in error removes the partial
// file.
class FileByteSink : public ByteSink {
public:
    explicit FileByteSink(std::filesystem::path path);
    ~FileByteSink() override;

    FileByteSink(const FileByteSink&) = delete;
    FileByteSink& operator=(const FileByteSink&) = delete;

    void OnResponse(const ResponseMetadata& metadata) override;
    void OnSubscribe(std::shared_ptr<Subscription> subscription) override;
    void OnNext(ByteChunk chunk) override;
    void OnError(const Error& e) override;
    void OnComplete() override;

    std::optional<Error> LastError() const override;
    uint64_t BytesWritten() const;
    bool IsClosed() const;

    const std::filesystem::path& path() const { return path_; }

private:
    void Fail(Error e);
    void CloseFile();

    std::filesystem::path path_;

    mutable std::mutex mutex_;
    int fd_ = -1;
    bool closed_ = false;
    uint64_t bytes_written_ = 0;
    std::optional<Error> last_error_;
    std::shared_ptr<Subscription> subscription_;
};

}  // namespace xfer_pipe
