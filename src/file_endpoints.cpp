// SPDX-License-Identifier: MIT

// src/file_endpoints.cpp
#include "src/file_endpoints.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <expected>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace xfer_pipe {

namespace {

// Owns a file descriptor for the lifetime of one subscription
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) ::close(fd_);
    }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

Error MakeIoError(const std::string& what, const std::filesystem::path& path, int err) {
    return Error{ErrorCode::IoError,
                 fmt::format("{} {}: {}", what, path.string(), std::strerror(err)), err};
}

}  // namespace

FileByteSource::FileByteSource(std::filesystem::path path, FileSourceConfig config)
    : path_(std::move(path)),
      config_(config),
      publisher_([path = path_, chunk_size = config_.chunk_size]()
                     -> std::expected<GeneratorPublisher<ByteChunk>::Generator, Error> {
          if (chunk_size == 0) {
              return std::unexpected(Error{ErrorCode::InvalidArgument, "chunk_size must be positive"});
          }
          int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
          if (fd < 0) {
              return std::unexpected(MakeIoError("Failed to open", path, errno));
          }
          auto file = std::make_shared<ScopedFd>(fd);
          return [file, path, chunk_size]() -> std::expected<std::optional<ByteChunk>, Error> {
              ByteChunk chunk(chunk_size);
              ssize_t n;
              do {
                  n = ::read(file->get(), chunk.data(), chunk.size());
              } while (n < 0 && errno == EINTR);
              if (n < 0) {
                  return std::unexpected(MakeIoError("Failed to read", path, errno));
              }
              if (n == 0) return std::optional<ByteChunk>{};
              chunk.resize(static_cast<std::size_t>(n));
              return std::optional<ByteChunk>{std::move(chunk)};
          };
      }) {}

void FileByteSource::Subscribe(std::shared_ptr<Subscriber<ByteChunk>> subscriber) {
    publisher_.Subscribe(std::move(subscriber));
}

std::optional<uint64_t> FileByteSource::ContentLength() const {
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

FileByteSink::FileByteSink(std::filesystem::path path) : path_(std::move(path)) {}

FileByteSink::~FileByteSink() {
    std::lock_guard lock(mutex_);
    if (fd_ >= 0) ::close(fd_);
}

void FileByteSink::OnResponse(const ResponseMetadata&) {}

void FileByteSink::OnSubscribe(std::shared_ptr<Subscription> subscription) {
    bool opened = false;
    {
        std::lock_guard lock(mutex_);
        if (!subscription_ && !closed_) {
            fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd_ < 0) {
                last_error_ = MakeIoError("Failed to create", path_, errno);
                closed_ = true;
            } else {
                subscription_ = subscription;
                opened = true;
            }
        }
    }
    if (!opened) {
        subscription->Cancel();
        return;
    }
    subscription->Request(1);
}

void FileByteSink::OnNext(ByteChunk chunk) {
    std::shared_ptr<Subscription> subscription;
    {
        std::lock_guard lock(mutex_);
        if (closed_ || fd_ < 0) return;
        const std::byte* data = chunk.data();
        std::size_t remaining = chunk.size();
        while (remaining > 0) {
            ssize_t n = ::write(fd_, data, remaining);
            if (n < 0) {
                if (errno == EINTR) continue;
                last_error_ = MakeIoError("Failed to write", path_, errno);
                break;
            }
            data += n;
            remaining -= static_cast<std::size_t>(n);
            bytes_written_ += static_cast<uint64_t>(n);
        }
        subscription = subscription_;
    }
    if (LastError()) {
        CloseFile();
        if (subscription) subscription->Cancel();
        return;
    }
    if (subscription) subscription->Request(1);
}

void FileByteSink::OnError(const Error& e) {
    Fail(e);
}

void FileByteSink::OnComplete() {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    closed_ = true;
    subscription_.reset();
    if (fd_ >= 0 && ::close(fd_) < 0) {
        last_error_ = MakeIoError("Failed to close", path_, errno);
    }
    fd_ = -1;
}

std::optional<Error> FileByteSink::LastError() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

uint64_t FileByteSink::BytesWritten() const {
    std::lock_guard lock(mutex_);
    return bytes_written_;
}

bool FileByteSink::IsClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

void FileByteSink::Fail(Error e) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        if (!last_error_) last_error_ = std::move(e);
    }
    CloseFile();
}

void FileByteSink::CloseFile() {
    std::lock_guard lock(mutex_);
    closed_ = true;
    subscription_.reset();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
}

}  // namespace xfer_pipe
