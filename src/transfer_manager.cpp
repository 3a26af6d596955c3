// SPDX-License-Identifier: MIT

// src/transfer_manager.cpp
#include "src/transfer_manager.hpp"

#include <atomic>
#include <exception>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

#include "src/bucket_validation.hpp"
#include "src/progress_tracking.hpp"

namespace xfer_pipe {

namespace {

// Resolves a transfer exactly once: terminal listener notification first,
// then the completion future.
template<typename Completed>
class CompletionLatch {
public:
    using Result = std::expected<Completed, Error>;

    explicit CompletionLatch(std::shared_ptr<TransferMonitor> monitor)
        : monitor_(std::move(monitor)), future_(promise_.get_future().share()) {}

    std::shared_future<Result> future() const { return future_; }

    void Resolve(Result result) {
        if (resolved_.exchange(true, std::memory_order_acq_rel)) return;
        if (result) {
            monitor_->Complete();
        } else {
            monitor_->Fail(result.error());
        }
        promise_.set_value(std::move(result));
    }

private:
    std::shared_ptr<TransferMonitor> monitor_;
    std::promise<Result> promise_;
    std::shared_future<Result> future_;
    std::atomic<bool> resolved_{false};
};

template<typename Completed>
Transfer<Completed> Rejected(TransferRequestInfo info, Error error) {
    auto monitor = std::make_shared<TransferMonitor>(std::move(info), nullptr);
    std::promise<typename Transfer<Completed>::Result> promise;
    promise.set_value(std::unexpected(std::move(error)));
    return Transfer<Completed>(promise.get_future().share(), std::move(monitor));
}

std::expected<void, Error> ValidateObject(std::string_view bucket, std::string_view key,
                                          bool has_endpoint, std::string_view operation) {
    if (auto valid = ValidateBucket(bucket, operation); !valid) {
        return valid;
    }
    if (key.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
            fmt::format("{} requires a key", operation)});
    }
    if (!has_endpoint) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
            fmt::format("{} requires a {}", operation,
                        operation == "upload" ? "request body" : "destination")});
    }
    return {};
}

Error EngineException(std::string_view operation, const std::exception& e) {
    return Error{ErrorCode::TransferFailed,
                 fmt::format("Transfer engine rejected {}: {}", operation, e.what())};
}

}  // namespace

TransferManager::TransferManager(std::shared_ptr<TransferEngine> engine,
                                 TransferManagerConfig config)
    : engine_(std::move(engine)), config_(std::move(config)) {
    if (!engine_) {
        throw std::invalid_argument("TransferManager requires an engine");
    }
}

Upload TransferManager::StartUpload(UploadRequest request) {
    TransferRequestInfo info{TransferDirection::Upload, request.bucket, request.key};
    if (auto valid = ValidateObject(request.bucket, request.key, request.body != nullptr, "upload");
        !valid) {
        return Rejected<CompletedUpload>(std::move(info), valid.error());
    }

    TransferProgressSnapshot::Builder initial;
    if (auto length = request.body->ContentLength()) {
        initial.TotalBytes(*length);
    }
    auto monitor = MakeMonitor(info, std::move(request.listeners), initial.Build());
    auto latch = std::make_shared<CompletionLatch<CompletedUpload>>(monitor);
    Upload handle(latch->future(), monitor);

    monitor->Initiated();
    auto body = std::make_shared<ProgressTrackingSource>(std::move(request.body), monitor);
    try {
        engine_->PutObject(ObjectRef{info.bucket, info.key}, std::move(body),
            [latch](std::expected<PutObjectResult, Error> result) {
                if (!result) {
                    latch->Resolve(std::unexpected(result.error()));
                    return;
                }
                latch->Resolve(CompletedUpload{result->etag});
            });
    } catch (const std::exception& e) {
        latch->Resolve(std::unexpected(EngineException("upload", e)));
    }
    return handle;
}

Upload TransferManager::UploadFile(UploadFileRequest request) {
    auto body = std::make_shared<FileByteSource>(std::move(request.source), config_.file_source);
    return StartUpload(UploadRequest{
        .bucket = std::move(request.bucket),
        .key = std::move(request.key),
        .body = std::move(body),
        .listeners = std::move(request.listeners),
    });
}

Download TransferManager::DownloadFile(DownloadFileRequest request) {
    return StartDownload(DownloadRequest{
        .bucket = std::move(request.bucket),
        .key = std::move(request.key),
        .destination = std::make_shared<FileByteSink>(std::move(request.destination)),
        .listeners = std::move(request.listeners),
    });
}

Download TransferManager::StartDownload(DownloadRequest request) {
    TransferRequestInfo info{TransferDirection::Download, request.bucket, request.key};
    if (auto valid = ValidateObject(request.bucket, request.key,
                                    request.destination != nullptr, "download");
        !valid) {
        return Rejected<CompletedDownload>(std::move(info), valid.error());
    }

    auto monitor = MakeMonitor(info, std::move(request.listeners), {});
    auto latch = std::make_shared<CompletionLatch<CompletedDownload>>(monitor);
    Download handle(latch->future(), monitor);

    monitor->Initiated();
    auto destination = request.destination;
    auto sink = ProgressTrackingSink::Create(std::move(request.destination), monitor);
    try {
        engine_->GetObject(ObjectRef{info.bucket, info.key}, std::move(sink),
            [latch, destination](std::expected<GetObjectResult, Error> result) {
                // The destination's own failure outranks both a clean engine
                // result and the bare cancellation it caused
                if (auto own = destination->LastError()) {
                    latch->Resolve(std::unexpected(std::move(*own)));
                    return;
                }
                if (!result) {
                    latch->Resolve(std::unexpected(result.error()));
                    return;
                }
                latch->Resolve(CompletedDownload{result->etag, result->content_length});
            });
    } catch (const std::exception& e) {
        latch->Resolve(std::unexpected(EngineException("download", e)));
    }
    return handle;
}

std::shared_ptr<TransferMonitor> TransferManager::MakeMonitor(
    TransferRequestInfo info, TransferListeners listeners,
    TransferProgressSnapshot initial) const {
    auto invoker = std::make_shared<const TransferListenerInvoker>(
        std::move(listeners), config_.listener_failure_reporter);
    return std::make_shared<TransferMonitor>(std::move(info), std::move(invoker), initial);
}

}  // namespace xfer_pipe
