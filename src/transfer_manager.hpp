// SPDX-License-Identifier: MIT

// src/transfer_manager.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/byte_stream.hpp"
#include "src/file_endpoints.hpp"
#include "src/transfer_engine.hpp"
#include "src/transfer_listener.hpp"
#include "src/transfer_listener_invoker.hpp"
#include "src/transfer_monitor.hpp"
#include "src/transfer_progress.hpp"

namespace xfer_pipe {

using TransferListeners = std::vector<std::shared_ptr<TransferListener>>;

struct UploadRequest {
    std::string bucket;
    std::string key;
    std::shared_ptr<ByteSource> body;
    TransferListeners listeners;
};

struct UploadFileRequest {
    std::string bucket;
    std::string key;
    std::filesystem::path source;
    TransferListeners listeners;
};

struct DownloadRequest {
    std::string bucket;
    std::string key;
    std::shared_ptr<ByteSink> destination;
    TransferListeners listeners;
};

struct DownloadFileRequest {
    std::string bucket;
    std::string key;
    std::filesystem::path destination;
    TransferListeners listeners;
};

struct CompletedUpload {
    std::string etag;
};

struct CompletedDownload {
    std::string etag;
    uint64_t content_length = 0;
};

/// Handle to a transfer in flight (or already finished).
///
/// Completion() resolves exactly once with the outcome. Progress() may be
/// called from any thread at any time, including after completion.
template<typename Completed>
class Transfer {
public:
    using Result = std::expected<Completed, Error>;

    Transfer(std::shared_future<Result> completion, std::shared_ptr<const TransferMonitor> monitor)
        : completion_(std::move(completion)), monitor_(std::move(monitor)) {}

    const std::shared_future<Result>& Completion() const { return completion_; }

    TransferProgressSnapshot Progress() const { return monitor_->Snapshot(); }

    const TransferRequestInfo& request() const { return monitor_->request(); }

private:
    std::shared_future<Result> completion_;
    std::shared_ptr<const TransferMonitor> monitor_;
};

using Upload = Transfer<CompletedUpload>;
using Download = Transfer<CompletedDownload>;

struct TransferManagerConfig {
    FileSourceConfig file_source;
    /// Where listener exceptions are reported. Empty means stderr.
    TransferListenerInvoker::FailureReporter listener_failure_reporter;
};

// TransferManager - front end that instruments transfers and hands them to
// an engine.
//
// For each request it validates the bucket and endpoint, builds the listener
// invoker and progress monitor, notifies TransferInitiated, wraps the body or
// destination with progress tracking and starts the engine. A request that
// fails validation returns a handle whose completion is already resolved
// with the error; its listeners are never called.
class TransferManager {
public:
    explicit TransferManager(std::shared_ptr<TransferEngine> engine,
                             TransferManagerConfig config = {});

    Upload StartUpload(UploadRequest request);
    Upload UploadFile(UploadFileRequest request);

    Download StartDownload(DownloadRequest request);
    Download DownloadFile(DownloadFileRequest request);

private:
    std::shared_ptr<TransferMonitor> MakeMonitor(TransferRequestInfo info,
                                                 TransferListeners listeners,
                                                 TransferProgressSnapshot initial) const;

    std::shared_ptr<TransferEngine> engine_;
    TransferManagerConfig config_;
};

}  // namespace xfer_pipe
