// SPDX-License-Identifier: MIT

// example/progress_bar.cpp
//
// Uploads a local file to an in-memory engine with a console progress bar,
// then downloads it again through a LineSplitter and reports the line count.
//
//   progress_bar <file> [--crlf]
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "lib/stream/line_splitter.hpp"
#include "src/loopback_engine.hpp"
#include "src/transfer_manager.hpp"

using namespace xfer_pipe;

namespace {

class ProgressBar : public TransferListener {
public:
    void TransferInitiated(const TransferContext& ctx) override {
        fmt::print(stderr, "{} {}/{}\n", to_string(ctx.request.direction),
                   ctx.request.bucket, ctx.request.key);
        Draw(ctx.progress);
    }

    void BytesTransferred(const TransferContext& ctx) override { Draw(ctx.progress); }

    void TransferComplete(const TransferContext& ctx) override {
        Draw(ctx.progress);
        fmt::print(stderr, " done\n");
    }

    void TransferFailed(const TransferFailedContext& ctx) override {
        Draw(ctx.transfer.progress);
        fmt::print(stderr, " failed ({}): {}\n", error_category(ctx.error.code), ctx.error.message);
    }

private:
    static constexpr int kWidth = 40;

    static void Draw(const TransferProgressSnapshot& progress) {
        auto ratio = progress.RatioTransferred();
        if (!ratio) {
            fmt::print(stderr, "\r[{:>{}}] {} bytes", "?", kWidth, progress.BytesTransferred());
            return;
        }
        int filled = static_cast<int>(std::min(*ratio, 1.0) * kWidth);
        fmt::print(stderr, "\r[{:=<{}}{:<{}}] {:5.1f}%", "", filled, "", kWidth - filled,
                   *ratio * 100.0);
    }
};

// Counts the records a LineSplitter emits.
class LineCounter : public Subscriber<LineBatch> {
public:
    void OnSubscribe(std::shared_ptr<Subscription> s) override { s->Request(kUnboundedDemand); }
    void OnNext(LineBatch batch) override { lines += batch.size(); }
    void OnError(const Error& e) override { fmt::print(stderr, "line split failed: {}\n", e.message); }
    void OnComplete() override {}

    uint64_t lines = 0;
};

// Download destination that feeds the body text into a LineSplitter.
class LineSink : public ByteSink {
public:
    LineSink(std::shared_ptr<LineCounter> counter, LineSplitterConfig config)
        : splitter_(LineSplitter::Create(std::move(counter), std::move(config))) {}

    void OnResponse(const ResponseMetadata&) override {}
    void OnSubscribe(std::shared_ptr<Subscription> s) override { splitter_->OnSubscribe(std::move(s)); }
    void OnNext(ByteChunk chunk) override { splitter_->OnNext(ToString(chunk)); }
    void OnError(const Error& e) override { splitter_->OnError(e); }
    void OnComplete() override { splitter_->OnComplete(); }

private:
    std::shared_ptr<LineSplitter> splitter_;
};

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        fmt::print(stderr, "usage: {} <file> [--crlf]\n", argv[0]);
        return 2;
    }
    std::filesystem::path path = argv[1];
    bool crlf = argc > 2 && std::string_view(argv[2]) == "--crlf";

    auto engine = std::make_shared<LoopbackTransferEngine>();
    TransferManager manager(engine);
    auto bar = std::make_shared<ProgressBar>();

    auto upload = manager.UploadFile(UploadFileRequest{
        .bucket = "local",
        .key = path.filename().string(),
        .source = path,
        .listeners = {bar},
    });
    auto uploaded = upload.Completion().get();
    if (!uploaded) {
        fmt::print(stderr, "upload failed: {}\n", uploaded.error().message);
        return 1;
    }

    auto counter = std::make_shared<LineCounter>();
    auto download = manager.StartDownload(DownloadRequest{
        .bucket = "local",
        .key = path.filename().string(),
        .destination = std::make_shared<LineSink>(
            counter, crlf ? LineSplitterConfig::Crlf() : LineSplitterConfig::Lf()),
        .listeners = {bar},
    });
    auto downloaded = download.Completion().get();
    if (!downloaded) {
        fmt::print(stderr, "download failed: {}\n", downloaded.error().message);
        return 1;
    }

    fmt::print("{} bytes, {} lines, etag {}\n", downloaded->content_length, counter->lines,
               downloaded->etag);
    return 0;
}
