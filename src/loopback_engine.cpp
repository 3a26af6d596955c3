// SPDX-License-Identifier: MIT

// src/loopback_engine.cpp
#include "src/loopback_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/chunked_publisher.hpp"
#include "src/end_of_stream.hpp"

namespace xfer_pipe {

namespace {

// Pulls an upload body one chunk at a time into a string
class BodyCollector : public Subscriber<ByteChunk> {
public:
    using Done = std::function<void(std::expected<std::string, Error>)>;

    explicit BodyCollector(Done done) : done_(std::move(done)) {}

    void OnSubscribe(std::shared_ptr<Subscription> subscription) override {
        if (subscription_) {
            subscription->Cancel();
            return;
        }
        subscription_ = subscription;
        subscription->Request(1);
    }

    void OnNext(ByteChunk chunk) override {
        body_.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
        if (subscription_) subscription_->Request(1);
    }

    void OnError(const Error& e) override {
        subscription_.reset();
        Finish(std::unexpected(e));
    }

    void OnComplete() override {
        subscription_.reset();
        Finish(std::move(body_));
    }

private:
    void Finish(std::expected<std::string, Error> result) {
        if (finished_.exchange(true)) return;
        if (done_) done_(std::move(result));
    }

    Done done_;
    std::string body_;
    std::shared_ptr<Subscription> subscription_;
    std::atomic<bool> finished_{false};
};

}  // namespace

LoopbackTransferEngine::LoopbackTransferEngine(LoopbackEngineConfig config) : config_(config) {
    if (config_.chunk_size == 0) {
        throw std::invalid_argument("LoopbackEngineConfig::chunk_size must be positive");
    }
}

void LoopbackTransferEngine::PutObject(const ObjectRef& object,
                                       std::shared_ptr<ByteSource> body,
                                       PutCallback callback) {
    if (!body) {
        callback(std::unexpected(Error{ErrorCode::InvalidArgument, "PutObject requires a body"}));
        return;
    }
    auto collector = std::make_shared<BodyCollector>(
        [this, object, callback](std::expected<std::string, Error> result) {
            if (!result) {
                callback(std::unexpected(result.error()));
                return;
            }
            PutObjectResult put{ComputeEtag(*result), result->size()};
            Store(object, std::move(*result));
            callback(std::move(put));
        });
    body->Subscribe(std::move(collector));
}

void LoopbackTransferEngine::GetObject(const ObjectRef& object,
                                       std::shared_ptr<ByteSink> sink,
                                       GetCallback callback) {
    if (!sink) {
        callback(std::unexpected(Error{ErrorCode::InvalidArgument, "GetObject requires a sink"}));
        return;
    }

    StoredObject stored;
    {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(Key{object.bucket, object.key});
        if (it == objects_.end()) {
            callback(std::unexpected(Error{ErrorCode::NotFound,
                fmt::format("No object {}/{}", object.bucket, object.key)}));
            return;
        }
        stored = it->second;
    }

    std::vector<ByteChunk> chunks;
    for (std::size_t offset = 0; offset < stored.data.size(); offset += config_.chunk_size) {
        auto len = std::min(config_.chunk_size, stored.data.size() - offset);
        chunks.push_back(ToChunk(std::string_view(stored.data).substr(offset, len)));
    }

    GetObjectResult get{stored.etag, stored.data.size()};
    auto wrapped = EndOfStreamSink::Create(std::move(sink),
        [callback, get](StreamResult result) {
            if (!result) {
                callback(std::unexpected(result.error()));
                return;
            }
            callback(get);
        });

    wrapped->OnResponse(ResponseMetadata{get.content_length, get.etag});
    auto publisher = std::make_shared<ChunkedPublisher<ByteChunk>>(std::move(chunks));
    publisher->Subscribe(std::move(wrapped));
}

void LoopbackTransferEngine::Store(const ObjectRef& object, std::string data) {
    auto etag = ComputeEtag(data);
    std::lock_guard lock(mutex_);
    objects_[Key{object.bucket, object.key}] = StoredObject{std::move(data), std::move(etag)};
}

std::optional<std::string> LoopbackTransferEngine::Load(const ObjectRef& object) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(Key{object.bucket, object.key});
    if (it == objects_.end()) return std::nullopt;
    return it->second.data;
}

std::size_t LoopbackTransferEngine::ObjectCount() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
}

std::string LoopbackTransferEngine::ComputeEtag(const std::string& data) {
    // FNV-1a, 64 bit
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return fmt::format("\"{:016x}\"", hash);
}

}  // namespace xfer_pipe
