// SPDX-License-Identifier: MIT

// src/loopback_engine.hpp
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "src/transfer_engine.hpp"

namespace xfer_pipe {

struct LoopbackEngineConfig {
    std::size_t chunk_size = 64 * 1024;  // Bytes per downloaded chunk
};

// LoopbackTransferEngine - in-process TransferEngine backed by a map.
//
// Uploads pull the body one chunk at a time and store it when the source
// completes. Downloads replay the stored body in chunk_size pieces through a
// demand-honouring publisher. Everything runs on the caller's thread, so the
// callback has usually fired by the time PutObject()/GetObject() returns.
class LoopbackTransferEngine : public TransferEngine {
public:
    explicit LoopbackTransferEngine(LoopbackEngineConfig config = {});

    void PutObject(const ObjectRef& object,
                   std::shared_ptr<ByteSource> body,
                   PutCallback callback) override;

    void GetObject(const ObjectRef& object,
                   std::shared_ptr<ByteSink> sink,
                   GetCallback callback) override;

    /// Seed or replace an object directly.
    void Store(const ObjectRef& object, std::string data);

    /// Stored body, or nullopt when absent.
    std::optional<std::string> Load(const ObjectRef& object) const;

    std::size_t ObjectCount() const;

    const LoopbackEngineConfig& config() const { return config_; }

private:
    struct StoredObject {
        std::string data;
        std::string etag;
    };

    using Key = std::pair<std::string, std::string>;

    static std::string ComputeEtag(const std::string& data);

    LoopbackEngineConfig config_;
    mutable std::mutex mutex_;
    std::map<Key, StoredObject> objects_;
};

}  // namespace xfer_pipe
