#pragma once

#include "storage.hpp"
#include <elio/sync/primitives.hpp>
#include <atomic>
#include <unordered_map>

namespace chunkpack {

// In-process blob store
class MemoryChunkStorage : public IChunkStorage {
public:
    MemoryChunkStorage() = default;
    ~MemoryChunkStorage() override;

    elio::coro::task<std::optional<ByteBuffer>> load(const ChunkId& id) override;
    elio::coro::task<Status> store(const ChunkId& id, ByteView blob) override;
    elio::coro::task<bool> exists(const ChunkId& id) override;
    elio::coro::task<Status> remove(const ChunkId& id) override;

    Stats stats() const override;

private:
    mutable elio::sync::shared_mutex mutex_;
    std::unordered_map<ChunkId, ByteBuffer> blobs_;
    size_t size_bytes_ = 0;

    mutable std::atomic<uint64_t> loads_{0};
    mutable std::atomic<uint64_t> stores_{0};
    mutable std::atomic<uint64_t> misses_{0};
    mutable std::atomic<uint64_t> bytes_read_{0};
    mutable std::atomic<uint64_t> bytes_written_{0};
};

}  // namespace chunkpack
