#pragma once

#include "types.hpp"
#include <elio/coro/task.hpp>
#include <optional>

namespace chunkpack {

// Persists serialized chunk blobs under their chunk ids. Chunks never pick
// their own keys or decide when to be written; ChunkChain drives that.
class IChunkStorage {
public:
    virtual ~IChunkStorage() = default;

    virtual elio::coro::task<std::optional<ByteBuffer>> load(const ChunkId& id) = 0;
    virtual elio::coro::task<Status> store(const ChunkId& id, ByteView blob) = 0;
    virtual elio::coro::task<bool> exists(const ChunkId& id) = 0;
    virtual elio::coro::task<Status> remove(const ChunkId& id) = 0;

    struct Stats {
        uint64_t loads = 0;
        uint64_t stores = 0;
        uint64_t misses = 0;
        uint64_t bytes_read = 0;
        uint64_t bytes_written = 0;
        size_t blob_count = 0;
        size_t size_bytes = 0;
    };

    virtual Stats stats() const = 0;
};

}  // namespace chunkpack
