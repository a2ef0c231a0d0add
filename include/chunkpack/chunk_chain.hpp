#pragma once

#include "types.hpp"
#include "chunk.hpp"
#include "config.hpp"
#include "storage.hpp"
#include <elio/coro/task.hpp>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace chunkpack {

// Result of ChunkChain::append
struct AppendResult {
    Status status;
    std::vector<ChunkId> new_chunks;  // Chunks added to the chain, in order

    bool ok() const noexcept { return status.ok(); }
};

// Where a stream-wide sample ordinal lives
struct SampleRef {
    ChunkId chunk;
    size_t position = 0;       // Index of the chunk in chain order
    uint64_t local_index = 0;  // Ordinal within that chunk's indexes
};

struct SampleReadResult {
    Status status;
    ByteBuffer data;
    SampleShape shape;

    bool ok() const noexcept { return status.ok(); }
};

// The chunks of one logical stream (e.g. one tensor): an arena of chunks keyed
// by id plus the ordered id list that defines the chain. Consecutive chunks
// are always linked, so every chunk but the tail is sealed.
//
// Not synchronized: one writer per chain.
class ChunkChain {
public:
    explicit ChunkChain(const ChunkConfig& config = {});

    // Append a batch of `num_samples` equally sized samples to the tail,
    // starting a new chunk when the tail has no space left. New chunks take
    // the tail's capacity, or the configured one for an empty chain.
    AppendResult append(ByteView buffer, uint64_t num_samples, const SampleShape& shape);

    std::optional<SampleRef> locate(uint64_t global_index) const;

    // Copy out one sample's bytes, following successors if it straddles chunks
    SampleReadResult read_sample(uint64_t global_index) const;

    uint64_t num_samples() const noexcept;
    size_t num_chunks() const noexcept { return order_.size(); }
    bool empty() const noexcept { return order_.empty(); }

    // Ordered ids, as handed to load() later
    const std::vector<ChunkId>& chunk_ids() const noexcept { return order_; }

    SharedChunk get(const ChunkId& id) const;
    SharedChunk tail() const;

    // Chunks modified since the last flush
    size_t num_dirty() const noexcept { return dirty_.size(); }

    // Store every modified chunk, in chain order
    elio::coro::task<Status> flush(IChunkStorage& storage);

    // Replace this chain with the chunks stored under `ids` (chain order).
    // Successor links are rebuilt from the list. Unchanged on failure.
    elio::coro::task<Status> load(IChunkStorage& storage, std::vector<ChunkId> ids);

private:
    ChunkConfig config_;
    std::unordered_map<ChunkId, SharedChunk> arena_;
    std::vector<ChunkId> order_;
    std::unordered_set<ChunkId> dirty_;

    void add_chunk(SharedChunk chunk);
};

}  // namespace chunkpack
