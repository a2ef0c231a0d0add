#pragma once

#include "types.hpp"
#include "byte_range_index.hpp"
#include "shape_index.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace chunkpack {

class Chunk;

using SharedChunk = std::shared_ptr<Chunk>;

// Result of Chunk::extend
struct ExtendResult {
    Status status;
    std::vector<SharedChunk> spawned;  // New chunks in chain order

    bool ok() const noexcept { return status.ok(); }
};

// Location of one sample, as recorded by the chunk its batch started in.
// `range` is relative to this chunk's payload followed by the payloads of its
// successors, so it may reach past num_data_bytes() when the sample straddles
// a chunk boundary.
struct SampleLocation {
    Status status;
    Range range;
    SampleShape shape;

    bool ok() const noexcept { return status.ok(); }
};

// A capacity-bounded payload buffer with a shape index, a byte range index and
// a link to its successor.
//
// Batches are only started while the chunk is below half capacity
// (has_space()). A batch that does not fit spills into freshly spawned
// children; its index runs stay on the chunk the batch started in. Once a
// successor is linked the chunk is sealed and rejects any further extend.
//
// Not synchronized: one writer per chain.
class Chunk {
public:
    explicit Chunk(size_t max_data_bytes = DEFAULT_CHUNK_MAX_SIZE);
    Chunk(const ChunkId& id, size_t max_data_bytes);

    // Move-only (large data)
    Chunk(Chunk&&) = default;
    Chunk& operator=(Chunk&&) = default;
    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    const ChunkId& id() const noexcept { return id_; }

    size_t max_data_bytes() const noexcept { return max_data_bytes_; }
    size_t min_data_bytes_target() const noexcept { return max_data_bytes_ / 2; }

    uint64_t num_samples() const noexcept { return byte_ranges_.num_samples(); }
    size_t num_data_bytes() const noexcept { return data_.size(); }
    bool has_space() const noexcept { return data_.size() < min_data_bytes_target(); }

    // Leading payload bytes that finish a predecessor's batch
    uint64_t continuation_bytes() const noexcept { return continuation_bytes_; }

    bool is_sealed() const noexcept { return next_.has_value(); }
    const std::optional<ChunkId>& next() const noexcept { return next_; }

    ByteView data() const noexcept { return {data_.data(), data_.size()}; }
    const ShapeIndex& shapes() const noexcept { return shapes_; }
    const ByteRangeIndex& byte_ranges() const noexcept { return byte_ranges_; }

    // Append `num_samples` samples of `sample_shape` held in `buffer`.
    // With is_continuation set the bytes finish a batch recorded on a
    // predecessor: no index runs are written and the soft threshold is not
    // checked. Bytes that do not fit go to new chunks, returned in order.
    ExtendResult extend(ByteView buffer,
                        uint64_t num_samples,
                        const SampleShape& sample_shape,
                        bool is_continuation = false);

    // Set the successor. Fails with SealedChunk if one is already set.
    Status link(const ChunkId& next);

    SampleLocation sample_at(uint64_t local_index) const;

    // Read a portion of this chunk's payload (clamped to what is present)
    ByteBuffer read(uint64_t offset, uint64_t length) const;

    // Serialized footprint, computed without serializing
    size_t size_in_bytes() const noexcept;

    // The successor link is not part of the blob
    ByteBuffer serialize() const;

    // Replace indexes, payload and capacity with the blob's contents.
    // Leaves the chunk untouched on failure.
    Status deserialize(ByteView blob);

    // Index and payload equality; ignores id and successor
    bool same_contents(const Chunk& other) const noexcept;

private:
    ChunkId id_;
    size_t max_data_bytes_;
    ByteBuffer data_;
    ShapeIndex shapes_;
    ByteRangeIndex byte_ranges_;
    uint64_t continuation_bytes_ = 0;
    std::optional<ChunkId> next_;

    Status record_batch(size_t num_bytes, uint64_t num_samples, const SampleShape& shape);
    size_t fill(ByteView incoming, bool is_continuation);
    size_t chunks_needed(size_t num_bytes) const noexcept;
    SharedChunk spawn_child();
};

}  // namespace chunkpack
