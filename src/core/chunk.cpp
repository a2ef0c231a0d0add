#include "chunkpack/chunk.hpp"
#include "chunkpack/format.hpp"
#include "chunkpack/metrics.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunkpack {

Chunk::Chunk(size_t max_data_bytes) : Chunk(ChunkId::generate(), max_data_bytes) {}

Chunk::Chunk(const ChunkId& id, size_t max_data_bytes)
    : id_(id)
    , max_data_bytes_(max_data_bytes)
{
    if (max_data_bytes_ < MIN_CHUNK_MAX_SIZE) {
        throw std::invalid_argument("Chunk capacity must be at least " +
                                    std::to_string(MIN_CHUNK_MAX_SIZE) + " bytes");
    }
}

ExtendResult Chunk::extend(ByteView buffer,
                           uint64_t num_samples,
                           const SampleShape& sample_shape,
                           bool is_continuation)
{
    CHUNKPACK_TIME_OPERATION(metrics().extend_latency_ms);
    metrics().extend_calls_total.inc();

    ExtendResult result;
    if (next_) {
        result.status = Status::error(ErrorCode::SealedChunk,
            "Cannot extend a chunk that is connected to the next chunk");
    } else if (is_continuation) {
        if (byte_ranges_.num_samples() > 0) {
            result.status = Status::error(ErrorCode::InvalidBatch,
                "Continuation bytes must precede any batch recorded on this chunk");
        }
    } else if (!has_space()) {
        result.status = Status::error(ErrorCode::NoSpace,
            "Cannot start a batch on a chunk holding " + std::to_string(data_.size()) +
            " of " + std::to_string(max_data_bytes_) + " bytes");
    } else {
        // Headers go in before any payload byte: an index ahead of the data is
        // recoverable, data missing from the index is not.
        result.status = record_batch(buffer.size(), num_samples, sample_shape);
    }

    if (!result.ok()) {
        metrics().extend_errors_total.inc();
        return result;
    }

    size_t processed = fill(buffer, is_continuation);
    ByteView remaining = buffer.subspan(processed);

    Chunk* tail = this;
    while (!remaining.empty()) {
        auto child = tail->spawn_child();
        size_t copied = child->fill(remaining, true);
        remaining = remaining.subspan(copied);
        tail = child.get();
        result.spawned.push_back(std::move(child));
    }

    return result;
}

Status Chunk::record_batch(size_t num_bytes, uint64_t num_samples, const SampleShape& shape) {
    if (num_samples == 0) {
        return Status::error(ErrorCode::InvalidBatch,
            "The number of samples a buffer represents has to be greater than 0");
    }
    if (num_bytes % num_samples != 0) {
        return Status::error(ErrorCode::InvalidBatch,
            "Buffer length " + std::to_string(num_bytes) +
            " is not divisible by the number of samples " + std::to_string(num_samples));
    }

    auto status = shapes_.append(shape, num_samples);
    if (!status) {
        return status;
    }
    status = byte_ranges_.append(num_bytes / num_samples, num_samples);
    if (!status) {
        return status;
    }

    metrics().batches_recorded_total.inc();
    metrics().samples_recorded_total.inc(num_samples);
    return Status::make_ok();
}

size_t Chunk::fill(ByteView incoming, bool is_continuation) {
    size_t room = max_data_bytes_ - data_.size();
    size_t fits = std::min(incoming.size(), room);

    // If topping up this chunk would need more chunks overall than writing the
    // bytes into empty ones, leave it alone and forward everything.
    if (chunks_needed(incoming.size()) != chunks_needed(incoming.size() + data_.size())) {
        return 0;
    }

    data_.insert(data_.end(), incoming.begin(), incoming.begin() + fits);
    if (is_continuation) {
        continuation_bytes_ += fits;
    }
    metrics().bytes_packed_total.inc(fits);
    return fits;
}

size_t Chunk::chunks_needed(size_t num_bytes) const noexcept {
    return (num_bytes + max_data_bytes_ - 1) / max_data_bytes_;
}

SharedChunk Chunk::spawn_child() {
    auto child = std::make_shared<Chunk>(max_data_bytes_);
    next_ = child->id();
    metrics().chunks_spawned_total.inc();
    return child;
}

Status Chunk::link(const ChunkId& next) {
    if (next_) {
        return Status::error(ErrorCode::SealedChunk,
            "Chunk " + id_.to_string() + " is already linked to " + next_->to_string());
    }
    if (!next.is_valid()) {
        return Status::error(ErrorCode::InvalidArgument, "Cannot link to an invalid chunk id");
    }
    next_ = next;
    return Status::make_ok();
}

SampleLocation Chunk::sample_at(uint64_t local_index) const {
    SampleLocation loc;

    auto range = byte_ranges_.byte_range(local_index);
    auto shape = shapes_.shape_at(local_index);
    if (!range || !shape) {
        loc.status = Status::error(ErrorCode::IndexOutOfRange,
            "Sample " + std::to_string(local_index) + " out of range, chunk holds " +
            std::to_string(num_samples()));
        return loc;
    }

    loc.range = {range->offset + continuation_bytes_, range->length};
    loc.shape = std::move(*shape);
    return loc;
}

ByteBuffer Chunk::read(uint64_t offset, uint64_t length) const {
    if (offset >= data_.size()) {
        return {};
    }

    size_t actual_length = std::min(static_cast<size_t>(length),
                                    data_.size() - static_cast<size_t>(offset));
    return ByteBuffer(data_.begin() + offset, data_.begin() + offset + actual_length);
}

size_t Chunk::size_in_bytes() const noexcept {
    return shapes_.nbytes() + byte_ranges_.nbytes() + data_.size() + CHUNK_CONTAINER_OVERHEAD;
}

ByteBuffer Chunk::serialize() const {
    using format::Codec;
    CHUNKPACK_TIME_OPERATION(metrics().serialize_latency_ms);

    ByteBuffer buf;
    buf.reserve(size_in_bytes());

    format::ChunkHeader hdr;
    hdr.max_data_bytes = max_data_bytes_;
    hdr.continuation_bytes = continuation_bytes_;
    Codec::encode_header(buf, hdr);

    ByteBuffer section;
    shapes_.encode(section);
    Codec::encode_section(buf, section);

    section.clear();
    byte_ranges_.encode(section);
    Codec::encode_section(buf, section);

    Codec::encode_u64(buf, data_.size());
    buf.insert(buf.end(), data_.begin(), data_.end());

    Codec::encode_u64(buf, Codec::checksum(buf));

    metrics().chunks_serialized_total.inc();
    return buf;
}

Status Chunk::deserialize(ByteView blob) {
    using format::Codec;

    try {
        if (blob.size() < CHUNK_CONTAINER_OVERHEAD) {
            throw std::runtime_error("Truncated chunk blob of " + std::to_string(blob.size()) + " bytes");
        }

        ByteView body = blob.first(blob.size() - 8);
        ByteView trailer = blob.subspan(blob.size() - 8);
        if (Codec::checksum(body) != Codec::decode_u64(trailer)) {
            throw std::runtime_error("Checksum mismatch");
        }

        auto hdr = Codec::decode_header(body);
        if (hdr.max_data_bytes < MIN_CHUNK_MAX_SIZE) {
            throw std::runtime_error("Invalid chunk capacity " + std::to_string(hdr.max_data_bytes));
        }

        auto shapes = ShapeIndex::decode(Codec::decode_section(body));
        auto byte_ranges = ByteRangeIndex::decode(Codec::decode_section(body));

        uint64_t payload_len = Codec::decode_u64(body);
        ByteView payload = Codec::take(body, payload_len, "payload");
        if (!body.empty()) {
            throw std::runtime_error("Trailing bytes after payload");
        }

        if (payload.size() > hdr.max_data_bytes) {
            throw std::runtime_error("Payload exceeds chunk capacity");
        }
        if (hdr.continuation_bytes > payload.size()) {
            throw std::runtime_error("Continuation bytes exceed payload");
        }
        if (shapes.num_samples() != byte_ranges.num_samples()) {
            throw std::runtime_error("Shape and byte range indexes disagree on sample count");
        }

        max_data_bytes_ = static_cast<size_t>(hdr.max_data_bytes);
        continuation_bytes_ = hdr.continuation_bytes;
        shapes_ = std::move(shapes);
        byte_ranges_ = std::move(byte_ranges);
        data_.assign(payload.begin(), payload.end());
    } catch (const std::runtime_error& e) {
        metrics().deserialize_errors_total.inc();
        return Status::error(ErrorCode::Deserialization, e.what());
    }

    metrics().chunks_deserialized_total.inc();
    return Status::make_ok();
}

bool Chunk::same_contents(const Chunk& other) const noexcept {
    return max_data_bytes_ == other.max_data_bytes_ &&
           continuation_bytes_ == other.continuation_bytes_ &&
           shapes_ == other.shapes_ &&
           byte_ranges_ == other.byte_ranges_ &&
           data_ == other.data_;
}

}  // namespace chunkpack
