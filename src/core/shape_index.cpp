#include "chunkpack/shape_index.hpp"
#include "chunkpack/format.hpp"
#include <stdexcept>

namespace chunkpack {

namespace {

// u32 ndim + u64 run_length, dims excluded
constexpr size_t RUN_FIXED_SIZE = 12;
constexpr size_t DIM_SIZE = 8;

}  // namespace

Status ShapeIndex::append(const SampleShape& shape, uint64_t run_length) {
    if (run_length == 0) {
        return Status::error(ErrorCode::InvalidRun, "Run length must be greater than 0");
    }
    if (shape.empty()) {
        return Status::error(ErrorCode::InvalidRun, "Sample shape must have at least one dimension");
    }

    runs_.push_back({shape, run_length});
    num_samples_ += run_length;
    return Status::make_ok();
}

std::optional<SampleShape> ShapeIndex::shape_at(uint64_t local_index) const {
    if (local_index >= num_samples_) {
        return std::nullopt;
    }

    uint64_t first_in_run = 0;
    for (const auto& run : runs_) {
        if (local_index < first_in_run + run.run_length) {
            return run.shape;
        }
        first_in_run += run.run_length;
    }

    return std::nullopt;
}

size_t ShapeIndex::nbytes() const noexcept {
    size_t total = 4;
    for (const auto& run : runs_) {
        total += RUN_FIXED_SIZE + run.shape.size() * DIM_SIZE;
    }
    return total;
}

void ShapeIndex::encode(ByteBuffer& buf) const {
    using format::Codec;

    Codec::encode_u32(buf, static_cast<uint32_t>(runs_.size()));
    for (const auto& run : runs_) {
        Codec::encode_u32(buf, static_cast<uint32_t>(run.shape.size()));
        for (uint64_t dim : run.shape) {
            Codec::encode_u64(buf, dim);
        }
        Codec::encode_u64(buf, run.run_length);
    }
}

ShapeIndex ShapeIndex::decode(ByteView data) {
    using format::Codec;

    uint32_t count = Codec::decode_u32(data);
    if (static_cast<uint64_t>(count) * RUN_FIXED_SIZE > data.size()) {
        throw std::runtime_error("Shape index run count exceeds its size");
    }

    ShapeIndex index;
    index.runs_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t ndim = Codec::decode_u32(data);
        if (static_cast<uint64_t>(ndim) * DIM_SIZE > data.size()) {
            throw std::runtime_error("Truncated shape");
        }

        SampleShape shape(ndim);
        for (auto& dim : shape) {
            dim = Codec::decode_u64(data);
        }
        uint64_t run_length = Codec::decode_u64(data);

        if (!index.append(shape, run_length)) {
            throw std::runtime_error("Shape index holds an empty run or shape");
        }
    }

    if (!data.empty()) {
        throw std::runtime_error("Trailing bytes after shape index");
    }
    return index;
}

}  // namespace chunkpack
