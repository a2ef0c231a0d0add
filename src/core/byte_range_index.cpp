#include "chunkpack/byte_range_index.hpp"
#include "chunkpack/format.hpp"
#include <stdexcept>

namespace chunkpack {

namespace {

constexpr size_t RUN_COUNT_SIZE = 4;
constexpr size_t RUN_SIZE = 16;

}  // namespace

Status ByteRangeIndex::append(uint64_t bytes_per_sample, uint64_t run_length) {
    if (run_length == 0) {
        return Status::error(ErrorCode::InvalidRun, "Run length must be greater than 0");
    }

    runs_.push_back({bytes_per_sample, run_length});
    num_samples_ += run_length;
    num_bytes_ += bytes_per_sample * run_length;
    return Status::make_ok();
}

std::optional<Range> ByteRangeIndex::byte_range(uint64_t local_index) const {
    if (local_index >= num_samples_) {
        return std::nullopt;
    }

    uint64_t first_in_run = 0;
    uint64_t run_start = 0;
    for (const auto& run : runs_) {
        if (local_index < first_in_run + run.run_length) {
            uint64_t offset = run_start + (local_index - first_in_run) * run.bytes_per_sample;
            return Range{offset, run.bytes_per_sample};
        }
        first_in_run += run.run_length;
        run_start += run.run_length * run.bytes_per_sample;
    }

    return std::nullopt;
}

size_t ByteRangeIndex::nbytes() const noexcept {
    return RUN_COUNT_SIZE + runs_.size() * RUN_SIZE;
}

void ByteRangeIndex::encode(ByteBuffer& buf) const {
    format::Codec::encode_u32(buf, static_cast<uint32_t>(runs_.size()));
    for (const auto& run : runs_) {
        format::Codec::encode_u64(buf, run.bytes_per_sample);
        format::Codec::encode_u64(buf, run.run_length);
    }
}

ByteRangeIndex ByteRangeIndex::decode(ByteView data) {
    using format::Codec;

    uint32_t count = Codec::decode_u32(data);
    if (static_cast<uint64_t>(count) * RUN_SIZE != data.size()) {
        throw std::runtime_error("Byte range index size does not match its run count");
    }

    ByteRangeIndex index;
    index.runs_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint64_t bytes_per_sample = Codec::decode_u64(data);
        uint64_t run_length = Codec::decode_u64(data);
        if (!index.append(bytes_per_sample, run_length)) {
            throw std::runtime_error("Byte range index holds an empty run");
        }
    }
    return index;
}

}  // namespace chunkpack
