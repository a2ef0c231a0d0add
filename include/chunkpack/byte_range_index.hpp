#pragma once

#include "types.hpp"
#include <optional>
#include <vector>

namespace chunkpack {

// One run of samples that all occupy the same number of bytes
struct ByteRangeRun {
    uint64_t bytes_per_sample = 0;
    uint64_t run_length = 0;

    bool operator==(const ByteRangeRun& other) const noexcept {
        return bytes_per_sample == other.bytes_per_sample && run_length == other.run_length;
    }
};

// Maps a chunk-local sample ordinal to its byte range in the payload.
// Samples are laid out back to back in append order, so a sample's offset
// is the prefix sum of bytes_per_sample * run_length over earlier runs.
class ByteRangeIndex {
public:
    ByteRangeIndex() = default;

    // Append `run_length` samples of `bytes_per_sample` bytes each
    Status append(uint64_t bytes_per_sample, uint64_t run_length);

    // Range of the sample, relative to the first byte described by this index
    std::optional<Range> byte_range(uint64_t local_index) const;

    uint64_t num_samples() const noexcept { return num_samples_; }
    uint64_t num_bytes() const noexcept { return num_bytes_; }
    size_t num_runs() const noexcept { return runs_.size(); }
    const std::vector<ByteRangeRun>& runs() const noexcept { return runs_; }
    bool empty() const noexcept { return runs_.empty(); }

    // Size of encode() output
    size_t nbytes() const noexcept;

    void encode(ByteBuffer& buf) const;
    static ByteRangeIndex decode(ByteView data);

    bool operator==(const ByteRangeIndex& other) const noexcept {
        return runs_ == other.runs_;
    }

private:
    std::vector<ByteRangeRun> runs_;
    uint64_t num_samples_ = 0;
    uint64_t num_bytes_ = 0;
};

}  // namespace chunkpack
