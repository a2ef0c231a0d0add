#pragma once

#include "types.hpp"
#include <optional>
#include <vector>

namespace chunkpack {

// One run of consecutive samples sharing a shape
struct ShapeRun {
    SampleShape shape;
    uint64_t run_length = 0;

    bool operator==(const ShapeRun& other) const noexcept {
        return run_length == other.run_length && shape == other.shape;
    }
};

// Run-length encoded map from chunk-local sample ordinal to sample shape
class ShapeIndex {
public:
    ShapeIndex() = default;

    Status append(const SampleShape& shape, uint64_t run_length);

    std::optional<SampleShape> shape_at(uint64_t local_index) const;

    uint64_t num_samples() const noexcept { return num_samples_; }
    size_t num_runs() const noexcept { return runs_.size(); }
    const std::vector<ShapeRun>& runs() const noexcept { return runs_; }
    bool empty() const noexcept { return runs_.empty(); }

    // Size of encode() output
    size_t nbytes() const noexcept;

    void encode(ByteBuffer& buf) const;
    static ShapeIndex decode(ByteView data);

    bool operator==(const ShapeIndex& other) const noexcept {
        return runs_ == other.runs_;
    }

private:
    std::vector<ShapeRun> runs_;
    uint64_t num_samples_ = 0;
};

}  // namespace chunkpack
