#pragma once

// Main chunkpack header - includes everything needed

#include "types.hpp"
#include "config.hpp"
#include "format.hpp"
#include "byte_range_index.hpp"
#include "shape_index.hpp"
#include "chunk.hpp"
#include "chunk_chain.hpp"
#include "storage.hpp"
#include "memory_storage.hpp"
#include "disk_storage.hpp"
#include "metrics.hpp"

namespace chunkpack {

// Version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static const char* string() { return "0.1.0"; }
};

}  // namespace chunkpack
