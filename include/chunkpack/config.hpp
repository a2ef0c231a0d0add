#pragma once

#include "types.hpp"
#include <string>
#include <filesystem>

namespace chunkpack {

// Chunk packing configuration
struct ChunkConfig {
    size_t max_data_bytes = DEFAULT_CHUNK_MAX_SIZE;  // 16MB default
};

// Disk storage configuration
struct StorageConfig {
    std::filesystem::path path = "./chunkpack-data";
    bool sync_writes = false;  // fsync each blob after writing
};

struct LoggingConfig {
    bool verbose = false;
};

// Main configuration
struct Config {
    ChunkConfig chunk;
    StorageConfig storage;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::filesystem::path& path);
    static Config load_json(const std::string& json);

    // Save to file
    void save(const std::filesystem::path& path) const;
    std::string to_json() const;

    // Validation
    Status validate() const;
};

}  // namespace chunkpack
