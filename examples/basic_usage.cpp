/*
 * chunkpack Basic Usage Example
 *
 * This example demonstrates:
 * - Appending batches of samples to a chunk chain
 * - Overflow into chained chunks
 * - Reading samples back by stream ordinal
 * - Serializing a single chunk
 */

#include "chunkpack/chunkpack.hpp"
#include <iostream>
#include <numeric>

int main() {
    using namespace chunkpack;

    std::cout << "chunkpack Basic Usage Example\n";
    std::cout << "=============================\n\n";

    // Small chunks so overflow is easy to see
    Config config;
    config.chunk.max_data_bytes = 100;

    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid config: " << status.message() << "\n";
        return 1;
    }

    std::cout << "Configuration:\n";
    std::cout << "  Chunk capacity: " << config.chunk.max_data_bytes << " bytes\n";
    std::cout << "  Batches start below: " << config.chunk.max_data_bytes / 2 << " bytes\n\n";

    ChunkChain chain(config.chunk);
    SampleShape shape{4, 4};  // 16 one-byte elements per sample

    // Three batches of 3 samples (48 bytes each)
    for (int batch = 0; batch < 3; ++batch) {
        ByteBuffer data(48);
        std::iota(data.begin(), data.end(), static_cast<uint8_t>(batch * 48));

        auto result = chain.append(data, 3, shape);
        if (!result.ok()) {
            std::cerr << "Append failed: " << result.status.to_string() << "\n";
            return 1;
        }
        std::cout << "Batch " << batch << ": " << result.new_chunks.size() << " new chunk(s)\n";
    }

    std::cout << "\nChain holds " << chain.num_samples() << " samples in "
              << chain.num_chunks() << " chunks:\n";
    for (const auto& id : chain.chunk_ids()) {
        auto chunk = chain.get(id);
        std::cout << "  " << id.to_string() << "  "
                  << chunk->num_data_bytes() << "/" << chunk->max_data_bytes() << " bytes, "
                  << chunk->num_samples() << " samples"
                  << (chunk->is_sealed() ? ", sealed" : "") << "\n";
    }

    std::cout << "\nSample lookup:\n";
    for (uint64_t i : {0, 4, 8}) {
        auto ref = chain.locate(i);
        auto sample = chain.read_sample(i);
        if (!ref || !sample.ok()) {
            std::cerr << "Lookup of sample " << i << " failed\n";
            return 1;
        }
        std::cout << "  sample " << i << " -> chunk #" << ref->position
                  << " local " << ref->local_index
                  << ", shape " << shape_to_string(sample.shape)
                  << ", first byte " << static_cast<int>(sample.data.front()) << "\n";
    }

    auto blob = chain.get(chain.chunk_ids().front())->serialize();
    std::cout << "\nFirst chunk serializes to " << blob.size() << " bytes\n";

    std::cout << "\nExample complete.\n";
    return 0;
}
