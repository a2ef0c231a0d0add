#include <catch2/catch_test_macros.hpp>
#include "chunkpack/chunk.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace chunkpack;
using chunkpack::testing::make_bytes;

namespace {

// The chunk followed by everything it spawned
std::vector<const Chunk*> chain_of(const Chunk& head, const ExtendResult& result) {
    std::vector<const Chunk*> chain{&head};
    for (const auto& child : result.spawned) {
        chain.push_back(child.get());
    }
    return chain;
}

ByteBuffer concat_payloads(const std::vector<const Chunk*>& chain) {
    ByteBuffer all;
    for (const auto* chunk : chain) {
        auto data = chunk->data();
        all.insert(all.end(), data.begin(), data.end());
    }
    return all;
}

}  // namespace

TEST_CASE("Chunk construction", "[chunk]") {
    SECTION("Fresh chunk is empty") {
        Chunk chunk(100);
        REQUIRE(chunk.id().is_valid());
        REQUIRE(chunk.max_data_bytes() == 100);
        REQUIRE(chunk.min_data_bytes_target() == 50);
        REQUIRE(chunk.num_samples() == 0);
        REQUIRE(chunk.num_data_bytes() == 0);
        REQUIRE(chunk.has_space());
        REQUIRE_FALSE(chunk.is_sealed());
        REQUIRE_FALSE(chunk.next().has_value());
    }

    SECTION("Default capacity") {
        Chunk chunk;
        REQUIRE(chunk.max_data_bytes() == DEFAULT_CHUNK_MAX_SIZE);
    }

    SECTION("Capacity below two bytes is rejected") {
        REQUIRE_THROWS_AS(Chunk(1), std::invalid_argument);
        REQUIRE_THROWS_AS(Chunk(0), std::invalid_argument);
    }

    SECTION("Explicit id") {
        auto id = ChunkId::generate();
        Chunk chunk(id, 64);
        REQUIRE(chunk.id() == id);
    }
}

TEST_CASE("Batch fits in one chunk", "[chunk]") {
    Chunk chunk(100);
    auto data = make_bytes(60);

    auto result = chunk.extend(data, 1, {10, 6});

    REQUIRE(result.ok());
    REQUIRE(result.spawned.empty());
    REQUIRE(chunk.num_data_bytes() == 60);
    REQUIRE(chunk.num_samples() == 1);
    REQUIRE_FALSE(chunk.is_sealed());

    auto loc = chunk.sample_at(0);
    REQUIRE(loc.ok());
    REQUIRE(loc.range == Range{0, 60});
    REQUIRE(loc.shape == SampleShape{10, 6});
    REQUIRE(chunk.read(0, 60) == data);
}

TEST_CASE("Partial fill that would add a chunk is skipped", "[chunk]") {
    Chunk chunk(100);
    REQUIRE(chunk.extend(make_bytes(40), 1, {40}).ok());
    REQUIRE(chunk.has_space());

    auto batch = make_bytes(80, 40);
    auto result = chunk.extend(batch, 1, {80});

    REQUIRE(result.ok());
    REQUIRE(result.spawned.size() == 1);

    // Nothing copied here, the whole batch lives in the child
    REQUIRE(chunk.num_data_bytes() == 40);
    const auto& child = *result.spawned[0];
    REQUIRE(child.num_data_bytes() == 80);
    REQUIRE(child.read(0, 80) == batch);
    REQUIRE(child.continuation_bytes() == 80);
    REQUIRE(child.num_samples() == 0);

    // Header stays on the originating chunk, which is now sealed
    REQUIRE(chunk.num_samples() == 2);
    REQUIRE(chunk.is_sealed());
    REQUIRE(chunk.next() == child.id());

    auto loc = chunk.sample_at(1);
    REQUIRE(loc.ok());
    REQUIRE(loc.range == Range{40, 80});
    REQUIRE(loc.shape == SampleShape{80});
}

TEST_CASE("Oversized batch spills into a chain", "[chunk]") {
    Chunk chunk(100);
    auto data = make_bytes(250);

    auto result = chunk.extend(data, 5, {10, 10});

    REQUIRE(result.ok());
    REQUIRE(result.spawned.size() == 2);

    auto chain = chain_of(chunk, result);
    REQUIRE(chain[0]->num_data_bytes() == 100);
    REQUIRE(chain[1]->num_data_bytes() == 100);
    REQUIRE(chain[2]->num_data_bytes() == 50);
    REQUIRE(concat_payloads(chain) == data);

    SECTION("Links follow chain order") {
        REQUIRE(chain[0]->next() == chain[1]->id());
        REQUIRE(chain[1]->next() == chain[2]->id());
        REQUIRE_FALSE(chain[2]->is_sealed());
    }

    SECTION("Metadata recorded once on the originating chunk") {
        REQUIRE(chunk.shapes().num_runs() == 1);
        REQUIRE(chunk.shapes().runs()[0] == ShapeRun{{10, 10}, 5});
        REQUIRE(chunk.byte_ranges().runs()[0] == ByteRangeRun{50, 5});
        REQUIRE(chain[1]->num_samples() == 0);
        REQUIRE(chain[2]->num_samples() == 0);
    }

    SECTION("Children hold continuation bytes only") {
        REQUIRE(chain[1]->continuation_bytes() == 100);
        REQUIRE(chain[2]->continuation_bytes() == 50);
    }

    SECTION("Sample ranges are relative to the chain") {
        REQUIRE(chunk.sample_at(1).range == Range{50, 50});
        REQUIRE(chunk.sample_at(2).range == Range{100, 50});
        REQUIRE(chunk.sample_at(4).range == Range{200, 50});
    }

    SECTION("Half full tail takes no new batch") {
        REQUIRE_FALSE(chain[2]->has_space());
    }
}

TEST_CASE("Invalid batches are rejected before any write", "[chunk]") {
    Chunk chunk(100);

    SECTION("Bytes not divisible by sample count") {
        auto result = chunk.extend(make_bytes(10), 3, {5});
        REQUIRE(result.status.code() == ErrorCode::InvalidBatch);
    }

    SECTION("Zero samples") {
        auto result = chunk.extend(make_bytes(10), 0, {5});
        REQUIRE(result.status.code() == ErrorCode::InvalidBatch);
    }

    SECTION("Empty shape") {
        auto result = chunk.extend(make_bytes(10), 1, {});
        REQUIRE(result.status.code() == ErrorCode::InvalidRun);
    }

    REQUIRE(chunk.num_samples() == 0);
    REQUIRE(chunk.num_data_bytes() == 0);
    REQUIRE(chunk.shapes().empty());
    REQUIRE(chunk.byte_ranges().empty());
}

TEST_CASE("Soft threshold gates new batches", "[chunk]") {
    Chunk chunk(100);

    SECTION("Below half capacity accepts a batch") {
        REQUIRE(chunk.extend(make_bytes(49), 1, {49}).ok());
        REQUIRE(chunk.has_space());
        REQUIRE(chunk.extend(make_bytes(10), 1, {10}).ok());
        REQUIRE(chunk.num_data_bytes() == 59);
    }

    SECTION("At half capacity rejects a batch") {
        REQUIRE(chunk.extend(make_bytes(50), 1, {50}).ok());
        REQUIRE_FALSE(chunk.has_space());

        auto result = chunk.extend(make_bytes(1), 1, {1});
        REQUIRE(result.status.code() == ErrorCode::NoSpace);
        REQUIRE(chunk.num_samples() == 1);
        REQUIRE(chunk.num_data_bytes() == 50);
    }
}

TEST_CASE("Sealed chunks reject extend", "[chunk]") {
    Chunk chunk(100);
    REQUIRE(chunk.extend(make_bytes(10), 1, {10}).ok());
    REQUIRE(chunk.link(ChunkId::generate()).ok());
    REQUIRE(chunk.is_sealed());

    SECTION("New batch") {
        auto result = chunk.extend(make_bytes(10), 1, {10});
        REQUIRE(result.status.code() == ErrorCode::SealedChunk);
    }

    SECTION("Continuation") {
        auto result = chunk.extend(make_bytes(10), 1, {10}, true);
        REQUIRE(result.status.code() == ErrorCode::SealedChunk);
    }

    SECTION("Relinking") {
        REQUIRE(chunk.link(ChunkId::generate()).code() == ErrorCode::SealedChunk);
    }

    REQUIRE(chunk.num_data_bytes() == 10);
    REQUIRE(chunk.num_samples() == 1);
}

TEST_CASE("Linking requires a valid id", "[chunk]") {
    Chunk chunk(100);
    REQUIRE(chunk.link(ChunkId{}).code() == ErrorCode::InvalidArgument);
    REQUIRE_FALSE(chunk.is_sealed());
}

TEST_CASE("Continuation bytes", "[chunk]") {
    Chunk chunk(100);

    SECTION("Skip headers and the threshold") {
        auto result = chunk.extend(make_bytes(70), 1, {70}, true);
        REQUIRE(result.ok());
        REQUIRE(chunk.num_data_bytes() == 70);
        REQUIRE(chunk.continuation_bytes() == 70);
        REQUIRE(chunk.num_samples() == 0);
        REQUIRE(chunk.shapes().empty());

        // Past the soft threshold, more continuation bytes still land
        REQUIRE(chunk.extend(make_bytes(20), 1, {20}, true).ok());
        REQUIRE(chunk.continuation_bytes() == 90);
    }

    SECTION("Own batches start after the continuation") {
        REQUIRE(chunk.extend(make_bytes(30), 1, {30}, true).ok());
        REQUIRE(chunk.extend(make_bytes(20, 100), 2, {10}).ok());

        auto loc = chunk.sample_at(1);
        REQUIRE(loc.ok());
        REQUIRE(loc.range == Range{40, 10});
        REQUIRE(chunk.read(loc.range.offset, loc.range.length) == make_bytes(10, 110));
    }

    SECTION("Not allowed after an own batch") {
        REQUIRE(chunk.extend(make_bytes(10), 1, {10}).ok());
        auto result = chunk.extend(make_bytes(10), 1, {10}, true);
        REQUIRE(result.status.code() == ErrorCode::InvalidBatch);
        REQUIRE(chunk.num_data_bytes() == 10);
    }
}

TEST_CASE("Sample straddling a chunk boundary", "[chunk]") {
    Chunk chunk(100);
    REQUIRE(chunk.extend(make_bytes(40), 1, {40}).ok());

    // 5 samples of 24 bytes: 60 fit here, the rest goes to one child
    auto batch = make_bytes(120, 40);
    auto result = chunk.extend(batch, 5, {4, 6});
    REQUIRE(result.ok());
    REQUIRE(result.spawned.size() == 1);
    REQUIRE(chunk.num_data_bytes() == 100);

    const auto& child = *result.spawned[0];
    REQUIRE(child.num_data_bytes() == 60);

    auto loc = chunk.sample_at(3);
    REQUIRE(loc.ok());
    REQUIRE(loc.range == Range{88, 24});
    REQUIRE(loc.shape == SampleShape{4, 6});

    // 12 bytes from this chunk, 12 from the child
    auto head = chunk.read(loc.range.offset, loc.range.length);
    REQUIRE(head.size() == 12);
    auto tail = child.read(0, loc.range.length - head.size());
    head.insert(head.end(), tail.begin(), tail.end());
    REQUIRE(head == make_bytes(24, 40 + 48));
}

TEST_CASE("Sample lookup out of range", "[chunk]") {
    Chunk chunk(100);
    REQUIRE(chunk.extend(make_bytes(20), 2, {10}).ok());

    REQUIRE(chunk.sample_at(1).ok());
    auto loc = chunk.sample_at(2);
    REQUIRE(loc.status.code() == ErrorCode::IndexOutOfRange);
}

TEST_CASE("Partial payload reads", "[chunk]") {
    Chunk chunk(100);
    REQUIRE(chunk.extend(make_bytes(10), 1, {10}).ok());

    SECTION("Inside the payload") {
        auto part = chunk.read(2, 5);
        REQUIRE(part.size() == 5);
        REQUIRE(part[0] == 2);
        REQUIRE(part[4] == 6);
    }

    SECTION("Clamped at the end") {
        REQUIRE(chunk.read(8, 10).size() == 2);
    }

    SECTION("Past the end") {
        REQUIRE(chunk.read(10, 1).empty());
    }
}

TEST_CASE("Extend never loses or duplicates bytes", "[chunk]") {
    const std::vector<size_t> capacities{2, 3, 5, 16, 100};
    for (size_t capacity : capacities) {
        for (size_t prefill : {size_t{0}, size_t{1}, capacity / 2 - 1}) {
            if (prefill >= capacity / 2) continue;
            for (size_t length : {size_t{1}, capacity - 1, capacity, capacity + 1, 3 * capacity + 7}) {

                Chunk chunk(capacity);
                ByteBuffer expected;
                if (prefill > 0) {
                    auto first = make_bytes(prefill, 200);
                    REQUIRE(chunk.extend(first, 1, {prefill}).ok());
                    expected = first;
                }
                REQUIRE(chunk.has_space());

                auto batch = make_bytes(length);
                auto result = chunk.extend(batch, 1, {length});
                REQUIRE(result.ok());
                expected.insert(expected.end(), batch.begin(), batch.end());

                auto chain = chain_of(chunk, result);
                REQUIRE(concat_payloads(chain) == expected);

                for (size_t i = 0; i < chain.size(); ++i) {
                    REQUIRE(chain[i]->num_data_bytes() <= capacity);
                    if (i + 1 < chain.size()) {
                        REQUIRE(chain[i]->next() == chain[i + 1]->id());
                    } else {
                        REQUIRE_FALSE(chain[i]->is_sealed());
                    }
                    if (i > 0) {
                        REQUIRE(chain[i]->num_data_bytes() > 0);
                        REQUIRE(chain[i]->num_samples() == 0);
                    }
                }

                // Only the fragmentation check may leave room behind
                size_t chunks_for_batch = (length + capacity - 1) / capacity;
                REQUIRE(result.spawned.size() <= chunks_for_batch);
            }
        }
    }
}

TEST_CASE("Index entries agree with sample shapes", "[chunk]") {
    struct Batch {
        SampleShape shape;
        uint64_t item_size;
        uint64_t num_samples;
    };
    const std::vector<Batch> batches{
        {{2, 3}, 4, 5},
        {{10}, 1, 3},
        {{4, 4, 2}, 2, 2},
        {{7}, 8, 1},
    };

    Chunk chunk(1000);
    std::vector<uint64_t> item_sizes;
    for (const auto& batch : batches) {
        uint64_t sample_bytes = num_elements(batch.shape) * batch.item_size;
        auto data = make_bytes(sample_bytes * batch.num_samples);
        REQUIRE(chunk.extend(data, batch.num_samples, batch.shape).ok());
        item_sizes.insert(item_sizes.end(), batch.num_samples, batch.item_size);
    }

    REQUIRE(chunk.num_samples() == 11);
    REQUIRE(chunk.shapes().num_samples() == chunk.byte_ranges().num_samples());

    uint64_t expected_offset = 0;
    for (uint64_t i = 0; i < chunk.num_samples(); ++i) {
        auto loc = chunk.sample_at(i);
        REQUIRE(loc.ok());
        REQUIRE(loc.range.length == num_elements(loc.shape) * item_sizes[i]);
        REQUIRE(loc.range.offset == expected_offset);
        expected_offset = loc.range.end();
    }
    REQUIRE(expected_offset == chunk.num_data_bytes());
}
