#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace chunkpack::format {

// Chunk blob framing (little-endian):
//
//   magic              u32
//   version            u16
//   flags              u16
//   max_data_bytes     u64
//   continuation_bytes u64
//   shape index        u32 length + bytes
//   byte range index   u32 length + bytes
//   payload            u64 length + bytes
//   checksum           u64 (XXH3-64 of everything above)
constexpr uint32_t CHUNK_MAGIC = 0x4B435043;  // "CPCK"
constexpr uint16_t CHUNK_FORMAT_VERSION = 1;

struct ChunkHeader {
    uint32_t magic = CHUNK_MAGIC;
    uint16_t version = CHUNK_FORMAT_VERSION;
    uint16_t flags = 0;
    uint64_t max_data_bytes = 0;
    uint64_t continuation_bytes = 0;

    static constexpr size_t SIZE = 24;
};

// Everything in a blob that is not index or payload bytes
static_assert(ChunkHeader::SIZE + 4 + 4 + 8 + 8 == CHUNK_CONTAINER_OVERHEAD,
              "chunk framing size mismatch");

// Binary encode/decode helpers. Decoders consume from the front of the view
// and throw std::runtime_error on truncated input.
class Codec {
public:
    static void encode_header(ByteBuffer& buf, const ChunkHeader& hdr);
    static ChunkHeader decode_header(ByteView& data);

    static void encode_section(ByteBuffer& buf, ByteView section);
    static ByteView decode_section(ByteView& data);

    static void encode_u16(ByteBuffer& buf, uint16_t v);
    static void encode_u32(ByteBuffer& buf, uint32_t v);
    static void encode_u64(ByteBuffer& buf, uint64_t v);

    static uint16_t decode_u16(ByteView& data);
    static uint32_t decode_u32(ByteView& data);
    static uint64_t decode_u64(ByteView& data);

    // Borrow `length` bytes from the front of the view
    static ByteView take(ByteView& data, uint64_t length, std::string_view what);

    static uint64_t checksum(ByteView data);
};

}  // namespace chunkpack::format
