#include "chunkpack/format.hpp"
#include <stdexcept>
#include <xxhash.h>

namespace chunkpack::format {

void Codec::encode_header(ByteBuffer& buf, const ChunkHeader& hdr) {
    encode_u32(buf, hdr.magic);
    encode_u16(buf, hdr.version);
    encode_u16(buf, hdr.flags);
    encode_u64(buf, hdr.max_data_bytes);
    encode_u64(buf, hdr.continuation_bytes);
}

ChunkHeader Codec::decode_header(ByteView& data) {
    if (data.size() < ChunkHeader::SIZE) {
        throw std::runtime_error("Truncated header");
    }

    ChunkHeader hdr;
    hdr.magic = decode_u32(data);
    if (hdr.magic != CHUNK_MAGIC) {
        throw std::runtime_error("Invalid magic number");
    }
    hdr.version = decode_u16(data);
    if (hdr.version != CHUNK_FORMAT_VERSION) {
        throw std::runtime_error("Unsupported format version " + std::to_string(hdr.version));
    }
    hdr.flags = decode_u16(data);
    hdr.max_data_bytes = decode_u64(data);
    hdr.continuation_bytes = decode_u64(data);
    return hdr;
}

void Codec::encode_section(ByteBuffer& buf, ByteView section) {
    encode_u32(buf, static_cast<uint32_t>(section.size()));
    buf.insert(buf.end(), section.begin(), section.end());
}

ByteView Codec::decode_section(ByteView& data) {
    uint32_t len = decode_u32(data);
    return take(data, len, "section");
}

void Codec::encode_u16(ByteBuffer& buf, uint16_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >> 8) & 0xFF);
}

void Codec::encode_u32(ByteBuffer& buf, uint32_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >> 8) & 0xFF);
    buf.push_back((v >> 16) & 0xFF);
    buf.push_back((v >> 24) & 0xFF);
}

void Codec::encode_u64(ByteBuffer& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back((v >> (i * 8)) & 0xFF);
    }
}

uint16_t Codec::decode_u16(ByteView& data) {
    if (data.size() < 2) throw std::runtime_error("Truncated u16");
    uint16_t v = data[0] | (static_cast<uint16_t>(data[1]) << 8);
    data = data.subspan(2);
    return v;
}

uint32_t Codec::decode_u32(ByteView& data) {
    if (data.size() < 4) throw std::runtime_error("Truncated u32");
    uint32_t v = data[0] |
                 (static_cast<uint32_t>(data[1]) << 8) |
                 (static_cast<uint32_t>(data[2]) << 16) |
                 (static_cast<uint32_t>(data[3]) << 24);
    data = data.subspan(4);
    return v;
}

uint64_t Codec::decode_u64(ByteView& data) {
    if (data.size() < 8) throw std::runtime_error("Truncated u64");
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    data = data.subspan(8);
    return v;
}

ByteView Codec::take(ByteView& data, uint64_t length, std::string_view what) {
    if (data.size() < length) {
        throw std::runtime_error("Truncated " + std::string(what));
    }
    ByteView result = data.first(static_cast<size_t>(length));
    data = data.subspan(static_cast<size_t>(length));
    return result;
}

uint64_t Codec::checksum(ByteView data) {
    return XXH3_64bits(data.data(), data.size());
}

}  // namespace chunkpack::format
