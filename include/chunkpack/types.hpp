#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <memory>
#include <optional>
#include <functional>

namespace chunkpack {

// Constants
constexpr size_t KB = 1024;
constexpr size_t MB = 1024 * KB;
constexpr size_t DEFAULT_CHUNK_MAX_SIZE = 16 * MB;
constexpr size_t MIN_CHUNK_MAX_SIZE = 2;

// Fixed framing of a serialized chunk blob (see format.hpp)
constexpr size_t CHUNK_CONTAINER_OVERHEAD = 48;

// Hash type (128-bit, used for chunk identifiers)
struct Hash128 {
    uint64_t low = 0;
    uint64_t high = 0;

    bool operator==(const Hash128& other) const noexcept {
        return low == other.low && high == other.high;
    }

    bool is_zero() const noexcept { return low == 0 && high == 0; }

    std::string to_hex() const;
    static std::optional<Hash128> from_hex(std::string_view hex);
};

// Chunk identifier. Doubles as the storage key of the chunk's blob.
class ChunkId {
public:
    ChunkId() = default;
    explicit ChunkId(const Hash128& hash) : hash_(hash) {}

    static ChunkId generate();
    static std::optional<ChunkId> from_string(std::string_view hex);

    const Hash128& hash() const noexcept { return hash_; }
    bool is_valid() const noexcept { return !hash_.is_zero(); }

    bool operator==(const ChunkId& other) const noexcept {
        return hash_ == other.hash_;
    }

    bool operator!=(const ChunkId& other) const noexcept {
        return !(hash_ == other.hash_);
    }

    std::string to_string() const { return hash_.to_hex(); }

private:
    Hash128 hash_;
};

// Shape of one sample (e.g. {28, 28, 3})
using SampleShape = std::vector<uint64_t>;

// Number of elements a sample of this shape holds
uint64_t num_elements(const SampleShape& shape) noexcept;

std::string shape_to_string(const SampleShape& shape);

// Byte range inside a chunk payload
struct Range {
    uint64_t offset = 0;
    uint64_t length = 0;

    uint64_t end() const noexcept { return offset + length; }

    bool operator==(const Range& other) const noexcept {
        return offset == other.offset && length == other.length;
    }
};

// Error codes
enum class ErrorCode {
    Ok = 0,
    SealedChunk,       // extend on a chunk that already has a successor
    NoSpace,           // new batch on a chunk past its soft threshold
    InvalidBatch,      // zero samples, or bytes not divisible by sample count
    InvalidRun,        // zero run length or empty shape in an index append
    IndexOutOfRange,
    Deserialization,
    NotFound,
    PartialData,       // sample bytes run past the end of the chain
    StorageError,
    InvalidArgument,
    InternalError
};

const char* error_code_string(ErrorCode code);

// Status wrapper
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    explicit Status(ErrorCode code, std::string msg = {})
        : code_(code), message_(std::move(msg)) {}

    static Status make_ok() { return Status(); }
    static Status error(ErrorCode code, std::string msg = {}) {
        return Status(code, std::move(msg));
    }

    bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_error() const noexcept { return code_ != ErrorCode::Ok; }
    explicit operator bool() const noexcept { return is_ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

// Buffer types
using ByteBuffer = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

}  // namespace chunkpack

// Hash specializations for standard containers
namespace std {

template<>
struct hash<chunkpack::ChunkId> {
    size_t operator()(const chunkpack::ChunkId& c) const noexcept {
        return c.hash().low ^ c.hash().high;
    }
};

template<>
struct hash<chunkpack::Hash128> {
    size_t operator()(const chunkpack::Hash128& h) const noexcept {
        return h.low ^ h.high;
    }
};

}  // namespace std
