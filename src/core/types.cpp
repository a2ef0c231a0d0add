#include "chunkpack/types.hpp"
#include <random>
#include <sstream>
#include <iomanip>
#include <cctype>

namespace chunkpack {

namespace {

std::optional<uint64_t> parse_hex64(std::string_view hex) {
    uint64_t v = 0;
    for (char c : hex) {
        uint64_t digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        else return std::nullopt;
        v = (v << 4) | digit;
    }
    return v;
}

}  // namespace

// Hash128 implementation
std::string Hash128::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

std::optional<Hash128> Hash128::from_hex(std::string_view hex) {
    if (hex.size() != 32) {
        return std::nullopt;
    }
    auto high = parse_hex64(hex.substr(0, 16));
    auto low = parse_hex64(hex.substr(16, 16));
    if (!high || !low) {
        return std::nullopt;
    }
    Hash128 h;
    h.high = *high;
    h.low = *low;
    return h;
}

// ChunkId implementation
ChunkId ChunkId::generate() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    Hash128 hash;
    do {
        hash.low = dis(gen);
        hash.high = dis(gen);
    } while (hash.is_zero());
    return ChunkId(hash);
}

std::optional<ChunkId> ChunkId::from_string(std::string_view hex) {
    auto hash = Hash128::from_hex(hex);
    if (!hash || hash->is_zero()) {
        return std::nullopt;
    }
    return ChunkId(*hash);
}

// Shape helpers
uint64_t num_elements(const SampleShape& shape) noexcept {
    uint64_t n = 1;
    for (uint64_t dim : shape) {
        n *= dim;
    }
    return n;
}

std::string shape_to_string(const SampleShape& shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    if (shape.size() == 1) oss << ",";
    oss << ")";
    return oss.str();
}

// Status helpers
const char* error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::SealedChunk: return "Sealed chunk";
        case ErrorCode::NoSpace: return "No space";
        case ErrorCode::InvalidBatch: return "Invalid batch";
        case ErrorCode::InvalidRun: return "Invalid run";
        case ErrorCode::IndexOutOfRange: return "Index out of range";
        case ErrorCode::Deserialization: return "Deserialization error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::PartialData: return "Partial data";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

std::string Status::to_string() const {
    if (message_.empty()) {
        return error_code_string(code_);
    }
    return std::string(error_code_string(code_)) + ": " + message_;
}

}  // namespace chunkpack
