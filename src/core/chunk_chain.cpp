#include "chunkpack/chunk_chain.hpp"

namespace chunkpack {

ChunkChain::ChunkChain(const ChunkConfig& config) : config_(config) {}

AppendResult ChunkChain::append(ByteView buffer, uint64_t num_samples, const SampleShape& shape) {
    AppendResult result;

    SharedChunk prev = tail();
    if (prev && prev->is_sealed()) {
        result.status = Status::error(ErrorCode::InternalError,
            "Tail chunk " + prev->id().to_string() + " is sealed");
        return result;
    }

    SharedChunk target = prev;
    SharedChunk fresh;
    if (!target || !target->has_space()) {
        // A stream keeps the capacity of its existing chunks
        size_t capacity = prev ? prev->max_data_bytes() : config_.max_data_bytes;
        if (capacity < MIN_CHUNK_MAX_SIZE) {
            result.status = Status::error(ErrorCode::InvalidArgument,
                "Chunk capacity must be at least " + std::to_string(MIN_CHUNK_MAX_SIZE) +
                " bytes, got " + std::to_string(capacity));
            return result;
        }
        fresh = std::make_shared<Chunk>(capacity);
        target = fresh;
    }

    auto extended = target->extend(buffer, num_samples, shape);
    if (!extended.ok()) {
        // A fresh chunk is simply dropped; nothing was linked to it yet
        result.status = extended.status;
        return result;
    }

    if (fresh) {
        if (prev) {
            auto status = prev->link(fresh->id());
            if (!status) {
                result.status = status;
                return result;
            }
            dirty_.insert(prev->id());
        }
        result.new_chunks.push_back(fresh->id());
        add_chunk(fresh);
    }
    dirty_.insert(target->id());

    for (auto& child : extended.spawned) {
        result.new_chunks.push_back(child->id());
        add_chunk(std::move(child));
    }

    return result;
}

void ChunkChain::add_chunk(SharedChunk chunk) {
    const ChunkId id = chunk->id();
    order_.push_back(id);
    dirty_.insert(id);
    arena_.emplace(id, std::move(chunk));
}

std::optional<SampleRef> ChunkChain::locate(uint64_t global_index) const {
    uint64_t first = 0;
    for (size_t pos = 0; pos < order_.size(); ++pos) {
        uint64_t count = arena_.at(order_[pos])->num_samples();
        if (global_index < first + count) {
            return SampleRef{order_[pos], pos, global_index - first};
        }
        first += count;
    }
    return std::nullopt;
}

SampleReadResult ChunkChain::read_sample(uint64_t global_index) const {
    SampleReadResult result;

    auto ref = locate(global_index);
    if (!ref) {
        result.status = Status::error(ErrorCode::IndexOutOfRange,
            "Sample " + std::to_string(global_index) + " out of range, chain holds " +
            std::to_string(num_samples()));
        return result;
    }

    auto loc = arena_.at(ref->chunk)->sample_at(ref->local_index);
    if (!loc.ok()) {
        result.status = loc.status;
        return result;
    }
    result.shape = std::move(loc.shape);

    // The range is relative to the origin chunk's payload followed by its
    // successors' payloads.
    uint64_t offset = loc.range.offset;
    uint64_t remaining = loc.range.length;
    result.data.reserve(remaining);

    for (size_t pos = ref->position; remaining > 0 && pos < order_.size(); ++pos) {
        const auto& chunk = arena_.at(order_[pos]);
        uint64_t size = chunk->num_data_bytes();
        if (offset >= size) {
            offset -= size;
            continue;
        }

        auto part = chunk->read(offset, remaining);
        result.data.insert(result.data.end(), part.begin(), part.end());
        remaining -= part.size();
        offset = 0;
    }

    if (remaining > 0) {
        result.status = Status::error(ErrorCode::PartialData,
            "Sample " + std::to_string(global_index) + " is missing " +
            std::to_string(remaining) + " bytes past the end of the chain");
        result.data.clear();
    }

    return result;
}

uint64_t ChunkChain::num_samples() const noexcept {
    uint64_t total = 0;
    for (const auto& [id, chunk] : arena_) {
        total += chunk->num_samples();
    }
    return total;
}

SharedChunk ChunkChain::get(const ChunkId& id) const {
    auto it = arena_.find(id);
    if (it == arena_.end()) {
        return nullptr;
    }
    return it->second;
}

SharedChunk ChunkChain::tail() const {
    if (order_.empty()) {
        return nullptr;
    }
    return get(order_.back());
}

elio::coro::task<Status> ChunkChain::flush(IChunkStorage& storage) {
    for (const auto& id : order_) {
        if (dirty_.count(id) == 0) {
            continue;
        }

        auto blob = arena_.at(id)->serialize();
        auto status = co_await storage.store(id, blob);
        if (!status) {
            co_return status;
        }
        dirty_.erase(id);
    }
    co_return Status::make_ok();
}

elio::coro::task<Status> ChunkChain::load(IChunkStorage& storage, std::vector<ChunkId> ids) {
    std::unordered_map<ChunkId, SharedChunk> arena;
    SharedChunk prev;

    for (const auto& id : ids) {
        if (arena.count(id) > 0) {
            co_return Status::error(ErrorCode::InvalidArgument,
                "Chunk " + id.to_string() + " is listed twice");
        }

        auto blob = co_await storage.load(id);
        if (!blob) {
            co_return Status::error(ErrorCode::NotFound,
                "No blob stored for chunk " + id.to_string());
        }

        // Capacity comes from the blob
        auto chunk = std::make_shared<Chunk>(id, MIN_CHUNK_MAX_SIZE);
        auto status = chunk->deserialize(*blob);
        if (!status) {
            co_return Status::error(status.code(),
                "Chunk " + id.to_string() + ": " + status.message());
        }

        if (prev) {
            status = prev->link(id);
            if (!status) {
                co_return status;
            }
        }

        arena.emplace(id, chunk);
        prev = std::move(chunk);
    }

    arena_ = std::move(arena);
    order_ = std::move(ids);
    dirty_.clear();
    co_return Status::make_ok();
}

}  // namespace chunkpack
