#include "chunkpack/memory_storage.hpp"
#include "chunkpack/metrics.hpp"

namespace chunkpack {

MemoryChunkStorage::~MemoryChunkStorage() {
    metrics().chunks_stored.dec(static_cast<double>(blobs_.size()));
}

elio::coro::task<std::optional<ByteBuffer>> MemoryChunkStorage::load(const ChunkId& id) {
    loads_++;

    co_await mutex_.lock_shared();
    auto it = blobs_.find(id);
    if (it != blobs_.end()) {
        ByteBuffer blob = it->second;
        mutex_.unlock_shared();

        bytes_read_ += blob.size();
        metrics().storage_bytes_read_total.inc(blob.size());
        co_return blob;
    }
    mutex_.unlock_shared();

    misses_++;
    co_return std::nullopt;
}

elio::coro::task<Status> MemoryChunkStorage::store(const ChunkId& id, ByteView blob) {
    if (!id.is_valid()) {
        co_return Status::error(ErrorCode::InvalidArgument, "Invalid chunk id");
    }

    co_await mutex_.lock();
    auto [it, inserted] = blobs_.try_emplace(id);
    size_bytes_ -= it->second.size();
    it->second.assign(blob.begin(), blob.end());
    size_bytes_ += blob.size();
    mutex_.unlock();

    if (inserted) {
        metrics().chunks_stored.inc();
    }
    stores_++;
    bytes_written_ += blob.size();
    metrics().storage_bytes_written_total.inc(blob.size());
    co_return Status::make_ok();
}

elio::coro::task<bool> MemoryChunkStorage::exists(const ChunkId& id) {
    co_await mutex_.lock_shared();
    bool found = blobs_.count(id) > 0;
    mutex_.unlock_shared();
    co_return found;
}

elio::coro::task<Status> MemoryChunkStorage::remove(const ChunkId& id) {
    co_await mutex_.lock();
    auto it = blobs_.find(id);
    if (it == blobs_.end()) {
        mutex_.unlock();
        co_return Status::error(ErrorCode::NotFound, "No blob stored for chunk " + id.to_string());
    }
    size_bytes_ -= it->second.size();
    blobs_.erase(it);
    mutex_.unlock();

    metrics().chunks_stored.dec();
    co_return Status::make_ok();
}

IChunkStorage::Stats MemoryChunkStorage::stats() const {
    Stats s;
    s.loads = loads_.load();
    s.stores = stores_.load();
    s.misses = misses_.load();
    s.bytes_read = bytes_read_.load();
    s.bytes_written = bytes_written_.load();

    // Use try_lock_shared for non-coroutine context
    while (!mutex_.try_lock_shared()) {
        // Spin briefly - this is a synchronous stats() call
    }
    s.blob_count = blobs_.size();
    s.size_bytes = size_bytes_;
    mutex_.unlock_shared();

    return s;
}

}  // namespace chunkpack
