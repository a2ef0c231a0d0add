#pragma once

#include "storage.hpp"
#include "config.hpp"
#include <elio/coro/task.hpp>
#include <elio/io/io_context.hpp>
#include <elio/io/io_awaitables.hpp>
#include <atomic>
#include <filesystem>

namespace chunkpack {

// One file per chunk blob under <path>/chunks/<first two hex chars>/<id>.
// File I/O goes through Elio's async read/write on the given io_context.
class DiskChunkStorage : public IChunkStorage {
public:
    DiskChunkStorage(const StorageConfig& config, elio::io::io_context& ctx);
    ~DiskChunkStorage() override;

    // Create the directory layout; call once before use
    elio::coro::task<Status> init();

    elio::coro::task<std::optional<ByteBuffer>> load(const ChunkId& id) override;
    elio::coro::task<Status> store(const ChunkId& id, ByteView blob) override;
    elio::coro::task<bool> exists(const ChunkId& id) override;
    elio::coro::task<Status> remove(const ChunkId& id) override;

    Stats stats() const override;

    std::filesystem::path chunk_path(const ChunkId& id) const;

private:
    StorageConfig config_;
    elio::io::io_context& io_ctx_;
    bool initialized_ = false;

    mutable std::atomic<uint64_t> loads_{0};
    mutable std::atomic<uint64_t> stores_{0};
    mutable std::atomic<uint64_t> misses_{0};
    mutable std::atomic<uint64_t> bytes_read_{0};
    mutable std::atomic<uint64_t> bytes_written_{0};

    elio::coro::task<Status> ensure_directory(const std::filesystem::path& path);
};

}  // namespace chunkpack
