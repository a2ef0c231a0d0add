#include "chunkpack/disk_storage.hpp"
#include "chunkpack/metrics.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace chunkpack {

DiskChunkStorage::DiskChunkStorage(const StorageConfig& config, elio::io::io_context& ctx)
    : config_(config)
    , io_ctx_(ctx)
{}

DiskChunkStorage::~DiskChunkStorage() = default;

std::filesystem::path DiskChunkStorage::chunk_path(const ChunkId& id) const {
    auto hex = id.to_string();
    return config_.path / "chunks" / hex.substr(0, 2) / hex;
}

elio::coro::task<Status> DiskChunkStorage::init() {
    auto status = co_await ensure_directory(config_.path);
    if (!status) {
        co_return status;
    }

    // Shard chunk files by the first 2 hex chars of their id
    for (int i = 0; i < 256; ++i) {
        char dir[3];
        snprintf(dir, sizeof(dir), "%02x", i);
        status = co_await ensure_directory(config_.path / "chunks" / dir);
        if (!status) {
            co_return status;
        }
    }

    initialized_ = true;
    co_return Status::make_ok();
}

elio::coro::task<std::optional<ByteBuffer>> DiskChunkStorage::load(const ChunkId& id) {
    loads_++;
    auto path = chunk_path(id);

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        misses_++;
        co_return std::nullopt;
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        std::cerr << "[chunkpack] stat failed for " << path << ": " << strerror(errno) << "\n";
        co_await elio::io::async_close(io_ctx_, fd);
        co_return std::nullopt;
    }

    uint64_t length = static_cast<uint64_t>(st.st_size);
    ByteBuffer buffer(length);
    size_t total_read = 0;

    while (total_read < length) {
        auto result = co_await elio::io::async_read(
            io_ctx_, fd,
            buffer.data() + total_read,
            length - total_read,
            static_cast<int64_t>(total_read));

        if (!result.success() || result.result <= 0) {
            break;
        }
        total_read += result.result;
    }

    co_await elio::io::async_close(io_ctx_, fd);

    if (total_read != length) {
        std::cerr << "[chunkpack] short read on " << path << ": "
                  << total_read << "/" << length << " bytes\n";
        co_return std::nullopt;
    }

    bytes_read_ += total_read;
    metrics().storage_bytes_read_total.inc(total_read);
    co_return buffer;
}

elio::coro::task<Status> DiskChunkStorage::store(const ChunkId& id, ByteView blob) {
    if (!id.is_valid()) {
        co_return Status::error(ErrorCode::InvalidArgument, "Invalid chunk id");
    }
    if (!initialized_) {
        co_return Status::error(ErrorCode::StorageError, "Disk storage not initialized");
    }

    auto path = chunk_path(id);
    bool existed = std::filesystem::exists(path);

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        std::cerr << "[chunkpack] open for write failed for " << path << ": " << strerror(errno) << "\n";
        co_return Status::error(ErrorCode::StorageError, "Failed to open file for writing");
    }

    size_t total_written = 0;
    while (total_written < blob.size()) {
        auto result = co_await elio::io::async_write(
            io_ctx_, fd,
            blob.data() + total_written,
            blob.size() - total_written,
            static_cast<int64_t>(total_written));

        if (!result.success() || result.result <= 0) {
            co_await elio::io::async_close(io_ctx_, fd);
            std::cerr << "[chunkpack] write failed for " << path << "\n";
            co_return Status::error(ErrorCode::StorageError, "Write failed");
        }
        total_written += result.result;
    }

    if (config_.sync_writes && fsync(fd) != 0) {
        std::cerr << "[chunkpack] fsync failed for " << path << ": " << strerror(errno) << "\n";
        co_await elio::io::async_close(io_ctx_, fd);
        co_return Status::error(ErrorCode::StorageError, "fsync failed");
    }

    co_await elio::io::async_close(io_ctx_, fd);

    if (!existed) {
        metrics().chunks_stored.inc();
    }
    stores_++;
    bytes_written_ += total_written;
    metrics().storage_bytes_written_total.inc(total_written);
    co_return Status::make_ok();
}

elio::coro::task<bool> DiskChunkStorage::exists(const ChunkId& id) {
    co_return std::filesystem::exists(chunk_path(id));
}

elio::coro::task<Status> DiskChunkStorage::remove(const ChunkId& id) {
    std::error_code ec;
    if (std::filesystem::remove(chunk_path(id), ec)) {
        metrics().chunks_stored.dec();
        co_return Status::make_ok();
    }
    if (ec) {
        co_return Status::error(ErrorCode::StorageError, "Failed to delete file: " + ec.message());
    }
    co_return Status::error(ErrorCode::NotFound, "No blob stored for chunk " + id.to_string());
}

IChunkStorage::Stats DiskChunkStorage::stats() const {
    Stats s;
    s.loads = loads_.load();
    s.stores = stores_.load();
    s.misses = misses_.load();
    s.bytes_read = bytes_read_.load();
    s.bytes_written = bytes_written_.load();

    std::error_code ec;
    auto root = config_.path / "chunks";
    if (std::filesystem::exists(root, ec)) {
        for (const auto& entry : std::filesystem::recursive_directory_iterator(root, ec)) {
            if (entry.is_regular_file(ec)) {
                s.blob_count++;
                s.size_bytes += entry.file_size(ec);
            }
        }
    }
    return s;
}

elio::coro::task<Status> DiskChunkStorage::ensure_directory(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path)) {
        std::filesystem::create_directories(path, ec);
        if (ec) {
            co_return Status::error(ErrorCode::StorageError,
                "Failed to create directory: " + ec.message());
        }
    }
    co_return Status::make_ok();
}

}  // namespace chunkpack
