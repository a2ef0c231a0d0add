#pragma once

#include "chunkpack/types.hpp"
#include <elio/coro/task.hpp>
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <chrono>
#include <future>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace chunkpack::testing {

// Run a coroutine on a one-worker scheduler and wait for its result
template <typename T>
T run_blocking(elio::io::io_context& io_ctx, elio::coro::task<T> task) {
    elio::runtime::scheduler sched(1);
    sched.set_io_context(&io_ctx);
    sched.start();

    std::promise<T> done;
    auto result = done.get_future();

    auto wrapper = [&done](elio::coro::task<T> inner) -> elio::coro::task<void> {
        done.set_value(co_await std::move(inner));
    };

    auto outer = wrapper(std::move(task));
    sched.spawn(outer.release());

    if (result.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        sched.shutdown();
        throw std::runtime_error("Coroutine did not finish within 5s");
    }

    T value = result.get();
    sched.shutdown();
    return value;
}

template <typename T>
T run_blocking(elio::coro::task<T> task) {
    elio::io::io_context io_ctx;
    return run_blocking(io_ctx, std::move(task));
}

// Bytes counting up from `start`, wrapping at 256
inline ByteBuffer make_bytes(size_t size, uint8_t start = 0) {
    ByteBuffer data(size);
    std::iota(data.begin(), data.end(), start);
    return data;
}

}  // namespace chunkpack::testing
