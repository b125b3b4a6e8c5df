#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// run_sync - drive one coroutine to completion from synchronous code
// ─────────────────────────────────────────────────────────────────────────────
// Runs the io_context only until `coro` finishes. Background coroutines
// (transport readers, detached events) stay suspended on the context and
// make progress on the next call.

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <exception>
#include <future>
#include <stdexcept>

namespace toolmux::async {

namespace detail {

template <typename T>
void drive(asio::io_context& io, std::future<T>& future) {
    io.restart();
    while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        if (io.run_one() == 0) {
            throw std::runtime_error("run_sync: io_context ran out of work before the coroutine finished");
        }
    }
    io.poll();
}

}  // namespace detail

template <typename T>
T run_sync(asio::io_context& io, asio::awaitable<T> coro) {
    std::promise<T> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, [&promise, coro = std::move(coro)]() mutable -> asio::awaitable<void> {
        try {
            promise.set_value(co_await std::move(coro));
        } catch (const std::exception&) {
            promise.set_exception(std::current_exception());
        }
    }, asio::detached);

    detail::drive(io, future);
    return future.get();
}

inline void run_sync(asio::io_context& io, asio::awaitable<void> coro) {
    std::promise<void> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, [&promise, coro = std::move(coro)]() mutable -> asio::awaitable<void> {
        try {
            co_await std::move(coro);
            promise.set_value();
        } catch (const std::exception&) {
            promise.set_exception(std::current_exception());
        }
    }, asio::detached);

    detail::drive(io, future);
    future.get();
}

}  // namespace toolmux::async
