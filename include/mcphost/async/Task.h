//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Coroutine Task type bridging to std::future, and an awaiter for std::future results
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <exception>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace mcphost {
namespace async {

// Task<T> - eagerly started coroutine whose result is observed through a std::future<T>.
// Usage: Task<T> foo() { co_return value; } -> foo().toFuture()
// Exceptions escaping the body are stored in the future.
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type {
        std::promise<T> promise;
        Task get_return_object() noexcept { return Task{ promise.get_future() }; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    struct promise_type {
        std::promise<void> promise;
        Task get_return_object() noexcept { return Task{ promise.get_future() }; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }
        void return_void() { promise.set_value(); }
    };

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

//==========================================================================================================
// FutureAwaitable
// Purpose: co_await on a std::future<T> or std::shared_future<T>. A not-yet-ready future is waited on by
//          a short-lived helper thread which resumes the coroutine; the coroutine therefore continues on
//          that thread. get() rethrows any stored exception at the co_await site.
//==========================================================================================================
template <typename Future>
class FutureAwaitable {
public:
    explicit FutureAwaitable(Future&& f) : fut(std::move(f)) {}

    bool await_ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() {
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    decltype(auto) await_resume() { return fut.get(); }

private:
    Future fut;
};

template <typename T>
inline FutureAwaitable<std::future<T>> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<std::future<T>>(std::move(fut));
}

template <typename T>
inline FutureAwaitable<std::shared_future<T>> makeFutureAwaitable(std::shared_future<T> fut) {
    return FutureAwaitable<std::shared_future<T>>(std::move(fut));
}

} // namespace async
} // namespace mcphost
