#pragma once

#include "task_agg/join_counter.hpp"

#include <cstddef>
#include <exception>
#include <new>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace task_agg {

/*
Owns a set of OS threads and joins all of them on destruction.

A non-zero max_threads caps the group: Spawn() past the cap fails with the
same std::system_error (resource_unavailable_try_again) the OS reports when
it runs out of threads.
*/
class ThreadGroup {
public:
    explicit ThreadGroup(std::size_t max_threads = 0)
        : max_threads_(max_threads) {}
    ~ThreadGroup();

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    template <typename F>
    void Spawn(F&& f) {
        if (max_threads_ != 0 && threads_.size() >= max_threads_) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "ThreadGroup thread limit reached");
        }
        threads_.emplace_back(std::forward<F>(f));
    }

    void Reserve(std::size_t n) {
        threads_.reserve(max_threads_ != 0 && n > max_threads_ ? max_threads_ : n);
    }
    void JoinAll();
    std::size_t Size() const noexcept { return threads_.size(); }

private:
    std::size_t max_threads_;
    std::vector<std::thread> threads_;
};

/*
Starts n threads in `group`, each running body() and then counter.Done().
body must not throw. Returns how many threads were started. If a spawn fails
the units that never started are credited to the counter, so a waiter
cannot hang, and the failure is handed back through `error`.
*/
template <typename Body>
std::size_t SpawnJoined(ThreadGroup& group, JoinCounter& counter, std::size_t n, const Body& body,
                        std::exception_ptr& error) {
    std::size_t started = 0;
    try {
        group.Reserve(group.Size() + n);
        for (; started < n; ++started) {
            group.Spawn([&counter, body] {
                body();
                counter.Done();
            });
        }
    } catch (const std::system_error&) {
        error = std::current_exception();
        counter.Done(n - started);
    } catch (const std::bad_alloc&) {
        error = std::current_exception();
        counter.Done(n - started);
    }
    return started;
}

}
