// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef THREADPOOL_HPP
#define THREADPOOL_HPP

#include "IExecutor.hpp"
#include <future>
#include <queue>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <type_traits>
#include <utility>

/// Thrown when work is handed to a pool that has been shut down
class PoolStoppedError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Fixed set of worker threads draining a FIFO task queue.
/// shutdown() (also run by the destructor) finishes every queued task before joining.
class ThreadPool : public IExecutor
{
public:
    explicit ThreadPool(size_t thread_count = std::thread::hardware_concurrency(), std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a callable, its result or exception ends up in the future.
    /// Throws PoolStoppedError once shutdown() has returned.
    template <typename Func>
    auto queue_task(Func task) -> std::future<std::invoke_result_t<Func>>;

    /// Fire-and-forget. Exceptions escaping fn are logged by the worker.
    /// Throws PoolStoppedError once shutdown() has returned.
    void post(std::function<void()> fn) override;

    /// Block until the queue is empty and no worker is busy
    void wait_idle();

    /// Run what is queued, then join. Idempotent.
    void shutdown();

    const std::string& name() const { return pool_name; }
    size_t nbr_threads() const;
    size_t nbr_working_threads() const;
    size_t nbr_idle_threads() const;
    size_t nbr_completed_tasks() const;
    size_t task_queue_size() const;
    bool is_task_queue_empty() const;
    bool is_stopped() const;

private:
    void push_task(std::function<void()> task);
    void worker_loop();

    std::vector<std::thread> workers;
    std::condition_variable cv;
    std::condition_variable cv_idle;

    std::queue<std::function<void()>> task_queue;
    mutable std::mutex queue_mutex;

    bool stop = false;                      // guarded by queue_mutex
    bool joined = false;                    // guarded by queue_mutex
    size_t working_count = 0;               // guarded by queue_mutex
    std::atomic<size_t> completed_count{ 0 };

    const size_t thread_count;
    const std::string pool_name;
};

template <typename Func>
auto ThreadPool::queue_task(Func task) -> std::future<std::invoke_result_t<Func>>
{
    using ResultType = std::invoke_result_t<Func>;

    auto packaged_task = std::make_shared<std::packaged_task<ResultType()>>(std::move(task));
    auto future = packaged_task->get_future();
    push_task([packaged_task]() { (*packaged_task)(); });
    return future;
}

#endif // THREADPOOL_HPP
