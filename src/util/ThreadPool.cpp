// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "ThreadPool.hpp"
#include "LogGlobals.hpp"
#include <algorithm>

ThreadPool::ThreadPool(size_t thread_count, std::string name)
    : thread_count(std::max<size_t>(thread_count, 1))
    , pool_name(std::move(name))
{
    workers.reserve(this->thread_count);
    for (size_t i = 0; i < this->thread_count; ++i)
        workers.emplace_back([this]() { worker_loop(); });
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::worker_loop()
{
    for (;;)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            cv.wait(lock, [this]() { return !task_queue.empty() || stop; });

            // Stop only once the queue is drained
            if (task_queue.empty())
                return;

            task = std::move(task_queue.front());
            task_queue.pop();
            ++working_count;
        }

        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            gload::LogGlobals::log("[ERROR] %s: task threw: %s", pool_name.c_str(), e.what());
        }

        completed_count.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            --working_count;
            if (working_count == 0 && task_queue.empty())
                cv_idle.notify_all();
        }
    }
}

void ThreadPool::push_task(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        // Still accepted while shutdown() drains, so running tasks can chain work
        if (joined)
            throw PoolStoppedError(pool_name + " is shut down");
        task_queue.push(std::move(task));
    }
    cv.notify_one();
}

void ThreadPool::post(std::function<void()> fn)
{
    push_task(std::move(fn));
}

void ThreadPool::wait_idle()
{
    std::unique_lock<std::mutex> lock(queue_mutex);
    cv_idle.wait(lock, [this]() { return working_count == 0 && task_queue.empty(); });
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stop)
            return;
        stop = true;
    }
    cv.notify_all();
    for (auto& worker : workers)
    {
        if (worker.joinable())
            worker.join();
    }

    // Anything posted from outside after the last worker left runs here
    std::queue<std::function<void()>> leftovers;
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        joined = true;
        leftovers.swap(task_queue);
    }
    while (!leftovers.empty())
    {
        try
        {
            leftovers.front()();
        }
        catch (const std::exception& e)
        {
            gload::LogGlobals::log("[ERROR] %s: task threw during shutdown: %s", pool_name.c_str(), e.what());
        }
        leftovers.pop();
    }
}

size_t ThreadPool::nbr_threads() const
{
    return thread_count;
}

size_t ThreadPool::nbr_working_threads() const
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    return working_count;
}

size_t ThreadPool::nbr_idle_threads() const
{
    return thread_count - nbr_working_threads();
}

size_t ThreadPool::nbr_completed_tasks() const
{
    return completed_count.load(std::memory_order_relaxed);
}

size_t ThreadPool::task_queue_size() const
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    return task_queue.size();
}

bool ThreadPool::is_task_queue_empty() const
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    return task_queue.empty();
}

bool ThreadPool::is_stopped() const
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    return joined;
}
