// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "IExecutor.hpp"
#include "LogGlobals.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <exception>

/// Queue of callbacks drained by the host's event loop.
/// Any thread may post; tasks run on whichever thread calls execute_all().
class CallbackQueue : public IExecutor
{
public:
    CallbackQueue() = default;

    CallbackQueue(const CallbackQueue&) = delete;
    CallbackQueue& operator=(const CallbackQueue&) = delete;

    // Enqueue a task (non-blocking)
    void post(std::function<void()> fn) override
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            q_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    // Runs the tasks queued at the time of the call. Tasks posted while
    // draining are left for the next call. Returns the number of tasks run.
    size_t execute_all()
    {
        std::queue<std::function<void()>> local;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            local.swap(q_);
        }

        size_t count = 0;
        while (!local.empty())
        {
            auto fn = std::move(local.front());
            local.pop();
            ++count;
            try { fn(); }
            catch (const std::exception& e)
            {
                gload::LogGlobals::log("[ERROR] CallbackQueue task threw: %s", e.what());
            }
        }
        return count;
    }

    // Drain repeatedly until the queue stays empty. Returns the number of tasks run.
    size_t run_until_idle()
    {
        size_t total = 0;
        while (size_t n = execute_all())
            total += n;
        return total;
    }

    // Block until work is queued or the timeout expires. True if work is queued.
    template<class Rep, class Period>
    bool wait_for_work(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [&] { return !q_.empty(); });
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return q_.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return q_.size();
    }

private:
    mutable std::mutex      mtx_;
    std::condition_variable  cv_;
    std::queue<std::function<void()>> q_;
};
