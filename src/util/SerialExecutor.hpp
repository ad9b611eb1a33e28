// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "IExecutor.hpp"
#include "LogGlobals.hpp"
#include <functional>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <exception>

namespace gload
{
    /// Strand over an upstream executor: posted tasks run one at a time, in FIFO
    /// order, on whichever upstream thread picks up the drain. Thread-safe.
    ///
    /// Used as the delivery executor in "strand" mode, so load completions are
    /// handled on pool threads without two deliveries ever overlapping.
    class SerialExecutor : public IExecutor
    {
    public:
        using Fn = std::function<void()>;

        explicit SerialExecutor(IExecutor& upstream) noexcept
            : upstream_(upstream)
        {
        }

        SerialExecutor(const SerialExecutor&) = delete;
        SerialExecutor& operator=(const SerialExecutor&) = delete;

        void post(Fn fn) override
        {
            bool schedule = false;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                pending_.push_back(std::move(fn));
                if (!scheduled_)
                    schedule = scheduled_ = true;
            }
            if (!schedule)
                return;

            try
            {
                upstream_.post([this] { drain(); });
            }
            catch (const std::exception&)
            {
                std::lock_guard<std::mutex> lk(mutex_);
                scheduled_ = false;
                pending_.clear();
                cv_idle_.notify_all();
                throw;
            }
        }

        /// True while a drain is scheduled or running
        bool is_busy() const
        {
            std::lock_guard<std::mutex> lk(mutex_);
            return scheduled_;
        }

        /// Tasks waiting to run, not counting the batch being executed
        size_t queued() const
        {
            std::lock_guard<std::mutex> lk(mutex_);
            return pending_.size();
        }

        size_t executed() const
        {
            std::lock_guard<std::mutex> lk(mutex_);
            return executed_;
        }

        /// Block until every posted task has run
        void wait_idle()
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_idle_.wait(lk, [&] { return !scheduled_; });
        }

    private:
        // Runs batches until the queue stays empty. Only one drain is in flight.
        void drain()
        {
            std::deque<Fn> batch;
            for (;;)
            {
                const size_t ran = batch.size();
                batch.clear();
                {
                    std::lock_guard<std::mutex> lk(mutex_);
                    executed_ += ran;
                    if (pending_.empty())
                    {
                        scheduled_ = false;
                        cv_idle_.notify_all();
                        return;
                    }
                    batch.swap(pending_);
                }

                for (auto& fn : batch)
                {
                    try
                    {
                        fn();
                    }
                    catch (const std::exception& e)
                    {
                        LogGlobals::log("[ERROR] SerialExecutor task threw: %s", e.what());
                    }
                }
            }
        }

        IExecutor& upstream_;

        mutable std::mutex mutex_;
        std::condition_variable cv_idle_;
        std::deque<Fn> pending_;
        bool scheduled_ = false;    // a drain is posted upstream or running
        size_t executed_ = 0;
    };

} // namespace gload
