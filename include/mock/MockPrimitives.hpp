// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef MockPrimitives_hpp
#define MockPrimitives_hpp

#include "IAsyncLoadPrimitive.hpp"
#include "IMaterializePrimitive.hpp"
#include "LoaderTypes.hpp"
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace gload::mock
{
    /// Load primitive completed by hand from the test body
    class ManualLoadPrimitive : public IAsyncLoadPrimitive
    {
    public:
        void load_async(const std::string& name, Completion on_complete) override
        {
            std::unique_lock lock(mutex_);
            ++calls_[name];
            requests_.push_back(name);

            if (throw_on_load_)
                throw std::runtime_error("load_async refused " + name);

            if (auto_complete_)
            {
                lock.unlock();
                on_complete(LoadResult::ok(make_object(name)));
                return;
            }
            pending_[name].push_back(std::move(on_complete));
        }

        /// Default object for a name
        static Asset make_object(const std::string& name)
        {
            return Asset::make(std::string("data:") + name);
        }

        /// Completes the oldest pending load of name. False if none is pending.
        bool complete(const std::string& name, Asset object)
        {
            auto completion = take(name);
            if (!completion) return false;
            completion(LoadResult::ok(std::move(object)));
            return true;
        }

        bool complete(const std::string& name)
        {
            return complete(name, make_object(name));
        }

        bool fail(const std::string& name, const std::string& message = "mock failure")
        {
            auto completion = take(name);
            if (!completion) return false;
            completion(LoadResult::failure(message));
            return true;
        }

        /// Completes every pending load with its default object
        size_t complete_all()
        {
            std::vector<std::pair<std::string, Completion>> work;
            {
                std::lock_guard lock(mutex_);
                for (auto& [name, queue] : pending_)
                    for (auto& c : queue)
                        work.emplace_back(name, std::move(c));
                pending_.clear();
            }
            for (auto& [name, c] : work)
                c(LoadResult::ok(make_object(name)));
            return work.size();
        }

        /// Removes the oldest pending completion of name without calling it
        Completion take(const std::string& name)
        {
            std::lock_guard lock(mutex_);
            auto it = pending_.find(name);
            if (it == pending_.end() || it->second.empty())
                return {};
            auto c = std::move(it->second.front());
            it->second.pop_front();
            if (it->second.empty())
                pending_.erase(it);
            return c;
        }

        size_t call_count(const std::string& name) const
        {
            std::lock_guard lock(mutex_);
            auto it = calls_.find(name);
            return it != calls_.end() ? it->second : 0;
        }

        size_t total_calls() const
        {
            std::lock_guard lock(mutex_);
            return requests_.size();
        }

        size_t pending_count() const
        {
            std::lock_guard lock(mutex_);
            size_t n = 0;
            for (const auto& [name, queue] : pending_)
                n += queue.size();
            return n;
        }

        std::vector<std::string> requests() const
        {
            std::lock_guard lock(mutex_);
            return requests_;
        }

        void set_auto_complete(bool enabled)
        {
            std::lock_guard lock(mutex_);
            auto_complete_ = enabled;
        }

        void set_throw_on_load(bool enabled)
        {
            std::lock_guard lock(mutex_);
            throw_on_load_ = enabled;
        }

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::deque<Completion>> pending_;
        std::map<std::string, size_t> calls_;
        std::vector<std::string> requests_;
        bool auto_complete_ = false;
        bool throw_on_load_ = false;
    };

    struct MockInstance
    {
        int id = 0;
        Asset source;
        Asset placement;
    };

    /// Wraps the loaded object in a MockInstance with a fresh id
    class MockMaterializer : public IMaterializePrimitive
    {
    public:
        Asset materialize(const Asset& loaded, const Asset& placement) override
        {
            const int id = ++calls_;
            if (failing_)
                throw MaterializeError("mock materialize failure");
            if (return_empty_)
                return {};
            return Asset::make(MockInstance{ id, loaded, placement });
        }

        int call_count() const { return calls_.load(); }

        void set_failing(bool enabled) { failing_ = enabled; }
        void set_return_empty(bool enabled) { return_empty_ = enabled; }

    private:
        std::atomic<int> calls_{ 0 };
        std::atomic<bool> failing_{ false };
        std::atomic<bool> return_empty_{ false };
    };
}

#endif // MockPrimitives_hpp
