// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "LoaderTypes.hpp"
#include "ResourceCache.hpp"
#include "IAsyncLoadPrimitive.hpp"
#include "IMaterializePrimitive.hpp"
#include "IExecutor.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gload
{
    /**
     * @brief Runs batches of resource requests against a ResourceCache.
     *
     * At most one batch is active at a time. Requests for a name that is already
     * pending attach to the in-flight load; requests for a loaded name are served
     * from the cache. Every primitive completion and every cache hit is handed to
     * the delivery executor, where consumers are notified outside the lock.
     *
     * @note Must be owned by a std::shared_ptr (see create()). Pending completions
     *       only hold weak references, so they become no-ops once the coordinator
     *       is gone.
     */
    class BatchCoordinator : public std::enable_shared_from_this<BatchCoordinator>
    {
    public:
        using Clock = std::chrono::steady_clock;

        BatchCoordinator(
            IAsyncLoadPrimitive& load_primitive,
            IMaterializePrimitive* materialize_primitive,
            IExecutor& delivery);

        static std::shared_ptr<BatchCoordinator> create(
            IAsyncLoadPrimitive& load_primitive,
            IMaterializePrimitive* materialize_primitive,
            IExecutor& delivery);

        BatchCoordinator(const BatchCoordinator&) = delete;
        BatchCoordinator& operator=(const BatchCoordinator&) = delete;

        /**
         * @brief Start a batch.
         *
         * Returns AlreadyLoading (and changes nothing) if a batch is active.
         * Otherwise every request goes through the per-item load path and the
         * returned future resolves once every request reached a terminal state.
         *
         * @param specs Requests, duplicates allowed (each one counts toward progress)
         * @param on_batch_done Invoked once, after every item callback of the batch
         */
        BatchStart start(std::vector<RequestSpec> specs, BatchDoneFn on_batch_done);

        /// Single request outside of any batch; does not affect progress.
        std::shared_future<ItemResult> request(RequestSpec spec);

        /// Runs after every batch's own callback and before its future is set.
        /// Not run for batches cancelled by reset().
        void set_finished_hook(BatchDoneFn hook);

        /// Detach the cache and reset batch state. In-flight loads become orphans.
        void reset();

        // --- Queries (thread-safe) -------------------------------------------

        bool is_active() const;

        /// completed / total of the current or last batch, 0 if none since reset
        float progress() const;

        /// Running time of the active batch, or the final time of the last one
        std::chrono::duration<double> elapsed() const;

        size_t completed_count() const;
        size_t total_count() const;
        std::vector<std::string> requested_names() const;

        std::optional<Asset> cached(const std::string& name) const;
        bool has_entry(const std::string& name) const;
        bool is_resolved(const std::string& name) const;
        size_t cache_size() const;

        LoaderStats stats() const;

    private:
        struct BatchState
        {
            uint64_t id{ 0 };
            bool active{ false };
            size_t total{ 0 };
            size_t completed{ 0 };
            std::vector<std::string> requested_names;
            Clock::time_point started_at{};
            std::chrono::duration<double> final_elapsed{ 0.0 };
            BatchDoneFn on_done;
            std::shared_ptr<std::promise<BatchResult>> promise;
            BatchResult report;
        };

        // Side effects decided under the lock and carried out after releasing it
        struct Work
        {
            std::vector<ResourceCache::EntryPtr> loads;
            std::vector<std::pair<Consumer, Asset>> cache_hits;
        };

        struct Finished
        {
            BatchDoneFn on_done;
            BatchDoneFn hook;
            std::shared_ptr<std::promise<BatchResult>> promise;
            BatchResult report;
        };

        void plan_request_locked(Consumer consumer, Work& work);
        void run_work(Work work);
        void start_load(const ResourceCache::EntryPtr& entry);
        void on_load_complete(const std::weak_ptr<CacheEntry>& weak_entry, LoadResult result);

        void deliver(Consumer& consumer, const LoadResult& outcome, bool from_cache);
        ItemResult make_item_result(const Consumer& consumer, const LoadResult& outcome, bool from_cache);
        void item_finished(uint64_t batch_id, ItemResult item);
        void finish_if_empty(uint64_t batch_id);

        Finished finish_locked();
        static void run_finished(Finished finished);

        IAsyncLoadPrimitive&    load_primitive_;
        IMaterializePrimitive*  materialize_primitive_;
        IExecutor&              delivery_;

        mutable std::mutex  mutex_;
        ResourceCache       cache_;
        BatchState          batch_;
        uint64_t            next_batch_id_{ 1 };
        uint64_t            generation_{ 1 };   // bumped by reset()
        bool                ever_started_{ false };
        LoaderStats         stats_;
        BatchDoneFn         finished_hook_;
    };
}
