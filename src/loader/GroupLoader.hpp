// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "LoaderTypes.hpp"
#include "BatchCoordinator.hpp"
#include "EventQueue.h"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gload
{
    /**
     * @brief Entry point for loading groups of named resources.
     *
     * Loads batches through the host's load primitive, caches results by name,
     * coalesces duplicate requests and reports progress. Completion of a batch is
     * reported to the batch callback, to the batch future and, if an EventQueue
     * was given, as a BatchFinishedEvent to every registered observer.
     *
     * Owned explicitly (typically by LoaderContext) and passed by reference.
     */
    class GroupLoader
    {
    public:
        GroupLoader(
            IAsyncLoadPrimitive& load_primitive,
            IMaterializePrimitive* materialize_primitive,
            IExecutor& delivery,
            EventQueue* event_queue = nullptr,
            RequestDefaults defaults = {});

        /// Detaches everything still in flight
        ~GroupLoader();

        GroupLoader(const GroupLoader&) = delete;
        GroupLoader& operator=(const GroupLoader&) = delete;

        /// Load names using the request defaults. AlreadyLoading if a batch is active.
        BatchStart load_many(const std::vector<std::string>& names, BatchDoneFn on_done = {});

        /// Load a batch with per-request options. AlreadyLoading if a batch is active.
        BatchStart load_many(std::vector<RequestSpec> specs, BatchDoneFn on_done = {});

        /// Standalone request, allowed while a batch is active
        std::shared_future<ItemResult> load(RequestSpec spec);
        std::shared_future<ItemResult> load(const std::string& name);

        /// Cached raw object; never starts a load
        std::optional<Asset> get_cached(const std::string& name) const;

        template<class T>
        std::shared_ptr<const T> get_cached_as(const std::string& name) const
        {
            if (auto asset = get_cached(name))
                return asset->get<T>();
            return nullptr;
        }

        /// True if an entry exists for name (pending or loaded)
        bool has_resource(const std::string& name) const;

        /// True if name is loaded and held by the cache
        bool is_done(const std::string& name) const;

        bool is_loading() const;
        float progress() const;
        std::chrono::duration<double> elapsed() const;

        /// Clear the cache and reset progress and clock. Safe mid-batch.
        void cleanup();

        /// Subscribe to BatchFinishedEvent. Throws std::logic_error without an event queue.
        EventQueue::CallbackId on_batch_finished(std::function<void(const BatchFinishedEvent&)> observer);
        bool remove_observer(EventQueue::CallbackId id);

        LoaderStats stats() const;
        const RequestDefaults& defaults() const { return defaults_; }
        size_t cache_size() const;

        std::string to_string() const;

    private:
        std::shared_ptr<BatchCoordinator> coordinator_;
        EventQueue* event_queue_;
        RequestDefaults defaults_;
    };
}
