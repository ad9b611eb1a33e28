// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "BatchCoordinator.hpp"
#include "LogMacros.h"
#include <atomic>
#include <exception>

namespace
{
    gload::ItemResult cancelled_item(const std::string& name)
    {
        gload::ItemResult item;
        item.name = name;
        item.success = false;
        item.error = gload::ErrorCode::Cancelled;
        item.message = "Request detached by cleanup";
        return item;
    }
}

namespace gload
{
    BatchCoordinator::BatchCoordinator(
        IAsyncLoadPrimitive& load_primitive,
        IMaterializePrimitive* materialize_primitive,
        IExecutor& delivery)
        : load_primitive_(load_primitive)
        , materialize_primitive_(materialize_primitive)
        , delivery_(delivery)
    {
    }

    std::shared_ptr<BatchCoordinator> BatchCoordinator::create(
        IAsyncLoadPrimitive& load_primitive,
        IMaterializePrimitive* materialize_primitive,
        IExecutor& delivery)
    {
        return std::make_shared<BatchCoordinator>(load_primitive, materialize_primitive, delivery);
    }

    BatchStart BatchCoordinator::start(std::vector<RequestSpec> specs, BatchDoneFn on_batch_done)
    {
        Work work;
        BatchStart out;
        bool empty_batch = false;
        {
            std::lock_guard lock(mutex_);
            if (batch_.active)
            {
                ++stats_.batches_rejected;
                GLOAD_LOG_WARN("Batch rejected: batch %llu is still loading",
                    static_cast<unsigned long long>(batch_.id));
                return BatchStart{ StartStatus::AlreadyLoading, 0, {} };
            }

            batch_ = BatchState{};
            batch_.id = next_batch_id_++;
            batch_.active = true;
            batch_.total = specs.size();
            batch_.started_at = Clock::now();
            batch_.on_done = std::move(on_batch_done);
            batch_.promise = std::make_shared<std::promise<BatchResult>>();
            batch_.report.batch_id = batch_.id;
            batch_.requested_names.reserve(specs.size());
            ever_started_ = true;
            ++stats_.batches_started;

            out = BatchStart{ StartStatus::Started, batch_.id, batch_.promise->get_future().share() };

            for (auto& spec : specs)
            {
                batch_.requested_names.push_back(spec.name);
                plan_request_locked(Consumer{ std::move(spec), batch_.id, generation_, nullptr }, work);
            }
            empty_batch = batch_.total == 0;

            GLOAD_LOG_INFO("Batch %llu started: %zu requests, %zu new loads, %zu cache hits",
                static_cast<unsigned long long>(batch_.id), batch_.total, work.loads.size(), work.cache_hits.size());
        }

        if (empty_batch)
        {
            // Still completes asynchronously, like every other batch
            delivery_.post([weak_self = weak_from_this(), id = out.batch_id]()
                {
                    if (auto self = weak_self.lock())
                        self->finish_if_empty(id);
                });
        }

        run_work(std::move(work));
        return out;
    }

    std::shared_future<ItemResult> BatchCoordinator::request(RequestSpec spec)
    {
        auto promise = std::make_shared<std::promise<ItemResult>>();
        auto fut = promise->get_future().share();

        Work work;
        {
            std::lock_guard lock(mutex_);
            plan_request_locked(Consumer{ std::move(spec), 0, generation_, promise }, work);
        }
        run_work(std::move(work));
        return fut;
    }

    void BatchCoordinator::reset()
    {
        std::vector<ResourceCache::EntryPtr> detached;
        std::shared_ptr<std::promise<BatchResult>> batch_promise;
        BatchResult cancelled_report;
        {
            std::lock_guard lock(mutex_);
            ++generation_;
            detached = cache_.detach_all();

            if (batch_.active)
            {
                batch_promise = std::move(batch_.promise);
                cancelled_report = std::move(batch_.report);
                cancelled_report.cancelled = true;
                cancelled_report.success = false;
                cancelled_report.elapsed = Clock::now() - batch_.started_at;
                GLOAD_LOG_WARN("Batch %llu cancelled by cleanup (%zu of %zu done)",
                    static_cast<unsigned long long>(batch_.id), batch_.completed, batch_.total);
            }
            batch_ = BatchState{};
            ever_started_ = false;
        }

        // Standalone waiters on detached entries will never be served
        for (auto& entry : detached)
            for (auto& consumer : entry->consumers)
                if (consumer.promise)
                    consumer.promise->set_value(cancelled_item(consumer.spec.name));

        if (batch_promise)
            batch_promise->set_value(std::move(cancelled_report));
    }

    // --- Per-item load path --------------------------------------------------

    void BatchCoordinator::plan_request_locked(Consumer consumer, Work& work)
    {
        auto entry = cache_.lookup(consumer.spec.name);

        if (entry && entry->state == CacheEntry::State::Loaded)
        {
            // Cache hit: served through the delivery executor, never inline
            ++stats_.cache_hits;
            work.cache_hits.emplace_back(std::move(consumer), entry->result);
            return;
        }

        if (entry && entry->state == CacheEntry::State::Pending)
        {
            ++stats_.coalesced;
            entry->consumers.push_back(std::move(consumer));
            return;
        }

        auto [created, inserted] = cache_.get_or_create(consumer.spec.name, consumer.spec.cacheable);
        created->consumers.push_back(std::move(consumer));
        ++stats_.loads_started;
        work.loads.push_back(created);
    }

    void BatchCoordinator::run_work(Work work)
    {
        for (auto& [consumer, object] : work.cache_hits)
        {
            delivery_.post([weak_self = weak_from_this(), consumer = std::move(consumer), object = std::move(object)]() mutable
                {
                    if (auto self = weak_self.lock())
                        self->deliver(consumer, LoadResult::ok(object), true);
                });
        }

        for (const auto& entry : work.loads)
            start_load(entry);
    }

    void BatchCoordinator::start_load(const ResourceCache::EntryPtr& entry)
    {
        auto fired = std::make_shared<std::atomic<bool>>(false);

        auto completion = [weak_self = weak_from_this(), weak_entry = std::weak_ptr<CacheEntry>(entry), name = entry->name, fired](LoadResult result)
            {
                if (fired->exchange(true))
                {
                    GLOAD_LOG_WARN("Load primitive completed '%s' more than once, ignoring", name.c_str());
                    return;
                }
                auto self = weak_self.lock();
                if (!self) return;

                self->delivery_.post([weak_self, weak_entry, result = std::move(result)]() mutable
                    {
                        if (auto self = weak_self.lock())
                            self->on_load_complete(weak_entry, std::move(result));
                    });
            };

        try
        {
            load_primitive_.load_async(entry->name, completion);
        }
        catch (const std::exception& e)
        {
            completion(LoadResult::failure(std::string("Load primitive threw: ") + e.what()));
        }
    }

    void BatchCoordinator::on_load_complete(const std::weak_ptr<CacheEntry>& weak_entry, LoadResult result)
    {
        if (result.success && !result.object)
            result = LoadResult::failure("Load primitive returned no object");

        ResourceCache::EntryPtr entry;
        std::vector<Consumer> consumers;
        {
            std::lock_guard lock(mutex_);
            entry = weak_entry.lock();
            if (!entry || cache_.lookup(entry->name) != entry)
            {
                // Entry was detached by reset(): discard the result
                ++stats_.orphaned_completions;
                return;
            }

            consumers.swap(entry->consumers);
            if (result.success)
            {
                entry->state = CacheEntry::State::Loaded;
                entry->result = result.object;
                // Gone before any consumer (and so the batch callback) sees the result
                if (!entry->cacheable)
                    cache_.remove_entry(entry);
            }
            else
            {
                // Failures are never cached, a later request retries
                entry->state = CacheEntry::State::Failed;
                ++stats_.load_failures;
                cache_.remove_entry(entry);
            }
        }

        if (result.success)
            GLOAD_LOG_INFO("Loaded '%s' (%zu consumers)", entry->name.c_str(), consumers.size());
        else
            GLOAD_LOG_ERROR("Failed to load '%s': %s", entry->name.c_str(), result.message.c_str());

        for (auto& consumer : consumers)
            deliver(consumer, result, false);
    }

    void BatchCoordinator::deliver(Consumer& consumer, const LoadResult& outcome, bool from_cache)
    {
        {
            std::lock_guard lock(mutex_);
            if (consumer.generation != generation_)
            {
                ++stats_.orphaned_completions;
                if (consumer.promise)
                    consumer.promise->set_value(cancelled_item(consumer.spec.name));
                return;
            }
        }

        ItemResult item = make_item_result(consumer, outcome, from_cache);

        if (consumer.spec.on_item_done)
        {
            try
            {
                consumer.spec.on_item_done(item);
            }
            catch (const std::exception& e)
            {
                GLOAD_LOG_ERROR("Item callback for '%s' threw: %s", item.name.c_str(), e.what());
            }
        }

        if (consumer.promise)
            consumer.promise->set_value(item);

        if (consumer.batch_id != 0)
            item_finished(consumer.batch_id, std::move(item));
    }

    ItemResult BatchCoordinator::make_item_result(const Consumer& consumer, const LoadResult& outcome, bool from_cache)
    {
        ItemResult item;
        item.name = consumer.spec.name;
        item.from_cache = from_cache;

        if (!outcome.success)
        {
            item.success = false;
            item.error = ErrorCode::LoadFailed;
            item.message = outcome.message;
            return item;
        }

        if (!consumer.spec.materialize)
        {
            item.value = outcome.object;
            return item;
        }

        // Materialization happens per delivery; the cache keeps the raw object
        try
        {
            if (!materialize_primitive_)
                throw MaterializeError("No materialize primitive configured");

            item.value = materialize_primitive_->materialize(outcome.object, consumer.spec.placement);
            if (!item.value)
                throw MaterializeError("Materialize primitive returned no object");
            item.materialized = true;
        }
        catch (const std::exception& e)
        {
            item.success = false;
            item.error = ErrorCode::MaterializeFailed;
            item.message = e.what();
            item.value = Asset{};

            std::lock_guard lock(mutex_);
            ++stats_.materialize_failures;
        }
        if (!item.success)
            GLOAD_LOG_ERROR("Failed to materialize '%s': %s", item.name.c_str(), item.message.c_str());
        return item;
    }

    // --- Batch completion ----------------------------------------------------

    void BatchCoordinator::item_finished(uint64_t batch_id, ItemResult item)
    {
        std::optional<Finished> finished;
        {
            std::lock_guard lock(mutex_);
            if (!batch_.active || batch_.id != batch_id)
                return;

            ++batch_.completed;
            batch_.report.add_result(std::move(item));
            if (batch_.completed == batch_.total)
                finished = finish_locked();
        }
        if (finished)
            run_finished(std::move(*finished));
    }

    void BatchCoordinator::finish_if_empty(uint64_t batch_id)
    {
        std::optional<Finished> finished;
        {
            std::lock_guard lock(mutex_);
            if (batch_.active && batch_.id == batch_id && batch_.total == 0)
                finished = finish_locked();
        }
        if (finished)
            run_finished(std::move(*finished));
    }

    BatchCoordinator::Finished BatchCoordinator::finish_locked()
    {
        batch_.active = false;
        batch_.final_elapsed = Clock::now() - batch_.started_at;
        batch_.report.elapsed = batch_.final_elapsed;
        ++stats_.batches_finished;

        GLOAD_LOG_INFO("Batch %llu finished: %zu requests, %zu failed, %.3f s",
            static_cast<unsigned long long>(batch_.id), batch_.total,
            batch_.report.failure_count(), batch_.final_elapsed.count());

        return Finished{ std::move(batch_.on_done), finished_hook_, std::move(batch_.promise), std::move(batch_.report) };
    }

    void BatchCoordinator::set_finished_hook(BatchDoneFn hook)
    {
        std::lock_guard lock(mutex_);
        finished_hook_ = std::move(hook);
    }

    void BatchCoordinator::run_finished(Finished finished)
    {
        if (finished.on_done)
        {
            try
            {
                finished.on_done(finished.report);
            }
            catch (const std::exception& e)
            {
                GLOAD_LOG_ERROR("Batch callback threw: %s", e.what());
            }
        }
        if (finished.hook)
        {
            try
            {
                finished.hook(finished.report);
            }
            catch (const std::exception& e)
            {
                GLOAD_LOG_ERROR("Batch observer threw: %s", e.what());
            }
        }
        if (finished.promise)
            finished.promise->set_value(std::move(finished.report));
    }

    // --- Queries ---------------------------------------------------------------

    bool BatchCoordinator::is_active() const
    {
        std::lock_guard lock(mutex_);
        return batch_.active;
    }

    float BatchCoordinator::progress() const
    {
        std::lock_guard lock(mutex_);
        if (!ever_started_)
            return 0.0f;
        if (batch_.total == 0)
            return batch_.active ? 0.0f : 1.0f;
        return static_cast<float>(batch_.completed) / static_cast<float>(batch_.total);
    }

    std::chrono::duration<double> BatchCoordinator::elapsed() const
    {
        std::lock_guard lock(mutex_);
        if (batch_.active)
            return Clock::now() - batch_.started_at;
        return batch_.final_elapsed;
    }

    size_t BatchCoordinator::completed_count() const
    {
        std::lock_guard lock(mutex_);
        return batch_.completed;
    }

    size_t BatchCoordinator::total_count() const
    {
        std::lock_guard lock(mutex_);
        return batch_.total;
    }

    std::vector<std::string> BatchCoordinator::requested_names() const
    {
        std::lock_guard lock(mutex_);
        return batch_.requested_names;
    }

    std::optional<Asset> BatchCoordinator::cached(const std::string& name) const
    {
        std::lock_guard lock(mutex_);
        return cache_.loaded_object(name);
    }

    bool BatchCoordinator::has_entry(const std::string& name) const
    {
        std::lock_guard lock(mutex_);
        return cache_.contains(name);
    }

    bool BatchCoordinator::is_resolved(const std::string& name) const
    {
        std::lock_guard lock(mutex_);
        auto entry = cache_.lookup(name);
        return entry && entry->state == CacheEntry::State::Loaded;
    }

    size_t BatchCoordinator::cache_size() const
    {
        std::lock_guard lock(mutex_);
        return cache_.size();
    }

    LoaderStats BatchCoordinator::stats() const
    {
        std::lock_guard lock(mutex_);
        return stats_;
    }
}
