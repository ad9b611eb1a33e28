// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "GroupLoader.hpp"
#include "LogMacros.h"
#include <sstream>
#include <stdexcept>
#include <iomanip>

namespace gload
{
    GroupLoader::GroupLoader(
        IAsyncLoadPrimitive& load_primitive,
        IMaterializePrimitive* materialize_primitive,
        IExecutor& delivery,
        EventQueue* event_queue,
        RequestDefaults defaults)
        : coordinator_(BatchCoordinator::create(load_primitive, materialize_primitive, delivery))
        , event_queue_(event_queue)
        , defaults_(defaults)
    {
        // Fan out to every observer, not only the caller
        if (event_queue_)
        {
            coordinator_->set_finished_hook([events = event_queue_](const BatchResult& result)
                {
                    events->dispatch(BatchFinishedEvent{ result });
                });
        }
    }

    GroupLoader::~GroupLoader()
    {
        coordinator_->reset();
    }

    BatchStart GroupLoader::load_many(const std::vector<std::string>& names, BatchDoneFn on_done)
    {
        std::vector<RequestSpec> specs;
        specs.reserve(names.size());
        for (const auto& name : names)
        {
            RequestSpec spec;
            spec.name = name;
            spec.cacheable = defaults_.cacheable;
            spec.materialize = defaults_.materialize;
            specs.push_back(std::move(spec));
        }
        return load_many(std::move(specs), std::move(on_done));
    }

    BatchStart GroupLoader::load_many(std::vector<RequestSpec> specs, BatchDoneFn on_done)
    {
        return coordinator_->start(std::move(specs), std::move(on_done));
    }

    std::shared_future<ItemResult> GroupLoader::load(RequestSpec spec)
    {
        return coordinator_->request(std::move(spec));
    }

    std::shared_future<ItemResult> GroupLoader::load(const std::string& name)
    {
        RequestSpec spec;
        spec.name = name;
        spec.cacheable = defaults_.cacheable;
        spec.materialize = defaults_.materialize;
        return load(std::move(spec));
    }

    std::optional<Asset> GroupLoader::get_cached(const std::string& name) const
    {
        return coordinator_->cached(name);
    }

    bool GroupLoader::has_resource(const std::string& name) const
    {
        return coordinator_->has_entry(name);
    }

    bool GroupLoader::is_done(const std::string& name) const
    {
        return coordinator_->is_resolved(name);
    }

    bool GroupLoader::is_loading() const
    {
        return coordinator_->is_active();
    }

    float GroupLoader::progress() const
    {
        return coordinator_->progress();
    }

    std::chrono::duration<double> GroupLoader::elapsed() const
    {
        return coordinator_->elapsed();
    }

    void GroupLoader::cleanup()
    {
        GLOAD_LOG_INFO("Cleanup: dropping %zu cache entries", coordinator_->cache_size());
        coordinator_->reset();
    }

    EventQueue::CallbackId GroupLoader::on_batch_finished(std::function<void(const BatchFinishedEvent&)> observer)
    {
        if (!event_queue_)
            throw std::logic_error("GroupLoader has no event queue to subscribe to");
        return event_queue_->register_callback(std::move(observer));
    }

    bool GroupLoader::remove_observer(EventQueue::CallbackId id)
    {
        return event_queue_ && event_queue_->unregister_callback(id);
    }

    LoaderStats GroupLoader::stats() const
    {
        return coordinator_->stats();
    }

    size_t GroupLoader::cache_size() const
    {
        return coordinator_->cache_size();
    }

    std::string GroupLoader::to_string() const
    {
        const auto s = coordinator_->stats();
        std::ostringstream oss;
        oss << "GroupLoader{ loading: " << (is_loading() ? "yes" : "no")
            << ", progress: " << std::fixed << std::setprecision(2) << progress()
            << ", elapsed: " << std::setprecision(3) << elapsed().count() << " s"
            << ", cached: " << coordinator_->cache_size()
            << ", loads: " << s.loads_started
            << ", hits: " << s.cache_hits
            << ", coalesced: " << s.coalesced
            << ", failures: " << (s.load_failures + s.materialize_failures)
            << " }";
        return oss.str();
    }
}
