// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LoaderContext.hpp"

#include "LogManager.hpp"
#include "LogGlobals.hpp"
#include "LogMacros.h"
#include "ThreadPool.hpp"
#include "EventQueue.h"
#include "CallbackQueue.hpp"
#include "SerialExecutor.hpp"
#include "FileLoadPrimitive.hpp"
#include "InstanceMaterializer.hpp"
#include "GroupLoader.hpp"

namespace gload
{
    LoaderContext::LoaderContext(LoaderConfig config_)
        : config(std::move(config_))
        , log_manager(std::make_shared<LogManager>(config.log))
        , event_queue(std::make_unique<EventQueue>())
        , callback_queue(std::make_unique<CallbackQueue>())
        , thread_pool(std::make_unique<ThreadPool>(config.worker_threads, "gload-workers"))
    {
        LogGlobals::set_logger(log_manager);

        if (config.delivery == DeliveryMode::Strand)
            strand = std::make_unique<SerialExecutor>(*thread_pool);

        load_primitive = std::make_unique<FileLoadPrimitive>(config.asset_root, *thread_pool);
        materializer = std::make_unique<InstanceMaterializer>();
        loader = std::make_unique<GroupLoader>(
            *load_primitive,
            materializer.get(),
            delivery(),
            event_queue.get(),
            config.request_defaults);

        GLOAD_LOG(this, "[INFO] Loader context ready: %zu workers, %s delivery, root '%s'",
            thread_pool->nbr_threads(), to_string(config.delivery), config.asset_root.string().c_str());
    }

    LoaderContext::~LoaderContext()
    {
        // Order matters: pool tasks still reference primitives and the delivery executor
        loader.reset();
        thread_pool.reset();
        strand.reset();
        load_primitive.reset();
        materializer.reset();
        callback_queue.reset();
        event_queue.reset();
    }

    IExecutor& LoaderContext::delivery()
    {
        if (strand)
            return *strand;
        return *callback_queue;
    }

    size_t LoaderContext::pump()
    {
        size_t count = callback_queue->execute_all();
        event_queue->dispatch_all_events();
        return count;
    }

    LoaderContextPtr make_loader_context(const std::filesystem::path& config_path)
    {
        return std::make_unique<LoaderContext>(load_config(config_path));
    }
}
