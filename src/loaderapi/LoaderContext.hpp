// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "LoaderConfig.hpp"
#include "ILogManager.hpp"
#include <filesystem>
#include <memory>

struct IExecutor;
class ThreadPool;
class EventQueue;
class CallbackQueue;

namespace gload
{
    class LogManager;
    class SerialExecutor;
    class FileLoadPrimitive;
    class InstanceMaterializer;
    class GroupLoader;

    /*
    Loader context facilities:
    - Logger (also installed as the global logger)
    - Event queue (BatchFinishedEvent observers)
    - Delivery executor: callback queue or strand, per config
    - Thread pool for file loads
    - File load primitive + instance materializer
    - Group loader
    */
    struct LoaderContext
    {
        explicit LoaderContext(LoaderConfig config);

        /// Tears down the loader, then joins the pool, then the rest
        ~LoaderContext();

        LoaderContext(const LoaderContext&) = delete;
        LoaderContext& operator=(const LoaderContext&) = delete;

        /// The executor load completions are delivered on
        IExecutor& delivery();

        /// Runs queued deliveries (Queue mode). Returns the number of tasks run.
        size_t pump();

        LoaderConfig                            config;
        std::shared_ptr<LogManager>             log_manager;
        std::unique_ptr<EventQueue>             event_queue;
        std::unique_ptr<CallbackQueue>          callback_queue;
        std::unique_ptr<ThreadPool>             thread_pool;
        std::unique_ptr<SerialExecutor>         strand;
        std::unique_ptr<FileLoadPrimitive>      load_primitive;
        std::unique_ptr<InstanceMaterializer>   materializer;
        std::unique_ptr<GroupLoader>            loader;
    };

    using LoaderContextPtr = std::unique_ptr<LoaderContext>;

    /// Context from a JSON config file. Throws ConfigError.
    LoaderContextPtr make_loader_context(const std::filesystem::path& config_path);
}
