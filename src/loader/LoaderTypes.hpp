// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "Asset.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace gload
{
    enum class ErrorCode { None, LoadFailed, MaterializeFailed, Cancelled };

    inline const char* to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::None: return "None";
        case ErrorCode::LoadFailed: return "LoadFailed";
        case ErrorCode::MaterializeFailed: return "MaterializeFailed";
        case ErrorCode::Cancelled: return "Cancelled";
        }
        return "Unknown";
    }

    /// Thrown by load primitives internally; reported as ErrorCode::LoadFailed
    class LoadError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Thrown by materialize primitives; reported as ErrorCode::MaterializeFailed
    class MaterializeError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// What one request receives when it resolves
    struct ItemResult
    {
        std::string name{};
        bool success{ true };
        ErrorCode error{ ErrorCode::None };
        std::string message{};
        Asset value{};              // raw or materialized object, empty on failure
        bool from_cache{ false };   // served from a Loaded entry without a new load
        bool materialized{ false };
    };

    using ItemDoneFn = std::function<void(const ItemResult&)>;

    /// One requested resource. The placement is handed to the materialize
    /// primitive untouched and may be empty.
    struct RequestSpec
    {
        std::string name{};
        bool cacheable{ false };
        bool materialize{ false };
        Asset placement{};
        ItemDoneFn on_item_done{};
    };

    /// Defaults used when a batch is given as plain names
    struct RequestDefaults
    {
        bool cacheable{ false };
        bool materialize{ false };
    };

    // Result of a batch (one entry per request, in completion order)
    struct BatchResult
    {
        uint64_t batch_id{ 0 };
        bool success{ true };
        bool cancelled{ false };
        std::vector<ItemResult> results;
        std::chrono::duration<double> elapsed{ 0.0 };

        void add_result(ItemResult item)
        {
            success &= item.success;
            results.push_back(std::move(item));
        }

        size_t failure_count() const
        {
            size_t n = 0;
            for (const auto& r : results)
                if (!r.success) ++n;
            return n;
        }
    };

    using BatchDoneFn = std::function<void(const BatchResult&)>;

    enum class StartStatus { Started, AlreadyLoading };

    /// Outcome of load_many(). A rejected start has no valid future.
    struct BatchStart
    {
        StartStatus status{ StartStatus::AlreadyLoading };
        uint64_t batch_id{ 0 };
        std::shared_future<BatchResult> done{};

        bool started() const { return status == StartStatus::Started; }
        explicit operator bool() const { return started(); }
    };

    /// Completion value of an async load primitive
    struct LoadResult
    {
        bool success{ true };
        Asset object{};
        std::string message{};

        static LoadResult ok(Asset object)
        {
            return LoadResult{ true, std::move(object), {} };
        }

        static LoadResult failure(std::string message)
        {
            return LoadResult{ false, {}, std::move(message) };
        }
    };

    struct LoaderStats
    {
        size_t loads_started{ 0 };
        size_t load_failures{ 0 };
        size_t cache_hits{ 0 };
        size_t coalesced{ 0 };          // requests attached to a pending entry
        size_t materialize_failures{ 0 };
        size_t orphaned_completions{ 0 };
        size_t batches_started{ 0 };
        size_t batches_finished{ 0 };
        size_t batches_rejected{ 0 };
    };

    /// Published to every EventQueue observer when a batch completes
    struct BatchFinishedEvent
    {
        BatchResult result;
    };

} // namespace gload
