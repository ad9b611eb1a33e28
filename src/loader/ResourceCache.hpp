// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "LoaderTypes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gload
{
    // A request waiting on an entry
    struct Consumer
    {
        RequestSpec spec;
        uint64_t batch_id{ 0 };                             // 0 for standalone requests
        uint64_t generation{ 0 };                           // loader generation at request time
        std::shared_ptr<std::promise<ItemResult>> promise;  // standalone requests only
    };

    struct CacheEntry
    {
        enum class State { Pending, Loaded, Failed };

        std::string name;
        State state{ State::Pending };
        Asset result{};                 // raw loaded object, never the materialized one
        bool cacheable{ false };        // decided by the request that created the entry
        std::vector<Consumer> consumers;
    };

    /// Name-keyed store of in-flight and completed loads.
    /// Not synchronized; BatchCoordinator guards it with its mutex.
    class ResourceCache
    {
    public:
        using EntryPtr = std::shared_ptr<CacheEntry>;

        /// Existing entry for `name` (any state), or a new Pending one.
        /// The bool is true if the entry was created by this call.
        std::pair<EntryPtr, bool> get_or_create(const std::string& name, bool cacheable = false);

        EntryPtr lookup(const std::string& name) const;

        bool contains(const std::string& name) const;

        /// Raw object of a Loaded entry
        std::optional<Asset> loaded_object(const std::string& name) const;

        /// Unconditional removal. Returns false if no entry existed.
        bool remove(const std::string& name);

        /// Removes the entry only if its name still maps to this exact entry.
        /// A completion that outlived a clear() therefore cannot evict a newer entry.
        bool remove_entry(const EntryPtr& entry);

        /// Removes all entries and hands them back to the caller
        std::vector<EntryPtr> detach_all();

        void clear();

        size_t size() const;
        bool empty() const;
        size_t pending_count() const;
        std::vector<std::string> names() const;

    private:
        std::unordered_map<std::string, EntryPtr> entries_;
    };
}
