// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "ResourceCache.hpp"
#include <algorithm>

namespace gload
{
    std::pair<ResourceCache::EntryPtr, bool>
        ResourceCache::get_or_create(const std::string& name, bool cacheable)
    {
        auto [it, inserted] = entries_.try_emplace(name);
        if (inserted)
        {
            it->second = std::make_shared<CacheEntry>();
            it->second->name = name;
            it->second->cacheable = cacheable;
        }
        return { it->second, inserted };
    }

    ResourceCache::EntryPtr ResourceCache::lookup(const std::string& name) const
    {
        auto it = entries_.find(name);
        return it != entries_.end() ? it->second : nullptr;
    }

    bool ResourceCache::contains(const std::string& name) const
    {
        return entries_.contains(name);
    }

    std::optional<Asset> ResourceCache::loaded_object(const std::string& name) const
    {
        auto it = entries_.find(name);
        if (it == entries_.end() || it->second->state != CacheEntry::State::Loaded)
            return std::nullopt;
        return it->second->result;
    }

    bool ResourceCache::remove(const std::string& name)
    {
        return entries_.erase(name) > 0;
    }

    bool ResourceCache::remove_entry(const EntryPtr& entry)
    {
        if (!entry) return false;
        auto it = entries_.find(entry->name);
        if (it == entries_.end() || it->second != entry)
            return false;
        entries_.erase(it);
        return true;
    }

    std::vector<ResourceCache::EntryPtr> ResourceCache::detach_all()
    {
        std::vector<EntryPtr> detached;
        detached.reserve(entries_.size());
        for (auto& [name, entry] : entries_)
            detached.push_back(std::move(entry));
        entries_.clear();
        return detached;
    }

    void ResourceCache::clear()
    {
        entries_.clear();
    }

    size_t ResourceCache::size() const
    {
        return entries_.size();
    }

    bool ResourceCache::empty() const
    {
        return entries_.empty();
    }

    size_t ResourceCache::pending_count() const
    {
        return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
            [](const auto& kv) { return kv.second->state == CacheEntry::State::Pending; }));
    }

    std::vector<std::string> ResourceCache::names() const
    {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [name, entry] : entries_)
            out.push_back(name);
        std::sort(out.begin(), out.end());
        return out;
    }
}
