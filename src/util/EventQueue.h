// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef EventQueue_h
#define EventQueue_h

#include <any>
#include <functional>
#include <typeindex>
#include <mutex>
#include <unordered_map>
#include <algorithm>
#include <vector>
#include <cstdint>
#include "LogGlobals.hpp"

namespace internal
{
    template <typename T>
    struct get_signature;

    template <typename R, typename Arg>
    struct get_signature<std::function<R(Arg)>>
    {
        using FunctionType = R(Arg);
        using ReturnType = R;
        using ArgType = Arg;
    };
}

class EventQueue
{
public:
    using CallbackId = uint64_t;

private:
    using CallbackType = std::function<void(const std::any&)>;

    struct Entry
    {
        CallbackId id;
        CallbackType callback;
    };

    // Callback registry. Observers may come and go at any time, so dispatch
    // works on a copy taken under the lock and invokes it unlocked.
    std::unordered_map<std::type_index, std::vector<Entry>> callback_map;
    mutable std::mutex callbacks_mutex;
    CallbackId next_id = 1;

    // Event queue + its mutex
    std::vector<std::any> events;
    mutable std::mutex events_mutex;

    // Invoke all callbacks for a single event
    void dispatch_event(const std::any& eventData) const
    {
        std::vector<Entry> targets;
        {
            std::lock_guard lock(callbacks_mutex);
            auto it = callback_map.find(std::type_index(eventData.type()));
            if (it == callback_map.end())
                return;
            targets = it->second;
        }
        for (const auto& entry : targets)
        {
            entry.callback(eventData);
        }
    }

public:

    /// Enqueue an event (thread-safe)
    template<typename EventType>
    bool enqueue_event(EventType&& event) noexcept
    {
        try {
            std::lock_guard lk(events_mutex);
            events.emplace_back(
                std::in_place_type<std::decay_t<EventType>>,
                std::forward<EventType>(event)
            );
            return true;
        }
        catch (const std::exception&) {
            return false;
        }
    }

    /// Dispatch a single event immediately, on the calling thread
    template<class EventType>
    void dispatch(const EventType& event)
    {
        dispatch_event(std::any(event));
    }

    /// Dispatch (and remove) only events of type EventType
    template<class EventType>
    void dispatch_event_type()
    {
        std::vector<std::any> work;
        {
            std::lock_guard lock(events_mutex);
            // Partition into "to dispatch" vs "to keep"
            auto it = std::stable_partition(
                events.begin(), events.end(),
                [](const std::any& e) { return e.type() != typeid(EventType); }
            );
            work.assign(std::make_move_iterator(it),
                std::make_move_iterator(events.end()));
            events.erase(it, events.end());
        }
        // Now dispatch without holding the lock:
        for (auto& e : work)
            dispatch_event(e);
    }

    /// Dispatch and remove all remaining events
    void dispatch_all_events()
    {
        // swap out the whole queue under lock, then process unlocked
        std::vector<std::any> work;
        {
            std::lock_guard lock(events_mutex);
            work.swap(events);
        }
        for (auto& e : work)
            dispatch_event(e);
    }

    /// Check if any events are pending
    bool has_pending_events() const
    {
        std::lock_guard lock(events_mutex);
        return !events.empty();
    }

    /// Clear all pending events
    void clear()
    {
        std::lock_guard lock(events_mutex);
        events.clear();
    }

    /// Registers a callback for the event type taken by the callable's single
    /// parameter. Thread-safe. Returns an id for unregister_callback().
    template<typename Callable>
    CallbackId register_callback(Callable&& callable)
    {
        using EventType = std::decay_t<typename internal::get_signature<decltype(std::function{ callable }) > ::ArgType > ;

        std::function<void(const EventType&)> callback{ std::forward<Callable>(callable) };

        auto wrapped_callback = [callback](const std::any& eventData) {
            if (auto castedEvent = std::any_cast<EventType>(&eventData))
            {
                callback(*castedEvent);
            }
            else
            {
                gload::LogGlobals::log("[ERROR] EventQueue: mismatched event type detected");
            }
            };

        std::lock_guard lock(callbacks_mutex);
        const CallbackId id = next_id++;
        callback_map[typeid(EventType)].push_back(Entry{ id, std::move(wrapped_callback) });
        return id;
    }

    /// Removes a callback. Returns false if the id is unknown.
    bool unregister_callback(CallbackId id)
    {
        std::lock_guard lock(callbacks_mutex);
        for (auto& [type, entries] : callback_map)
        {
            auto it = std::find_if(entries.begin(), entries.end(),
                [id](const Entry& e) { return e.id == id; });
            if (it != entries.end())
            {
                entries.erase(it);
                return true;
            }
        }
        return false;
    }

    /// Number of callbacks registered for EventType
    template<class EventType>
    size_t callback_count() const
    {
        std::lock_guard lock(callbacks_mutex);
        auto it = callback_map.find(typeid(EventType));
        return it != callback_map.end() ? it->second.size() : 0;
    }
};

#endif
