#pragma once

#include <algorithm>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>
#include "labellink_export.h"
#include "types/event.h"

namespace llink
{
    /**
     * Event Bus
     * Dispatches print events to subscribers of a specific payload type
     * or of every event. Handlers run on the publishing thread, outside
     * the subscription lock.
     */
    class LABELLINK_API EventBus
    {
    public:
        using EventId = size_t;
        using Handler = std::function<void(const PrintEvent &)>;

        /**
         * Subscribe to one payload type, e.g. subscribe<CompletedEvent>(...)
         */
        template <typename EventType>
        EventId subscribe(std::function<void(const EventType &)> handler)
        {
            return addHandler(std::type_index(typeid(EventType)),
                              [handler](const PrintEvent &event)
                              {
                                  if (const EventType *typed = event.as<EventType>())
                                  {
                                      handler(*typed);
                                  }
                              });
        }

        /**
         * Subscribe to every event in publication order
         */
        EventId subscribeAll(Handler handler)
        {
            return addHandler(std::type_index(typeid(PrintEvent)), std::move(handler));
        }

        /**
         * Unsubscribe
         */
        bool unsubscribe(EventId id);

        /**
         * Publish an event
         */
        void publish(const PrintEvent &event);

        /**
         * Clear all subscriptions
         */
        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers_.clear();
        }

        size_t subscriberCount() const;

    private:
        EventId addHandler(std::type_index type, Handler handler)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            EventId id = nextId_++;
            handlers_[type].emplace_back(id, std::move(handler));
            return id;
        }

        mutable std::mutex mutex_;
        EventId nextId_ = 1;
        std::unordered_map<std::type_index, std::vector<std::pair<EventId, Handler>>> handlers_;
    };

} // namespace llink
