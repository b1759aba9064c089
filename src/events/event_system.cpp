#include "events/event_system.h"
#include "utils/logger.h"

namespace llink
{
    namespace
    {
        std::type_index payloadType(const PrintEvent &event)
        {
            return std::visit([](const auto &payload)
                              { return std::type_index(typeid(payload)); },
                              event.payload);
        }
    } // namespace

    bool EventBus::unsubscribe(EventId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &entry : handlers_)
        {
            auto &eventHandlers = entry.second;
            auto it = std::find_if(eventHandlers.begin(), eventHandlers.end(),
                                   [id](const auto &pair)
                                   { return pair.first == id; });
            if (it != eventHandlers.end())
            {
                eventHandlers.erase(it);
                return true;
            }
        }
        return false;
    }

    void EventBus::publish(const PrintEvent &event)
    {
        std::vector<Handler> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto type : {payloadType(event), std::type_index(typeid(PrintEvent))})
            {
                auto it = handlers_.find(type);
                if (it == handlers_.end())
                {
                    continue;
                }
                for (const auto &[id, handler] : it->second)
                {
                    if (handler)
                    {
                        targets.push_back(handler);
                    }
                }
            }
        }

        for (const auto &handler : targets)
        {
            try
            {
                handler(event);
            }
            catch (const std::exception &e)
            {
                LABELLINK_LOG_ERROR("Event handler failed for {} event: {}", printEventTypeToString(event.type()),
                                    e.what());
            }
        }
    }

    size_t EventBus::subscriberCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto &entry : handlers_)
        {
            count += entry.second.size();
        }
        return count;
    }

} // namespace llink
