#pragma once

#include <functional>
#include <queue>
#include <unordered_map>
#include <utility>
#include <vector>

namespace engine::core
{
template <typename EventT>
class EventBus
{
public:
    using Event = EventT;
    using EventType = decltype(EventT::type);
    using Handler = std::function<void(const EventT&)>;

    void Subscribe(EventType type, Handler handler)
    {
        m_handlers[type].push_back(std::move(handler));
    }

    void SubscribeAll(Handler handler)
    {
        m_catchAll.push_back(std::move(handler));
    }

    void Publish(EventT event)
    {
        m_queue.push(std::move(event));
    }

    void DispatchQueued()
    {
        while (!m_queue.empty())
        {
            EventT event = std::move(m_queue.front());
            m_queue.pop();

            for (const Handler& handler : m_catchAll)
            {
                handler(event);
            }

            const auto it = m_handlers.find(event.type);
            if (it == m_handlers.end())
            {
                continue;
            }

            for (const Handler& handler : it->second)
            {
                handler(event);
            }
        }
    }

private:
    std::unordered_map<EventType, std::vector<Handler>> m_handlers;
    std::vector<Handler> m_catchAll;
    std::queue<EventT> m_queue;
};
} // namespace engine::core
