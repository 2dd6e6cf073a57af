#pragma once

#include <algorithm>
#include <any>
#include <functional>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace roon_mpris::core {

// Synchronous type-keyed publish/subscribe. Handlers run on the publishing
// thread, which for every event in this application is the Qt main loop.
class EventBus {
public:
    using EventHandler = std::function<void(const std::any&)>;
    using HandlerId = std::size_t;

    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::lock_guard lock(m_mutex);

        auto type_index = std::type_index(typeid(EventType));
        auto wrapped_handler = [handler = std::move(handler)](const std::any& event) {
            handler(std::any_cast<const EventType&>(event));
        };

        HandlerId id = m_next_handler_id++;
        m_handlers[type_index].emplace_back(id, std::move(wrapped_handler));
        m_handler_types.emplace(id, type_index);

        return id;
    }

    template<typename EventType>
    void publish(const EventType& event) {
        std::vector<EventHandler> handlers_copy;

        {
            std::lock_guard lock(m_mutex);
            auto it = m_handlers.find(std::type_index(typeid(EventType)));
            if (it != m_handlers.end()) {
                handlers_copy.reserve(it->second.size());
                for (const auto& [id, handler] : it->second) {
                    handlers_copy.push_back(handler);
                }
            }
        }

        const std::any boxed = event;
        for (const auto& handler : handlers_copy) {
            try {
                handler(boxed);
            } catch (const std::exception& e) {
                handle_exception(typeid(EventType).name(), e);
            }
        }
    }

    void unsubscribe(HandlerId id) {
        std::lock_guard lock(m_mutex);

        auto type_it = m_handler_types.find(id);
        if (type_it == m_handler_types.end()) {
            return;
        }

        auto& handlers = m_handlers[type_it->second];
        handlers.erase(
            std::remove_if(handlers.begin(), handlers.end(),
                          [id](const auto& pair) { return pair.first == id; }),
            handlers.end()
        );

        m_handler_types.erase(type_it);
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::lock_guard lock(m_mutex);
        auto it = m_handlers.find(std::type_index(typeid(EventType)));
        return it != m_handlers.end() ? it->second.size() : 0;
    }

private:
    void handle_exception(const std::string& event_type, const std::exception& e);

    mutable std::mutex m_mutex;
    std::unordered_map<std::type_index, std::vector<std::pair<HandlerId, EventHandler>>> m_handlers;
    std::unordered_map<HandlerId, std::type_index> m_handler_types;
    HandlerId m_next_handler_id{1};
};

}
