#include "events/EventBus.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace reprise::events {

const char* to_string(PlayerEvent::Type type) {
    switch (type) {
        case PlayerEvent::Type::FileOpened: return "FileOpened";
        case PlayerEvent::Type::FileHasPlayed: return "FileHasPlayed";
        case PlayerEvent::Type::FileClosed: return "FileClosed";
        case PlayerEvent::Type::HostShuttingDown: return "HostShuttingDown";
    }
    return "Unknown";
}

EventBus::SubscriptionId EventBus::subscribe(PlayerEvent::Type type, Handler handler) {
    reprise::util::Logger::debug(std::string("EventBus: Subscribing to ") + to_string(type));

    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[type].push_back({id, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [type, subs] : subscribers_) {
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   subs.end());
    }
}

void EventBus::publish(const PlayerEvent& event) {
    reprise::util::Logger::debug(std::string("EventBus: Publishing ") + to_string(event.type));

    // Copy handlers to avoid holding lock during execution
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(event.type);
        if (it != subscribers_.end()) {
            for (const auto& sub : it->second) {
                handlers.push_back(sub.handler);
            }
        }
    }

    for (const auto& handler : handlers) {
        handler(event);
    }
}

size_t EventBus::subscriber_count(PlayerEvent::Type type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(type);
    return it == subscribers_.end() ? 0 : it->second.size();
}

}  // namespace reprise::events
