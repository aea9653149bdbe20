#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace reprise::events {

// Notifications the host player delivers to the resume core.
struct PlayerEvent {
    enum class Type {
        FileOpened,
        FileHasPlayed,
        FileClosed,
        HostShuttingDown,
    };
    Type type;
    std::string path;  // Raw path for FileOpened / FileHasPlayed, empty otherwise
};

class EventBus {
public:
    using Handler = std::function<void(const PlayerEvent&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(PlayerEvent::Type type, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const PlayerEvent& event);

    size_t subscriber_count(PlayerEvent::Type type) const;

private:
    struct Subscription {
        SubscriptionId id;
        Handler handler;
    };

    std::map<PlayerEvent::Type, std::vector<Subscription>> subscribers_;
    mutable std::mutex mutex_;
    SubscriptionId next_id_ = 1;
};

const char* to_string(PlayerEvent::Type type);

}  // namespace reprise::events
