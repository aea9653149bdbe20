#pragma once

#include "backend/Config.hpp"
#include "backend/RecordStore.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "model/MediaReference.hpp"
#include "player/PlayerControl.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace reprise::session {

/**
 * SessionController: tracks the item the player has open and turns its playback
 * position into a resume record when it closes.
 *
 * Idle -> Open (file opened, record looked up) -> Playing (resume seek done, position
 * read at once and then every update interval) -> Idle (file closed, record written or purged).
 *
 * Handlers may run on the host thread and on the scheduler thread; they are serialized
 * by an internal mutex. PlayerControl calls other than open_replace() are made while
 * holding it, so they must not deliver notifications synchronously.
 */
class SessionController {
public:
    enum class State { Idle, Open, Playing };

    static constexpr std::chrono::milliseconds SEEK_RETRY_INTERVAL{50};
    static constexpr int SEEK_MAX_ATTEMPTS = 200;

    SessionController(backend::Config config,
                      backend::RecordStore store,
                      player::PlayerControl& player,
                      events::Scheduler& scheduler);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Subscribes to the host's notifications and arms the restart-last timer.
    void attach(events::EventBus& bus);
    void detach();

    void on_file_opened(const std::string& raw_path);
    // false when raw_path is not the open item (logged, nothing happens)
    bool on_file_has_played(const std::string& raw_path);
    void on_file_closed();
    void restart_last_played();

    State state() const;
    std::optional<model::MediaReference> current_reference() const;
    uint64_t current_time_ms() const;
    uint64_t stream_length_ms() const;
    const backend::Config& config() const { return config_; }

private:
    bool try_seek(uint64_t generation, uint64_t target_ms, int& attempts);
    bool poll_position(uint64_t generation);
    void start_polling_locked();
    void update_position_locked();
    void cancel_session_tasks_locked();
    void save_locked(const model::MediaReference& ref, uint64_t position_ms);
    void purge_locked(const model::MediaReference& ref);
    void reset_locked();

    const backend::Config config_;
    const backend::RecordStore store_;
    player::PlayerControl& player_;
    events::Scheduler& scheduler_;

    mutable std::mutex mutex_;
    State state_ = State::Idle;
    std::optional<model::MediaReference> current_;
    uint64_t current_time_ms_ = 0;
    uint64_t stream_length_ms_ = 0;
    uint64_t generation_ = 0;

    std::optional<events::TaskHandle> restart_task_;
    std::optional<events::TaskHandle> seek_task_;
    std::optional<events::TaskHandle> poll_task_;

    events::EventBus* bus_ = nullptr;
    std::vector<events::EventBus::SubscriptionId> subscriptions_;
};

const char* to_string(SessionController::State state);

}  // namespace reprise::session
