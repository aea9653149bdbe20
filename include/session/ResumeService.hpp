#pragma once

#include "backend/Config.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "player/PlayerControl.hpp"
#include "session/SessionController.hpp"
#include <filesystem>
#include <memory>
#include <thread>

namespace reprise::session {

/**
 * ResumeService: what a host plugin instantiates.
 *
 * Owns the config, the timer thread and the session controller for one player.
 * start() and stop() may be called repeatedly.
 */
class ResumeService {
public:
    // Uses Platform::get_data_directory()
    ResumeService(player::PlayerControl& player, events::EventBus& bus);
    ResumeService(player::PlayerControl& player, events::EventBus& bus, std::filesystem::path base_dir);
    ~ResumeService();

    ResumeService(const ResumeService&) = delete;
    ResumeService& operator=(const ResumeService&) = delete;

    bool start();
    void stop();

    bool running() const { return controller_ != nullptr; }
    const backend::Config& config() const { return config_; }
    const std::filesystem::path& base_dir() const { return base_dir_; }
    SessionController* controller() { return controller_.get(); }

private:
    player::PlayerControl& player_;
    events::EventBus& bus_;
    std::filesystem::path base_dir_;

    backend::Config config_;
    events::Scheduler scheduler_;
    std::jthread timer_thread_;
    std::unique_ptr<SessionController> controller_;
};

}  // namespace reprise::session
