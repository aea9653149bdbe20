#include "session/ResumeService.hpp"
#include "backend/RecordStore.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <system_error>

namespace reprise::session {

ResumeService::ResumeService(player::PlayerControl& player, events::EventBus& bus)
    : ResumeService(player, bus, util::Platform::get_data_directory()) {}

ResumeService::ResumeService(player::PlayerControl& player, events::EventBus& bus, std::filesystem::path base_dir)
    : player_(player), bus_(bus), base_dir_(std::move(base_dir)) {}

ResumeService::~ResumeService() {
    stop();
}

bool ResumeService::start() {
    if (running()) return true;

    util::Logger::info("ResumeService: Starting in " + base_dir_.string());

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
    if (ec) {
        util::Logger::error("ResumeService: Cannot create " + base_dir_.string() + ": " + ec.message());
        return false;
    }

    auto config_file = base_dir_ / backend::ConfigLoader::FILE_NAME;
    if (!std::filesystem::exists(config_file, ec)) {
        if (!backend::ConfigLoader::save_config(backend::Config{}, config_file)) {
            util::Logger::warn("ResumeService: Could not write default config");
        }
    }
    config_ = backend::ConfigLoader::load_config(base_dir_);

    timer_thread_ = std::jthread([this](std::stop_token st) { scheduler_.run(st); });

    controller_ = std::make_unique<SessionController>(config_, backend::RecordStore(base_dir_), player_, scheduler_);
    controller_->attach(bus_);
    return true;
}

void ResumeService::stop() {
    if (!running()) return;

    util::Logger::info("ResumeService: Stopping");
    controller_->detach();

    // Join before the controller goes away; its tasks capture it
    timer_thread_.request_stop();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    controller_.reset();
}

}  // namespace reprise::session
