#include "session/SessionController.hpp"
#include "backend/ResumePolicy.hpp"
#include "util/Logger.hpp"
#include "util/PathIdentity.hpp"
#include <exception>
#include <filesystem>
#include <system_error>

namespace reprise::session {

namespace {

uint64_t now_epoch_ms() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

void cancel_task(std::optional<events::TaskHandle>& task) {
    if (task) {
        task->cancel();
        task.reset();
    }
}

}  // namespace

const char* to_string(SessionController::State state) {
    switch (state) {
        case SessionController::State::Idle: return "Idle";
        case SessionController::State::Open: return "Open";
        case SessionController::State::Playing: return "Playing";
    }
    return "Unknown";
}

SessionController::SessionController(backend::Config config,
                                     backend::RecordStore store,
                                     player::PlayerControl& player,
                                     events::Scheduler& scheduler)
    : config_(config),
      store_(std::move(store)),
      player_(player),
      scheduler_(scheduler) {}

SessionController::~SessionController() {
    detach();
}

void SessionController::attach(events::EventBus& bus) {
    if (bus_) {
        util::Logger::warn("SessionController: Already attached");
        return;
    }
    util::Logger::info("SessionController: Attaching (records in " + store_.base_dir().string() + ")");

    bus_ = &bus;
    using Type = events::PlayerEvent::Type;

    subscriptions_.push_back(bus.subscribe(Type::FileOpened,
        [this](const events::PlayerEvent& evt) { on_file_opened(evt.path); }));
    subscriptions_.push_back(bus.subscribe(Type::FileHasPlayed,
        [this](const events::PlayerEvent& evt) { on_file_has_played(evt.path); }));
    subscriptions_.push_back(bus.subscribe(Type::FileClosed,
        [this](const events::PlayerEvent&) { on_file_closed(); }));
    subscriptions_.push_back(bus.subscribe(Type::HostShuttingDown,
        [this](const events::PlayerEvent&) { on_file_closed(); }));

    if (config_.restart_last) {
        std::lock_guard<std::mutex> lock(mutex_);
        restart_task_ = scheduler_.schedule_once("restart-last",
            std::chrono::seconds(config_.restart_delay_sec),
            [this] { restart_last_played(); });
    }
}

void SessionController::detach() {
    if (bus_) {
        for (auto id : subscriptions_) {
            bus_->unsubscribe(id);
        }
        subscriptions_.clear();
        bus_ = nullptr;
        util::Logger::info("SessionController: Detached");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cancel_task(restart_task_);
    cancel_session_tasks_locked();
}

void SessionController::on_file_opened(const std::string& raw_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_task(restart_task_);

    if (current_) {
        util::Logger::warn("SessionController: " + current_->raw_path +
                           " still open when " + raw_path + " was opened, dropping it");
        cancel_session_tasks_locked();
        reset_locked();
    }

    util::Logger::info("SessionController: File opened: " + raw_path);

    try {
        current_ = util::PathIdentity::resolve(raw_path);
    } catch (const std::exception& e) {
        util::Logger::error("SessionController: Cannot identify " + raw_path + ": " + e.what());
        return;
    }
    ++generation_;
    state_ = State::Open;
    current_time_ms_ = 0;
    stream_length_ms_ = 0;

    auto record_path = store_.record_path(current_->identity_hash);
    try {
        if (auto record = backend::RecordStore::read(record_path)) {
            current_time_ms_ = record->time_ms;
            util::Logger::info("SessionController: Resume point for " + current_->relative_path +
                               " at " + std::to_string(current_time_ms_) + "ms");
        }
    } catch (const backend::RecordParseError& e) {
        util::Logger::warn(std::string("SessionController: Failed to read resume record: ") + e.what());
        current_time_ms_ = 0;
    }
}

bool SessionController::on_file_has_played(const std::string& raw_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!current_ || current_->raw_path != raw_path) {
        util::Logger::error("SessionController: The opened file " +
                            (current_ ? current_->raw_path : std::string("<none>")) +
                            " and the played file " + raw_path + " are not the same");
        return false;
    }
    if (state_ != State::Open) {
        util::Logger::debug("SessionController: " + raw_path + " reported played again in state " + to_string(state_));
        return true;
    }

    if (seek_task_ && seek_task_->active()) return true;

    if (current_time_ms_ == 0) {
        start_polling_locked();
        return true;
    }

    uint64_t generation = generation_;
    uint64_t target = current_time_ms_;
    int attempts = 0;
    seek_task_ = scheduler_.schedule_every("resume-seek", SEEK_RETRY_INTERVAL,
        [this, generation, target, attempts]() mutable {
            return try_seek(generation, target, attempts);
        });
    return true;
}

bool SessionController::try_seek(uint64_t generation, uint64_t target_ms, int& attempts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || state_ != State::Open) return false;

    ++attempts;
    bool seekable = false;
    try {
        seekable = player_.is_seekable();
        if (seekable) {
            player_.seek_to(target_ms, true);
            util::Logger::info("SessionController: Resumed at " + std::to_string(target_ms) + "ms");
        }
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("SessionController: Seek failed: ") + e.what());
        seekable = false;
    }

    if (!seekable && attempts < SEEK_MAX_ATTEMPTS) return true;

    if (!seekable) {
        util::Logger::warn("SessionController: Stream never became seekable after " +
                           std::to_string(attempts) + " attempts, not resuming");
    }
    seek_task_.reset();
    start_polling_locked();
    return false;
}

void SessionController::start_polling_locked() {
    state_ = State::Playing;
    update_position_locked();

    uint64_t generation = generation_;
    poll_task_ = scheduler_.schedule_every("update-position",
        std::chrono::seconds(config_.update_interval_sec),
        [this, generation] { return poll_position(generation); });
}

bool SessionController::poll_position(uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || state_ != State::Playing) return false;

    update_position_locked();
    return true;
}

void SessionController::update_position_locked() {
    try {
        current_time_ms_ = player_.get_current_time_ms();
        stream_length_ms_ = player_.get_stream_length_ms();
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("SessionController: Failed to update position from player: ") + e.what());
    }
}

void SessionController::on_file_closed() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_session_tasks_locked();

    if (!current_) return;

    const auto ref = *current_;
    util::Logger::info("SessionController: File closed: " + ref.raw_path + " at " +
                       std::to_string(current_time_ms_) + "/" + std::to_string(stream_length_ms_) + "ms");

    auto save_time = backend::ResumePolicy::should_save(current_time_ms_, stream_length_ms_, config_);

    std::error_code ec;
    bool exists = std::filesystem::exists(ref.decoded_path, ec);

    if (save_time && exists) {
        save_locked(ref, *save_time);
    } else {
        if (save_time) {
            util::Logger::info("SessionController: " + ref.decoded_path + " no longer exists");
        }
        purge_locked(ref);
    }

    reset_locked();
}

void SessionController::save_locked(const model::MediaReference& ref, uint64_t position_ms) {
    model::ResumeRecord record;
    record.file = ref.relative_path;
    record.mountpoint = ref.mountpoint;
    record.time_ms = position_ms;
    record.created_ms = now_epoch_ms();

    // Both writes are attempted even if one fails
    bool record_ok = backend::RecordStore::write(store_.record_path(ref.identity_hash), record);
    bool pointer_ok = store_.write_last_played(ref.raw_path);

    if (record_ok && pointer_ok) {
        util::Logger::info("SessionController: Saved " + ref.relative_path + " at " +
                           std::to_string(position_ms) + "ms");
    } else {
        util::Logger::error("SessionController: Failed to save resume point for " + ref.relative_path);
    }
}

void SessionController::purge_locked(const model::MediaReference& ref) {
    if (backend::RecordStore::remove(store_.record_path(ref.identity_hash))) {
        util::Logger::info("SessionController: Removed resume point for " + ref.relative_path);
    }

    auto last_played = store_.read_last_played();
    if (!last_played) return;

    bool same_item = (*last_played == ref.raw_path);
    if (!same_item) {
        try {
            same_item = util::PathIdentity::resolve(*last_played).identity_hash == ref.identity_hash;
        } catch (const std::exception& e) {
            util::Logger::warn(std::string("SessionController: Cannot identify last played file: ") + e.what());
        }
    }
    if (same_item) {
        store_.remove_last_played();
    }
}

void SessionController::reset_locked() {
    current_.reset();
    current_time_ms_ = 0;
    stream_length_ms_ = 0;
    state_ = State::Idle;
    ++generation_;
}

void SessionController::cancel_session_tasks_locked() {
    cancel_task(seek_task_);
    cancel_task(poll_task_);
}

void SessionController::restart_last_played() {
    std::optional<std::string> last_played;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        restart_task_.reset();
        if (current_) {
            util::Logger::debug("SessionController: A file is already open, not restarting last played");
            return;
        }
        last_played = store_.read_last_played();
    }

    if (!last_played) {
        util::Logger::debug("SessionController: No last played file");
        return;
    }

    util::Logger::info("SessionController: Restarting last played file " + *last_played);
    // Not under the lock: the host may report FileOpened from inside this call
    try {
        player_.open_replace(*last_played);
    } catch (const std::exception& e) {
        util::Logger::error(std::string("SessionController: Failed to reopen last played file: ") + e.what());
    }
}

SessionController::State SessionController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<model::MediaReference> SessionController::current_reference() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

uint64_t SessionController::current_time_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_time_ms_;
}

uint64_t SessionController::stream_length_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_length_ms_;
}

}  // namespace reprise::session
