#include "../framework/SimpleTest.hpp"
#include "../framework/TestSupport.hpp"
#include "backend/RecordStore.hpp"
#include "report/ReportTool.hpp"
#include "session/ResumeService.hpp"
#include "session/SessionController.hpp"
#include "util/PathIdentity.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

using namespace reprise;
using namespace std::chrono_literals;
using backend::RecordStore;
using session::SessionController;
using reprise::test::FakeClock;
using reprise::test::FakePlayer;
using reprise::test::TempDir;

namespace {

std::string to_file_uri(const std::filesystem::path& path) {
    std::string uri = "file://";
    for (char c : path.string()) {
        if (c == '%') uri += "%25";
        else if (c == ' ') uri += "%20";
        else uri += c;
    }
    return uri;
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

struct SessionFixture {
    TempDir dir;
    std::filesystem::path records;
    std::filesystem::path media;
    std::string raw;
    FakeClock clock;
    events::Scheduler scheduler{clock.source()};
    FakePlayer player;
    backend::Config cfg;

    SessionFixture() {
        records = dir.path() / "records";
        std::filesystem::create_directories(records);
        media = dir.write_file("media/100% done film.mkv", "not really a video");
        raw = to_file_uri(media);
    }

    RecordStore store() const { return RecordStore(records); }

    std::unique_ptr<SessionController> controller() {
        return std::make_unique<SessionController>(cfg, store(), player, scheduler);
    }

    void advance(std::chrono::milliseconds by) { test::advance(clock, scheduler, by); }

    std::filesystem::path record_path() const {
        return store().record_path(util::PathIdentity::resolve(raw).identity_hash);
    }
};

// Open, confirm playback, let one poll see the given position, then close.
void play_and_close(SessionFixture& f, SessionController& ctl, const std::string& raw,
                    uint64_t position_ms, uint64_t length_ms) {
    ctl.on_file_opened(raw);
    ASSERT_TRUE(ctl.on_file_has_played(raw));
    // Let any resume seek finish so polling is running
    for (int i = 0; i < 5 && ctl.state() != SessionController::State::Playing; ++i) {
        f.advance(50ms);
    }
    f.player.current_time_ms = position_ms;
    f.player.stream_length_ms = length_ms;
    f.advance(std::chrono::seconds(f.cfg.update_interval_sec));
    ASSERT_EQ(ctl.current_time_ms(), position_ms);
    ctl.on_file_closed();
}

}  // namespace

// ---- RecordStore ----

TEST_CASE(test_record_store_round_trip_with_percent) {
    TempDir dir;
    RecordStore store(dir.path());

    model::ResumeRecord record;
    record.file = "/Movies/100% %% 50%off.mkv";
    record.mountpoint = "/media/usb%1";
    record.time_ms = 120000;
    record.created_ms = 1700000000123;

    auto path = store.record_path("0123456789abcdef0123456789abcdef");
    ASSERT_TRUE(RecordStore::write(path, record));

    auto text = read_text(path);
    ASSERT_TRUE(text.find("[File]\n") == 0);
    ASSERT_TRUE(text.find("file = /Movies/100%% %%%% 50%%off.mkv\n") != std::string::npos);
    ASSERT_TRUE(text.find("mountpoint = /media/usb%%1\n") != std::string::npos);
    ASSERT_TRUE(text.find("time = 120000\n") != std::string::npos);
    ASSERT_TRUE(text.find("created = 1700000000123\n") != std::string::npos);

    auto loaded = RecordStore::read(path);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(*loaded, record);
    ASSERT_FALSE(std::filesystem::exists(path.string() + ".tmp"));
}

TEST_CASE(test_record_store_round_trip_with_newlines) {
    TempDir dir;
    auto path = dir.path() / "0123456789abcdef0123456789abcdef";
    model::ResumeRecord record{"/Movies/line1\n[Other]\nx.mkv", "/media/disk\n2", 120000, 1700000000000};
    ASSERT_TRUE(RecordStore::write(path, record));

    auto back = RecordStore::read(path);
    ASSERT_TRUE(back.has_value());
    ASSERT_EQ(*back, record);
}

TEST_CASE(test_record_store_reads_continuation_lines) {
    TempDir dir;
    auto path = dir.write_file("0123456789abcdef0123456789abcdef",
        "[File]\n"
        "file = /Shows/part one\n"
        "\tpart two.mkv\n"
        "mountpoint = \n"
        "time = 4000\n");

    auto record = RecordStore::read(path);
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->file, std::string("/Shows/part one\npart two.mkv"));
    ASSERT_EQ(record->time_ms, 4000u);
}

TEST_CASE(test_record_store_reads_hand_written_record) {
    TempDir dir;
    auto path = dir.write_file("record",
        "[File]\nfile = /a%%b.mkv\nmountpoint = \ntime = 5000\ncreated = 1600000000000\n\n");

    auto record = RecordStore::read(path);
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->file, std::string("/a%b.mkv"));
    ASSERT_EQ(record->mountpoint, std::string(""));
    ASSERT_EQ(record->time_ms, 5000u);
    ASSERT_EQ(record->created_ms, 1600000000000u);
}

TEST_CASE(test_record_store_absent_and_partial_records) {
    TempDir dir;
    ASSERT_FALSE(RecordStore::read(dir.path() / "missing").has_value());

    auto no_time = dir.write_file("no_time", "[File]\nfile = /a.mkv\n");
    ASSERT_FALSE(RecordStore::read(no_time).has_value());

    auto no_created = dir.write_file("no_created", "[File]\ntime = 42\n");
    auto record = RecordStore::read(no_created);
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->time_ms, 42u);
    ASSERT_EQ(record->created_ms, 0u);
    ASSERT_EQ(record->file, std::string(""));
}

TEST_CASE(test_record_store_malformed_numbers_throw) {
    TempDir dir;
    auto bad_time = dir.write_file("bad_time", "[File]\ntime = 12abc\n");
    ASSERT_THROWS(RecordStore::read(bad_time), backend::RecordParseError);

    auto bad_created = dir.write_file("bad_created", "[File]\ntime = 10\ncreated = yesterday\n");
    ASSERT_THROWS(RecordStore::read(bad_created), backend::RecordParseError);
}

TEST_CASE(test_record_store_remove) {
    TempDir dir;
    auto path = dir.write_file("0123456789abcdef0123456789abcdef", "[File]\ntime = 1\n");
    ASSERT_TRUE(RecordStore::remove(path));
    ASSERT_FALSE(std::filesystem::exists(path));
    ASSERT_FALSE(RecordStore::remove(path));
}

TEST_CASE(test_record_store_last_played) {
    TempDir dir;
    RecordStore store(dir.path());
    ASSERT_FALSE(store.read_last_played().has_value());

    ASSERT_TRUE(store.write_last_played("file:///media/usb/a%20b.mkv"));
    ASSERT_EQ(read_text(store.last_played_path()), std::string("file:///media/usb/a%20b.mkv\n"));
    ASSERT_EQ(store.read_last_played().value_or(""), std::string("file:///media/usb/a%20b.mkv"));

    ASSERT_TRUE(store.remove_last_played());
    ASSERT_FALSE(store.read_last_played().has_value());
    ASSERT_FALSE(store.remove_last_played());

    dir.write_file("last_played", "  \n");
    ASSERT_FALSE(store.read_last_played().has_value());
}

// ---- SessionController ----

TEST_CASE(test_session_saves_resume_point_on_close) {
    SessionFixture f;
    auto ctl = f.controller();

    ctl->on_file_opened(f.raw);
    ASSERT_EQ(ctl->state(), SessionController::State::Open);
    ASSERT_EQ(ctl->current_time_ms(), 0u);

    ASSERT_TRUE(ctl->on_file_has_played(f.raw));
    ASSERT_EQ(ctl->state(), SessionController::State::Playing);
    ASSERT_TRUE(f.player.seeks.empty());

    f.player.current_time_ms = 130000;
    f.player.stream_length_ms = 300000;
    f.advance(3s);
    ASSERT_EQ(ctl->current_time_ms(), 130000u);
    ASSERT_EQ(ctl->stream_length_ms(), 300000u);

    auto ref = ctl->current_reference();
    ASSERT_TRUE(ref.has_value());
    ctl->on_file_closed();
    ASSERT_EQ(ctl->state(), SessionController::State::Idle);
    ASSERT_FALSE(ctl->current_reference().has_value());
    ASSERT_EQ(ctl->current_time_ms(), 0u);

    auto record = RecordStore::read(f.store().record_path(ref->identity_hash));
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->time_ms, 120000u);
    ASSERT_EQ(record->file, ref->relative_path);
    ASSERT_EQ(record->mountpoint, ref->mountpoint);
    ASSERT_TRUE(record->created_ms > 0);
    ASSERT_EQ(f.store().read_last_played().value_or(""), f.raw);

    // Polling stops with the session
    ASSERT_EQ(f.scheduler.pending(), 0u);
}

TEST_CASE(test_session_reads_position_as_soon_as_playing) {
    SessionFixture f;
    auto ctl = f.controller();
    ctl->on_file_opened(f.raw);

    f.player.current_time_ms = 4000;
    f.player.stream_length_ms = 300000;
    ASSERT_TRUE(ctl->on_file_has_played(f.raw));

    // No scheduler tick yet
    ASSERT_EQ(ctl->current_time_ms(), 4000u);
    ASSERT_EQ(ctl->stream_length_ms(), 300000u);
}

TEST_CASE(test_session_resumes_with_seek_once_seekable) {
    SessionFixture f;
    auto ctl = f.controller();
    play_and_close(f, *ctl, f.raw, 130000, 300000);

    ctl->on_file_opened(f.raw);
    ASSERT_EQ(ctl->current_time_ms(), 120000u);

    f.player.seekable = false;
    ASSERT_TRUE(ctl->on_file_has_played(f.raw));
    ASSERT_EQ(ctl->state(), SessionController::State::Open);

    f.advance(50ms);
    f.advance(50ms);
    ASSERT_TRUE(f.player.seeks.empty());

    f.player.seekable = true;
    f.advance(50ms);
    ASSERT_EQ(f.player.seeks.size(), 1u);
    ASSERT_EQ(f.player.seeks[0].first, 120000u);
    ASSERT_TRUE(f.player.seeks[0].second);
    ASSERT_EQ(ctl->state(), SessionController::State::Playing);
    ASSERT_EQ(ctl->current_time_ms(), 120000u);

    f.advance(50ms);
    ASSERT_EQ(f.player.seeks.size(), 1u);
}

TEST_CASE(test_session_gives_up_seeking_after_retry_cap) {
    SessionFixture f;
    auto ctl = f.controller();
    play_and_close(f, *ctl, f.raw, 130000, 300000);

    ctl->on_file_opened(f.raw);
    f.player.seekable = false;
    ctl->on_file_has_played(f.raw);
    for (int i = 0; i < SessionController::SEEK_MAX_ATTEMPTS; ++i) {
        f.advance(SessionController::SEEK_RETRY_INTERVAL);
    }
    ASSERT_TRUE(f.player.seeks.empty());
    ASSERT_EQ(ctl->state(), SessionController::State::Playing);
}

TEST_CASE(test_session_failed_record_write_keeps_old_record) {
    SessionFixture f;
    auto ctl = f.controller();
    play_and_close(f, *ctl, f.raw, 130000, 300000);
    auto before = read_text(f.record_path());
    ASSERT_TRUE(f.store().remove_last_played());

    // A directory in the way of the temporary file makes the record write fail
    auto blocker = f.record_path();
    blocker += ".tmp";
    std::filesystem::create_directory(blocker);

    play_and_close(f, *ctl, f.raw, 200000, 300000);
    ASSERT_EQ(ctl->state(), SessionController::State::Idle);
    ASSERT_FALSE(ctl->current_reference().has_value());
    ASSERT_EQ(read_text(f.record_path()), before);
    ASSERT_TRUE(std::filesystem::is_directory(blocker));
    // The pointer is still written
    ASSERT_EQ(f.store().read_last_played().value_or(""), f.raw);
}

TEST_CASE(test_session_failed_pointer_write_still_saves_record) {
    SessionFixture f;
    auto ctl = f.controller();
    auto blocker = f.store().last_played_path();
    blocker += ".tmp";
    std::filesystem::create_directory(blocker);

    play_and_close(f, *ctl, f.raw, 130000, 300000);
    ASSERT_EQ(ctl->state(), SessionController::State::Idle);
    auto record = RecordStore::read(f.record_path());
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->time_ms, 120000u);
    ASSERT_FALSE(f.store().read_last_played().has_value());

    // No stray temporary files beside the record
    int files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(f.records)) {
        if (entry.is_regular_file()) ++files;
    }
    ASSERT_EQ(files, 1);
}

TEST_CASE(test_session_purges_near_start) {
    SessionFixture f;
    auto ctl = f.controller();
    play_and_close(f, *ctl, f.raw, 130000, 300000);
    ASSERT_TRUE(std::filesystem::exists(f.record_path()));

    play_and_close(f, *ctl, f.raw, 5000, 300000);
    ASSERT_FALSE(std::filesystem::exists(f.record_path()));
    ASSERT_FALSE(f.store().read_last_played().has_value());
}

TEST_CASE(test_session_purges_at_end_boundary) {
    SessionFixture f;
    auto ctl = f.controller();
    play_and_close(f, *ctl, f.raw, 130000, 300000);
    ASSERT_TRUE(std::filesystem::exists(f.record_path()));

    play_and_close(f, *ctl, f.raw, 300000 - f.cfg.max_runtime_ms, 300000);
    ASSERT_FALSE(std::filesystem::exists(f.record_path()));
    ASSERT_FALSE(f.store().read_last_played().has_value());
}

TEST_CASE(test_session_purges_when_file_vanished) {
    SessionFixture f;
    auto ctl = f.controller();
    play_and_close(f, *ctl, f.raw, 130000, 300000);
    ASSERT_TRUE(std::filesystem::exists(f.record_path()));

    ctl->on_file_opened(f.raw);
    ctl->on_file_has_played(f.raw);
    f.advance(50ms);
    f.player.current_time_ms = 200000;
    f.advance(3s);
    std::filesystem::remove(f.media);
    ctl->on_file_closed();

    ASSERT_FALSE(std::filesystem::exists(f.record_path()));
}

TEST_CASE(test_session_purge_keeps_other_items_pointer) {
    SessionFixture f;
    auto ctl = f.controller();
    play_and_close(f, *ctl, f.raw, 130000, 300000);

    auto other = f.dir.write_file("media/other.mkv", "x");
    play_and_close(f, *ctl, to_file_uri(other), 5000, 300000);

    ASSERT_EQ(f.store().read_last_played().value_or(""), f.raw);
    ASSERT_TRUE(std::filesystem::exists(f.record_path()));
}

TEST_CASE(test_session_close_without_open_is_noop) {
    SessionFixture f;
    auto ctl = f.controller();
    ctl->on_file_closed();
    ASSERT_EQ(ctl->state(), SessionController::State::Idle);
    ASSERT_TRUE(std::filesystem::is_empty(f.records));
}

TEST_CASE(test_session_played_file_mismatch_is_rejected) {
    SessionFixture f;
    auto ctl = f.controller();

    ASSERT_FALSE(ctl->on_file_has_played(f.raw));

    ctl->on_file_opened(f.raw);
    ASSERT_FALSE(ctl->on_file_has_played("file:///some/other.mkv"));
    ASSERT_EQ(ctl->state(), SessionController::State::Open);
    ASSERT_EQ(f.scheduler.pending(), 0u);
}

TEST_CASE(test_session_corrupt_record_starts_from_zero) {
    SessionFixture f;
    std::ofstream(f.record_path()) << "[File]\ntime = garbage\n";

    auto ctl = f.controller();
    ctl->on_file_opened(f.raw);
    ASSERT_EQ(ctl->state(), SessionController::State::Open);
    ASSERT_EQ(ctl->current_time_ms(), 0u);
}

TEST_CASE(test_session_poll_failure_keeps_last_position) {
    SessionFixture f;
    auto ctl = f.controller();
    ctl->on_file_opened(f.raw);
    ctl->on_file_has_played(f.raw);

    f.player.current_time_ms = 150000;
    f.player.stream_length_ms = 400000;
    f.advance(3s);
    f.player.fail_queries = true;
    f.advance(3s);

    ASSERT_EQ(ctl->current_time_ms(), 150000u);
    ASSERT_EQ(ctl->state(), SessionController::State::Playing);
}

TEST_CASE(test_session_seek_abandoned_after_close) {
    SessionFixture f;
    auto ctl = f.controller();
    play_and_close(f, *ctl, f.raw, 130000, 300000);

    ctl->on_file_opened(f.raw);
    f.player.seekable = false;
    ctl->on_file_has_played(f.raw);
    ctl->on_file_closed();

    f.player.seekable = true;
    f.advance(50ms);
    f.advance(50ms);
    ASSERT_TRUE(f.player.seeks.empty());
    ASSERT_EQ(f.scheduler.pending(), 0u);
}

TEST_CASE(test_session_restarts_last_played) {
    SessionFixture f;
    events::EventBus bus;
    f.player.bus = &bus;
    ASSERT_TRUE(f.store().write_last_played(f.raw));

    auto ctl = f.controller();
    ctl->attach(bus);
    f.advance(1999ms);
    ASSERT_TRUE(f.player.opened.empty());

    f.advance(1ms);
    ASSERT_EQ(f.player.opened.size(), 1u);
    ASSERT_EQ(f.player.opened[0], f.raw);
    // The host reported FileOpened from inside open_replace
    ASSERT_EQ(ctl->state(), SessionController::State::Open);
    ASSERT_EQ(ctl->current_reference()->raw_path, f.raw);
}

TEST_CASE(test_session_restart_cancelled_by_open) {
    SessionFixture f;
    events::EventBus bus;
    ASSERT_TRUE(f.store().write_last_played(f.raw));

    auto ctl = f.controller();
    ctl->attach(bus);
    auto other = f.dir.write_file("media/other.mkv", "x");
    bus.publish({events::PlayerEvent::Type::FileOpened, other.string()});

    f.advance(5s);
    ASSERT_TRUE(f.player.opened.empty());
    ASSERT_EQ(ctl->current_reference()->raw_path, other.string());
}

TEST_CASE(test_session_restart_disabled) {
    SessionFixture f;
    f.cfg.restart_last = false;
    events::EventBus bus;
    ASSERT_TRUE(f.store().write_last_played(f.raw));

    auto ctl = f.controller();
    ctl->attach(bus);
    ASSERT_EQ(f.scheduler.pending(), 0u);
    f.advance(5s);
    ASSERT_TRUE(f.player.opened.empty());
}

TEST_CASE(test_session_driven_by_event_bus) {
    SessionFixture f;
    events::EventBus bus;
    auto ctl = f.controller();
    ctl->attach(bus);

    bus.publish({events::PlayerEvent::Type::FileOpened, f.raw});
    bus.publish({events::PlayerEvent::Type::FileHasPlayed, f.raw});
    f.player.current_time_ms = 1000000;
    f.player.stream_length_ms = 2000000;
    f.advance(3s);
    bus.publish({events::PlayerEvent::Type::HostShuttingDown, ""});

    auto record = RecordStore::read(f.record_path());
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->time_ms, 990000u);

    ctl->detach();
    ASSERT_EQ(bus.subscriber_count(events::PlayerEvent::Type::FileOpened), 0u);
    ASSERT_EQ(bus.subscriber_count(events::PlayerEvent::Type::HostShuttingDown), 0u);
    bus.publish({events::PlayerEvent::Type::FileOpened, f.raw});
    ASSERT_EQ(ctl->state(), SessionController::State::Idle);
}

// ---- ResumeService ----

TEST_CASE(test_resume_service_start_stop) {
    TempDir dir;
    FakePlayer player;
    events::EventBus bus;
    auto base = dir.path() / "reprise";

    session::ResumeService service(player, bus, base);
    ASSERT_TRUE(service.start());
    ASSERT_TRUE(service.running());
    ASSERT_TRUE(std::filesystem::exists(base / "config"));
    ASSERT_EQ(service.config(), backend::Config{});
    ASSERT_EQ(bus.subscriber_count(events::PlayerEvent::Type::FileClosed), 1u);
    ASSERT_TRUE(service.start());
    ASSERT_EQ(bus.subscriber_count(events::PlayerEvent::Type::FileClosed), 1u);

    service.stop();
    ASSERT_FALSE(service.running());
    ASSERT_EQ(bus.subscriber_count(events::PlayerEvent::Type::FileClosed), 0u);
    service.stop();
}

TEST_CASE(test_resume_service_reads_existing_config) {
    TempDir dir;
    FakePlayer player;
    events::EventBus bus;
    dir.write_file("config", "[Config]\nrestart_last = false\nrewind_time = 3\n");

    session::ResumeService service(player, bus, dir.path());
    ASSERT_TRUE(service.start());
    ASSERT_FALSE(service.config().restart_last);
    ASSERT_EQ(service.config().rewind_ms, 3000u);
    ASSERT_EQ(service.controller()->config().rewind_ms, 3000u);
}

// ---- ReportTool ----

TEST_CASE(test_report_reconstructs_paths) {
    model::ResumeRecord record;
    record.file = "/Movies/a.mkv";
    ASSERT_EQ(report::ReportTool::reconstruct_path(record), std::string("/Movies/a.mkv"));

    record.mountpoint = "/media/usb";
    ASSERT_EQ(report::ReportTool::reconstruct_path(record), std::string("/media/usb/Movies/a.mkv"));

    record.file = "Movies/a.mkv";
    ASSERT_EQ(report::ReportTool::reconstruct_path(record), std::string("/media/usb/Movies/a.mkv"));
}

TEST_CASE(test_report_lists_only_records) {
    TempDir dir;
    auto media = dir.write_file("media/film.mkv", "x");

    model::ResumeRecord record;
    record.file = media.string();
    record.time_ms = 3723000;
    record.created_ms = 1700000000000;
    ASSERT_TRUE(RecordStore::write(dir.path() / "0123456789abcdef0123456789abcdef", record));
    dir.write_file("notes.txt", "[File]\ntime = 1\n");

    auto rows = report::ReportTool::collect(dir.path());
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 1u);

    const auto& row = rows->front();
    ASSERT_EQ(row.hash, std::string("0123456789abcdef0123456789abcdef"));
    ASSERT_TRUE(row.found);
    ASSERT_EQ(report::ReportTool::format_row(row),
              "0123456789abcdef0123456789abcdef  2023-11-14 22:13:20   1:02:03  found    " + media.string());

    std::filesystem::remove(media);
    rows = report::ReportTool::collect(dir.path());
    ASSERT_EQ(rows->size(), 1u);
    ASSERT_FALSE(rows->front().found);
    ASSERT_TRUE(report::ReportTool::format_row(rows->front()).find("  missing  ") != std::string::npos);
}

TEST_CASE(test_report_sorts_by_created_and_skips_bad_records) {
    TempDir dir;
    model::ResumeRecord newer{"/b.mkv", "", 2000, 1700000500000};
    model::ResumeRecord older{"/a.mkv", "", 1000, 1600000000000};
    ASSERT_TRUE(RecordStore::write(dir.path() / "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa", newer));
    ASSERT_TRUE(RecordStore::write(dir.path() / "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb", older));
    dir.write_file("cccccccccccccccccccccccccccccccc", "[File]\ntime = oops\n");
    dir.write_file("dddddddddddddddddddddddddddddddd", "[File]\nfile = /no-time.mkv\n");

    std::ostringstream out;
    ASSERT_EQ(report::ReportTool::run(dir.path(), out), 0);

    std::istringstream lines(out.str());
    std::string first, second, extra;
    std::getline(lines, first);
    std::getline(lines, second);
    ASSERT_FALSE(static_cast<bool>(std::getline(lines, extra)));
    ASSERT_TRUE(first.starts_with("bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb"));
    ASSERT_TRUE(second.starts_with("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"));
}

TEST_CASE(test_report_unreadable_directory) {
    std::ostringstream out;
    ASSERT_EQ(report::ReportTool::run("/reprise-no-such-dir", out), 1);
    ASSERT_TRUE(out.str().empty());
}

int main() {
    return reprise::test::TestRunner::instance().run_all();
}
