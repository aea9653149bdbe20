#include "backend/RecordStore.hpp"
#include "util/IniFile.hpp"
#include "util/Logger.hpp"
#include <charconv>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace reprise::backend {

namespace {

uint64_t parse_number(const std::filesystem::path& path, const char* key, const std::string& value) {
    uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        throw RecordParseError(path.string() + ": invalid " + key + " '" + value + "'");
    }
    return result;
}

// Writes via path.tmp + rename so readers never see a partial file
bool write_replacing(const std::filesystem::path& path, const std::string& content) {
    auto tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) {
            util::Logger::error("RecordStore: Cannot open " + tmp_path.string() + " for writing");
            return false;
        }
        file << content;
        file.flush();
        if (!file) {
            util::Logger::error("RecordStore: Write to " + tmp_path.string() + " failed");
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        util::Logger::error("RecordStore: Cannot replace " + path.string() + ": " + ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }
    return true;
}

}  // namespace

RecordStore::RecordStore(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {}

std::filesystem::path RecordStore::record_path(const std::string& identity_hash) const {
    return base_dir_ / identity_hash;
}

std::filesystem::path RecordStore::last_played_path() const {
    return base_dir_ / LAST_PLAYED_FILE;
}

std::string RecordStore::escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        out += c;
        if (c == '%') out += '%';
    }
    return out;
}

std::string RecordStore::unescape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        out += value[i];
        if (value[i] == '%' && i + 1 < value.size() && value[i + 1] == '%') {
            ++i;
        }
    }
    return out;
}

std::optional<model::ResumeRecord> RecordStore::read(const std::filesystem::path& path) {
    auto ini = util::IniFile::load(path);
    if (!ini) return std::nullopt;

    auto time = ini->get(SECTION, "time");
    if (!time) {
        util::Logger::debug("RecordStore: No time in " + path.string());
        return std::nullopt;
    }

    model::ResumeRecord record;
    record.time_ms = parse_number(path, "time", *time);
    if (auto created = ini->get(SECTION, "created")) {
        record.created_ms = parse_number(path, "created", *created);
    }
    record.file = unescape(ini->get(SECTION, "file").value_or(""));
    record.mountpoint = unescape(ini->get(SECTION, "mountpoint").value_or(""));
    return record;
}

bool RecordStore::write(const std::filesystem::path& path, const model::ResumeRecord& record) {
    util::IniFile ini;
    ini.set(SECTION, "file", escape(record.file));
    ini.set(SECTION, "mountpoint", escape(record.mountpoint));
    ini.set(SECTION, "time", std::to_string(record.time_ms));
    ini.set(SECTION, "created", std::to_string(record.created_ms));

    std::ostringstream content;
    ini.write(content);

    if (!write_replacing(path, content.str())) return false;
    util::Logger::debug("RecordStore: Wrote " + path.string() + " (time=" + std::to_string(record.time_ms) + ")");
    return true;
}

bool RecordStore::remove(const std::filesystem::path& path) {
    std::error_code ec;
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        util::Logger::error("RecordStore: Cannot remove " + path.string() + ": " + ec.message());
        return false;
    }
    if (removed) {
        util::Logger::debug("RecordStore: Removed " + path.string());
    }
    return removed;
}

std::optional<std::string> RecordStore::read_last_played() const {
    std::ifstream file(last_played_path());
    if (!file) return std::nullopt;

    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto raw_path = util::trim(contents);
    if (raw_path.empty()) return std::nullopt;
    return raw_path;
}

bool RecordStore::write_last_played(const std::string& raw_path) const {
    return write_replacing(last_played_path(), raw_path + "\n");
}

bool RecordStore::remove_last_played() const {
    return remove(last_played_path());
}

}  // namespace reprise::backend
