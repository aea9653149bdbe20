#include "backend/Config.hpp"
#include "util/IniFile.hpp"
#include "util/Logger.hpp"
#include <charconv>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

namespace reprise::backend {

namespace {

std::optional<bool> parse_bool(const std::string& value) {
    auto v = util::to_lower(value);
    if (v == "1" || v == "yes" || v == "true" || v == "on") return true;
    if (v == "0" || v == "no" || v == "false" || v == "off") return false;
    return std::nullopt;
}

std::optional<uint32_t> parse_seconds(const std::string& value) {
    uint32_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) return std::nullopt;
    return result;
}

void read_bool(const util::IniFile& ini, const char* key, bool& field) {
    auto raw = ini.get(ConfigLoader::SECTION, key);
    if (!raw) return;
    if (auto parsed = parse_bool(*raw)) {
        field = *parsed;
    } else {
        util::Logger::warn(std::string("Config: Invalid boolean for ") + key + ": '" + *raw + "', keeping default");
    }
}

void read_uint(const util::IniFile& ini, const char* key, uint32_t& field, uint32_t scale) {
    auto raw = ini.get(ConfigLoader::SECTION, key);
    if (!raw) return;
    auto parsed = parse_seconds(*raw);
    if (!parsed || *parsed > UINT32_MAX / scale) {
        util::Logger::warn(std::string("Config: Invalid value for ") + key + ": '" + *raw + "', keeping default");
        return;
    }
    field = *parsed * scale;
}

}  // namespace

Config ConfigLoader::load_config(const std::filesystem::path& base_dir) {
    reprise::util::Logger::info("Config: Loading configuration");

    auto config_file = base_dir / FILE_NAME;
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }
    reprise::util::Logger::info("Config: No config file at " + config_file.string() + ", using defaults");
    return Config{};
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    reprise::util::Logger::debug("Config: Loading from file " + path.string());

    Config cfg;
    auto ini = util::IniFile::load(path);
    if (!ini) {
        util::Logger::warn("Config: Failed to read config file " + path.string() + ", using defaults");
        return cfg;
    }
    if (!ini->has_section(SECTION)) {
        util::Logger::warn("Config: No [Config] section in " + path.string() + ", using defaults");
        return cfg;
    }

    read_bool(*ini, "restart_last", cfg.restart_last);
    read_uint(*ini, "restart_delay", cfg.restart_delay_sec, 1);
    read_uint(*ini, "update_interval", cfg.update_interval_sec, 1);
    read_uint(*ini, "rewind_time", cfg.rewind_ms, 1000);
    read_uint(*ini, "min_runtime", cfg.min_runtime_ms, 1000);
    read_uint(*ini, "max_runtime", cfg.max_runtime_ms, 1000);

    if (cfg.update_interval_sec == 0) {
        util::Logger::warn("Config: update_interval must be at least 1 second, using 1");
        cfg.update_interval_sec = 1;
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    reprise::util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot open " + path.string() + " for writing");
        return false;
    }

    file << "# REPRISE config\n";
    file << "# All times are in seconds\n\n";

    file << "[" << SECTION << "]\n";
    file << "# Reopen the last played file on startup\n";
    file << "restart_last = " << (cfg.restart_last ? "true" : "false") << "\n";
    file << "# Delay before reopening it\n";
    file << "restart_delay = " << cfg.restart_delay_sec << "\n\n";
    file << "# How often the playback position is read while playing\n";
    file << "update_interval = " << cfg.update_interval_sec << "\n\n";
    file << "# Resume this far before the position playback stopped at\n";
    file << "rewind_time = " << cfg.rewind_ms / 1000 << "\n";
    file << "# Don't remember files stopped earlier than this\n";
    file << "min_runtime = " << cfg.min_runtime_ms / 1000 << "\n";
    file << "# Don't remember files stopped this close to the end\n";
    file << "max_runtime = " << cfg.max_runtime_ms / 1000 << "\n";

    return static_cast<bool>(file);
}

}  // namespace reprise::backend
