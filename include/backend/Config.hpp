#pragma once

#include <cstdint>
#include <filesystem>

namespace reprise::backend {

struct Config {
    // Startup
    bool restart_last = true;
    uint32_t restart_delay_sec = 2;

    // Position polling while playing
    uint32_t update_interval_sec = 3;

    // Resume thresholds (stored in seconds on disk)
    uint32_t rewind_ms = 10000;
    uint32_t min_runtime_ms = 120000;
    uint32_t max_runtime_ms = 90000;

    bool operator==(const Config&) const = default;
};

class ConfigLoader {
public:
    static constexpr const char* SECTION = "Config";
    static constexpr const char* FILE_NAME = "config";

    // Loads base_dir/config, defaults when the file is absent or unreadable.
    static Config load_config(const std::filesystem::path& base_dir);
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);
};

}  // namespace reprise::backend
