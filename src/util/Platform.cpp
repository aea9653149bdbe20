#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>

namespace reprise::util {

std::filesystem::path Platform::get_data_directory() {
    reprise::util::Logger::debug("Platform: Detecting data directory");
    if (auto override_dir = std::getenv("REPRISE_HOME"); override_dir && *override_dir) {
        return std::filesystem::path(override_dir);
    }
    if (auto xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "reprise";
    }
    auto home = std::getenv("HOME");
    if (home) {
        auto path = std::filesystem::path(home) / ".local" / "share" / "reprise";
        reprise::util::Logger::debug("Platform: Data directory: " + path.string());
        return path;
    }
    reprise::util::Logger::warn("Platform: HOME env var not set, using fallback: .local/share/reprise");
    return ".local/share/reprise";
}

}  // namespace reprise::util
