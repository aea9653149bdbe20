#include "util/Logger.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <string_view>

namespace reprise::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open for the process lifetime
static Logger::Level min_level = Logger::Level::Info;

void Logger::init(const std::filesystem::path& log_path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file.open(log_path, std::ios::trunc);
}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    std::ostream& out = log_file.is_open() ? static_cast<std::ostream&>(log_file) : std::cerr;
    out << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << '\n';
    out.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace reprise::util
