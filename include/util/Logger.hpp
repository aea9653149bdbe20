#pragma once

#include <filesystem>
#include <string>

namespace reprise::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Lines go to stderr until init() opens a log file.
    static void init(const std::filesystem::path& log_path);
    static void set_level(Level level);
    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace reprise::util
