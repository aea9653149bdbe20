#include "ui/Formatting.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace reprise::ui {

namespace {

// Byte length of the UTF-8 sequence starting with c
int utf8_len(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;  // Invalid, count as one
}

}  // namespace

int display_cols(const std::string& s) {
    int cols = 0;
    for (size_t i = 0; i < s.size(); ) {
        i += utf8_len(static_cast<unsigned char>(s[i]));
        cols++;
    }
    return cols;
}

std::string pad_right(const std::string& s, int w) {
    int cols = display_cols(s);
    if (cols >= w) return s;
    return s + std::string(w - cols, ' ');
}

std::string format_elapsed(uint64_t ms) {
    uint64_t total_seconds = ms / 1000;
    uint64_t hours = total_seconds / 3600;
    uint64_t minutes = (total_seconds / 60) % 60;
    uint64_t seconds = total_seconds % 60;

    std::ostringstream oss;
    oss << std::setw(2) << std::setfill(' ') << hours << ':'
        << std::setw(2) << std::setfill('0') << minutes << ':'
        << std::setw(2) << std::setfill('0') << seconds;
    return oss.str();
}

std::string format_utc_timestamp(uint64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace reprise::ui
