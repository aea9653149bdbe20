#pragma once

#include <cstdint>
#include <string>

namespace reprise::ui {

/**
 * Display width of a UTF-8 string (each multi-byte character counts as one column).
 */
int display_cols(const std::string& s);

/**
 * Pad with spaces to `width` display columns. Longer strings are returned unchanged.
 */
std::string pad_right(const std::string& s, int width);

/**
 * Playback position as H:MM:SS. Hours are right-aligned to two columns and never
 * roll over into days: format_elapsed(90061000) -> "25:01:01".
 */
std::string format_elapsed(uint64_t ms);

/**
 * Epoch milliseconds as a UTC "YYYY-MM-DD HH:MM:SS" timestamp.
 */
std::string format_utc_timestamp(uint64_t epoch_ms);

} // namespace reprise::ui
