#pragma once

#include <cstdint>
#include <string>

namespace reprise::player {

// Commands and queries the resume core issues to the host player.
// Implementations may throw std::exception from any call; callers log and carry on.
class PlayerControl {
public:
    virtual ~PlayerControl() = default;

    virtual bool is_seekable() = 0;
    virtual void seek_to(uint64_t position_ms, bool accurate) = 0;

    virtual uint64_t get_current_time_ms() = 0;
    virtual uint64_t get_stream_length_ms() = 0;

    // Replace whatever is playing with the given path or URI.
    virtual void open_replace(const std::string& path) = 0;
};

}  // namespace reprise::player
