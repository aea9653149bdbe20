#include "backend/ResumePolicy.hpp"

namespace reprise::backend {

std::optional<uint64_t> ResumePolicy::should_save(uint64_t current_time_ms,
                                                  uint64_t stream_length_ms,
                                                  const Config& cfg) {
    // Signed so a short or unknown stream length cannot wrap around
    const int64_t current = static_cast<int64_t>(current_time_ms);
    const int64_t length = static_cast<int64_t>(stream_length_ms);
    const int64_t rewind = cfg.rewind_ms;

    if (current <= 0) return std::nullopt;
    if (current < static_cast<int64_t>(cfg.min_runtime_ms) + rewind) return std::nullopt;
    if (current >= length - static_cast<int64_t>(cfg.max_runtime_ms)) return std::nullopt;

    int64_t save_time = current - rewind;
    if (save_time <= 0) return std::nullopt;

    return static_cast<uint64_t>(save_time);
}

}  // namespace reprise::backend
