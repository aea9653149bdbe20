#pragma once

#include "backend/Config.hpp"
#include <cstdint>
#include <optional>

namespace reprise::backend {

class ResumePolicy {
public:
    /**
     * Decides what to persist when an item closes.
     *
     * A position is savable when it is past min_runtime + rewind and more than
     * max_runtime before the end of the stream. The saved position is rewound by rewind_ms.
     *
     * @return Position to store, or std::nullopt when any existing record should be purged
     */
    [[nodiscard]] static std::optional<uint64_t> should_save(uint64_t current_time_ms,
                                                             uint64_t stream_length_ms,
                                                             const Config& cfg);
};

}  // namespace reprise::backend
