#pragma once

#include <cstdint>
#include <string>

namespace reprise::model {

// Persisted resume point for one media item. Strings are stored unescaped here;
// RecordStore handles the %% escaping of the on-disk format.
struct ResumeRecord {
    std::string file;        // Relative path of the item
    std::string mountpoint;  // Mountpoint at the time of writing, may be empty
    uint64_t time_ms = 0;    // Saved position, > 0 for any record on disk
    uint64_t created_ms = 0; // Epoch milliseconds when written

    bool operator==(const ResumeRecord&) const = default;
};

}  // namespace reprise::model
