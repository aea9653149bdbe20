#pragma once

#include <string>

namespace reprise::model {

// One playable item as the player reported it, plus its mount-independent identity.
struct MediaReference {
    std::string raw_path;       // As delivered by the player (may be a file:// URI)
    std::string decoded_path;   // Scheme stripped, percent-decoded
    std::string mountpoint;     // Empty when the item lives on the root filesystem
    std::string relative_path;  // decoded_path without the mountpoint prefix
    std::string identity_hash;  // 32 lowercase hex chars, record file name

    bool operator==(const MediaReference&) const = default;
};

}  // namespace reprise::model
