#pragma once

#include "model/MediaReference.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace reprise::util {

// Raised when a mountpoint is not a true prefix of the path it was resolved for.
class IdentityError : public std::logic_error {
public:
    explicit IdentityError(const std::string& msg) : std::logic_error(msg) {}
};

/**
 * PathIdentity: maps a player path to a stable identity.
 *
 * The identity is the path relative to the filesystem mount that contains it, so the
 * same file on a removable drive keeps its record when the drive is mounted elsewhere.
 */
class PathIdentity {
public:
    static constexpr std::string_view FILE_SCHEME = "file://";

    // Removes a leading file:// prefix; anything else is returned unchanged.
    static std::string strip_scheme(std::string_view raw_path);

    // %XX -> byte. Malformed escapes are copied through.
    static std::string percent_decode(std::string_view text);

    // strip_scheme() followed by percent_decode().
    static std::string decode(std::string_view raw_path);

    /**
     * Walks up from the resolved path until a mount boundary is found.
     *
     * @param raw_path Path or file:// URI as the player reported it
     * @return The mount directory, or "" for the root filesystem or on any failure
     */
    static std::string resolve_mountpoint(std::string_view raw_path);

    /**
     * Decoded path with the mountpoint prefix removed.
     *
     * @throws IdentityError if mountpoint is non-empty and not a prefix of the decoded path
     */
    static std::string relative_path(std::string_view raw_path, const std::string& mountpoint);

    static std::string identity_hash(std::string_view relative_path);

    // Builds the full reference. Never throws IdentityError: an unusable mountpoint degrades to "".
    static model::MediaReference resolve(const std::string& raw_path);

private:
    static bool is_mount(const std::filesystem::path& path);
};

}  // namespace reprise::util
