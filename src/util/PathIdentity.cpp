#include "util/PathIdentity.hpp"
#include "util/PathHasher.hpp"
#include "util/Logger.hpp"
#include <sys/stat.h>
#include <system_error>

namespace reprise::util {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string PathIdentity::strip_scheme(std::string_view raw_path) {
    if (raw_path.starts_with(FILE_SCHEME)) {
        raw_path.remove_prefix(FILE_SCHEME.size());
    }
    return std::string(raw_path);
}

std::string PathIdentity::percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

std::string PathIdentity::decode(std::string_view raw_path) {
    return percent_decode(strip_scheme(raw_path));
}

bool PathIdentity::is_mount(const std::filesystem::path& path) {
    struct stat self;
    if (lstat(path.c_str(), &self) != 0) return false;
    if (S_ISLNK(self.st_mode)) return false;

    struct stat parent;
    auto parent_path = path / "..";
    if (lstat(parent_path.c_str(), &parent) != 0) return false;

    // Different device, or the directory is its own parent (root)
    if (self.st_dev != parent.st_dev) return true;
    return self.st_ino == parent.st_ino;
}

std::string PathIdentity::resolve_mountpoint(std::string_view raw_path) {
    std::string decoded = decode(raw_path);
    if (decoded.empty()) return "";

    std::error_code ec;
    auto path = std::filesystem::absolute(decoded, ec);
    if (!ec) path = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        Logger::warn("PathIdentity: Cannot resolve " + decoded + ": " + ec.message());
        return "";
    }

    while (!is_mount(path)) {
        auto parent = path.parent_path();
        if (parent == path || parent.empty()) {
            Logger::debug("PathIdentity: No mount boundary above " + decoded);
            return "";
        }
        path = parent;
    }

    return path == "/" ? "" : path.string();
}

std::string PathIdentity::relative_path(std::string_view raw_path, const std::string& mountpoint) {
    std::string decoded = decode(raw_path);
    if (mountpoint.empty()) return decoded;

    bool prefix = decoded.starts_with(mountpoint) &&
                  (decoded.size() == mountpoint.size() || decoded[mountpoint.size()] == '/');
    if (!prefix) {
        throw IdentityError("mountpoint " + mountpoint + " is not a prefix of " + decoded);
    }
    return decoded.substr(mountpoint.size());
}

std::string PathIdentity::identity_hash(std::string_view relative_path) {
    return PathHasher::hash_path(relative_path);
}

model::MediaReference PathIdentity::resolve(const std::string& raw_path) {
    model::MediaReference ref;
    ref.raw_path = raw_path;
    ref.decoded_path = decode(raw_path);
    ref.mountpoint = resolve_mountpoint(raw_path);

    try {
        ref.relative_path = relative_path(raw_path, ref.mountpoint);
    } catch (const IdentityError& e) {
        Logger::error(std::string("PathIdentity: ") + e.what() + ", ignoring mountpoint");
        ref.mountpoint.clear();
        ref.relative_path = ref.decoded_path;
    }

    ref.identity_hash = identity_hash(ref.relative_path);
    return ref;
}

}  // namespace reprise::util
