#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/PathHasher.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <dirent.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <vector>

namespace reprise::util {

namespace {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

bool is_regular_file(int dir_fd, const linux_dirent64* d) {
    if (d->d_type == DT_REG) return true;
    if (d->d_type != DT_UNKNOWN && d->d_type != DT_LNK) return false;

    // No d_type from the filesystem, or a symlink: stat the target
    struct stat entry_stat;
    if (fstatat(dir_fd, d->d_name, &entry_stat, 0) != 0) return false;
    return S_ISREG(entry_stat.st_mode);
}

}  // namespace

DirectoryScanner::ScanResult DirectoryScanner::scan_records(const std::filesystem::path& dir) {
    ScanResult result;

    // Normalize: strip trailing slashes to prevent // in paths
    std::string dir_str = dir.string();
    while (dir_str.length() > 1 && dir_str.back() == '/') {
        dir_str.pop_back();
    }
    util::Logger::debug("DirectoryScanner: Scanning " + dir_str + " for records");

    int fd = open(dir_str.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        util::Logger::error("DirectoryScanner: Failed to open directory " + dir_str + ": " + std::strerror(errno));
        return result;
    }

    std::vector<char> buffer(BUFFER_SIZE);
    result.ok = true;

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.data(), buffer.size());

        if (nread == -1) {
            util::Logger::error("DirectoryScanner: getdents64 failed for " + dir_str + ": " + std::strerror(errno));
            result.ok = false;
            break;
        }

        if (nread == 0) {
            // End of directory
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.data() + pos);
            pos += d->d_reclen;

            if (std::strcmp(d->d_name, ".") == 0 || std::strcmp(d->d_name, "..") == 0) {
                continue;
            }

            if (!PathHasher::is_hash_name(d->d_name) || !is_regular_file(fd, d)) {
                ++result.skipped;
                continue;
            }

            result.records.push_back({d->d_name, dir_str + "/" + d->d_name});
        }
    }

    close(fd);

    util::Logger::debug("DirectoryScanner: Found " + std::to_string(result.records.size()) +
                        " records, skipped " + std::to_string(result.skipped) + " entries");
    return result;
}

}  // namespace reprise::util
