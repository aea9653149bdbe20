#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace reprise::util {

/**
 * DirectoryScanner: lists resume record files in a directory using the getdents64 syscall.
 *
 * Only regular files (or symlinks to them) whose name is a record hash are returned;
 * d_type is used to avoid a stat() per entry where the filesystem provides it.
 */
class DirectoryScanner {
public:
    struct Entry {
        std::string name;  // Record hash
        std::string path;  // dir + "/" + name
    };

    struct ScanResult {
        bool ok = false;             // false when the directory could not be opened or read
        std::vector<Entry> records;  // In directory order
        size_t skipped = 0;          // Entries that are not records
    };

    [[nodiscard]] static ScanResult scan_records(const std::filesystem::path& dir);

private:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;
};

}  // namespace reprise::util
