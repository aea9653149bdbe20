#pragma once

#include "model/ResumeRecord.hpp"
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace reprise::report {

struct ReportRow {
    std::string hash;
    std::string created;   // UTC timestamp
    std::string elapsed;   // Saved position, H:MM:SS
    bool found = false;    // Whether path exists right now
    std::string path;      // Reconstructed absolute path
};

/**
 * ReportTool: offline listing of every resume record in a directory.
 */
class ReportTool {
public:
    // mountpoint + file when the record has a mountpoint, otherwise file.
    static std::string reconstruct_path(const model::ResumeRecord& record);

    // Rows sorted by created timestamp (then hash). std::nullopt if dir cannot be read.
    static std::optional<std::vector<ReportRow>> collect(const std::filesystem::path& dir);

    // "hash  created  elapsed  found|missing  path"
    static std::string format_row(const ReportRow& row);

    // Prints the report; returns the process exit code.
    static int run(const std::filesystem::path& dir, std::ostream& out);
};

}  // namespace reprise::report
