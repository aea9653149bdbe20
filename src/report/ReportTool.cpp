#include "report/ReportTool.hpp"
#include "backend/RecordStore.hpp"
#include "ui/Formatting.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <ostream>
#include <string_view>
#include <system_error>

namespace reprise::report {

std::string ReportTool::reconstruct_path(const model::ResumeRecord& record) {
    if (record.mountpoint.empty()) return record.file;

    std::string_view file = record.file;
    if (file.starts_with('/')) file.remove_prefix(1);
    return (std::filesystem::path(record.mountpoint) / file).string();
}

std::optional<std::vector<ReportRow>> ReportTool::collect(const std::filesystem::path& dir) {
    auto scan = util::DirectoryScanner::scan_records(dir);
    if (!scan.ok) return std::nullopt;

    std::vector<ReportRow> rows;
    rows.reserve(scan.records.size());

    for (const auto& entry : scan.records) {
        std::optional<model::ResumeRecord> record;
        try {
            record = backend::RecordStore::read(entry.path);
        } catch (const backend::RecordParseError& e) {
            util::Logger::warn(std::string("ReportTool: Skipping ") + entry.name + ": " + e.what());
            continue;
        }
        if (!record) {
            util::Logger::debug("ReportTool: Skipping " + entry.name + ": no saved position");
            continue;
        }

        ReportRow row;
        row.hash = entry.name;
        row.created = ui::format_utc_timestamp(record->created_ms);
        row.elapsed = ui::format_elapsed(record->time_ms);
        row.path = reconstruct_path(*record);

        std::error_code ec;
        row.found = std::filesystem::exists(row.path, ec);
        rows.push_back(std::move(row));
    }

    std::sort(rows.begin(), rows.end(), [](const ReportRow& a, const ReportRow& b) {
        if (a.created != b.created) return a.created < b.created;
        return a.hash < b.hash;
    });

    return rows;
}

std::string ReportTool::format_row(const ReportRow& row) {
    static constexpr int STATUS_WIDTH = 7;
    std::string status = ui::pad_right(row.found ? "found" : "missing", STATUS_WIDTH);
    return row.hash + "  " + row.created + "  " + row.elapsed + "  " + status + "  " + row.path;
}

int ReportTool::run(const std::filesystem::path& dir, std::ostream& out) {
    auto rows = collect(dir);
    if (!rows) return 1;

    for (const auto& row : *rows) {
        out << format_row(row) << '\n';
    }
    return 0;
}

}  // namespace reprise::report
