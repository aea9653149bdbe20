#pragma once

#include "model/ResumeRecord.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace reprise::backend {

// A record file exists but a numeric field cannot be parsed.
class RecordParseError : public std::runtime_error {
public:
    explicit RecordParseError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * RecordStore: one text file per resume record plus the last_played pointer, all under
 * a single base directory.
 *
 * Only the session controller writes; readers (including the report tool) may run
 * concurrently, so writes go through a temporary file and a rename.
 */
class RecordStore {
public:
    static constexpr const char* SECTION = "File";
    static constexpr const char* LAST_PLAYED_FILE = "last_played";

    explicit RecordStore(std::filesystem::path base_dir);

    const std::filesystem::path& base_dir() const { return base_dir_; }
    std::filesystem::path record_path(const std::string& identity_hash) const;
    std::filesystem::path last_played_path() const;

    /**
     * @return std::nullopt if the file is missing or has no time key
     * @throws RecordParseError if time or created is not a number
     */
    static std::optional<model::ResumeRecord> read(const std::filesystem::path& path);
    static bool write(const std::filesystem::path& path, const model::ResumeRecord& record);

    // true if a file was removed. An absent file is not an error.
    static bool remove(const std::filesystem::path& path);

    std::optional<std::string> read_last_played() const;
    bool write_last_played(const std::string& raw_path) const;
    bool remove_last_played() const;

    // '%' <-> "%%" for string values in the record format
    static std::string escape(const std::string& value);
    static std::string unescape(const std::string& value);

private:
    std::filesystem::path base_dir_;
};

}  // namespace reprise::backend
