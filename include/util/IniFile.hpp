#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reprise::util {

/**
 * IniFile: the [section] / key = value format shared by the config file and the
 * resume records.
 *
 * Section names are case-sensitive, keys are lowercased. Both '=' and ':' separate a key
 * from its value, '#' and ';' start comment lines. Insertion order is preserved on write.
 * A value containing newlines is written with its extra lines tab-indented, and indented
 * lines following an entry are read back as part of its value.
 */
class IniFile {
public:
    using Entries = std::vector<std::pair<std::string, std::string>>;

    // std::nullopt when the file cannot be opened.
    [[nodiscard]] static std::optional<IniFile> load(const std::filesystem::path& path);
    [[nodiscard]] static IniFile parse(std::istream& in);

    bool has_section(const std::string& section) const;
    std::optional<std::string> get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const std::string& value);

    void write(std::ostream& out) const;

private:
    struct Section {
        std::string name;
        Entries entries;
    };

    Section* find_section(const std::string& name);
    const Section* find_section(const std::string& name) const;

    std::vector<Section> sections_;
};

std::string trim(const std::string& s);
std::string to_lower(std::string s);

}  // namespace reprise::util
