#include "util/IniFile.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <ostream>

namespace reprise::util {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<IniFile> IniFile::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    return parse(file);
}

IniFile IniFile::parse(std::istream& in) {
    IniFile ini;
    Section* current = nullptr;
    std::string* continued = nullptr;

    std::string raw;
    while (std::getline(in, raw)) {
        // An indented line right after an entry adds a line to its value
        if (continued && !raw.empty() && (raw[0] == ' ' || raw[0] == '\t')) {
            *continued += '\n';
            *continued += trim(raw);
            continue;
        }

        std::string line = trim(raw);
        if (line.empty()) {
            continued = nullptr;
            continue;
        }
        if (line[0] == '#' || line[0] == ';') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            continued = nullptr;
            std::string name = line.substr(1, line.length() - 2);
            current = ini.find_section(name);
            if (!current) {
                ini.sections_.push_back({name, {}});
                current = &ini.sections_.back();
            }
            continue;
        }

        continued = nullptr;

        // Entries before the first header belong to no section
        if (!current) continue;

        auto delim = line.find_first_of("=:");
        if (delim == std::string::npos) continue;

        std::string key = to_lower(trim(line.substr(0, delim)));
        std::string value = trim(line.substr(delim + 1));
        if (key.empty()) continue;

        auto it = std::find_if(current->entries.begin(), current->entries.end(),
                               [&key](const auto& entry) { return entry.first == key; });
        if (it != current->entries.end()) {
            it->second = value;
            continued = &it->second;
        } else {
            current->entries.emplace_back(key, value);
            continued = &current->entries.back().second;
        }
    }

    return ini;
}

IniFile::Section* IniFile::find_section(const std::string& name) {
    for (auto& section : sections_) {
        if (section.name == name) return &section;
    }
    return nullptr;
}

const IniFile::Section* IniFile::find_section(const std::string& name) const {
    for (const auto& section : sections_) {
        if (section.name == name) return &section;
    }
    return nullptr;
}

bool IniFile::has_section(const std::string& section) const {
    return find_section(section) != nullptr;
}

std::optional<std::string> IniFile::get(const std::string& section, const std::string& key) const {
    const Section* s = find_section(section);
    if (!s) return std::nullopt;

    std::string wanted = to_lower(key);
    for (const auto& [k, v] : s->entries) {
        if (k == wanted) return v;
    }
    return std::nullopt;
}

void IniFile::set(const std::string& section, const std::string& key, const std::string& value) {
    Section* s = find_section(section);
    if (!s) {
        sections_.push_back({section, {}});
        s = &sections_.back();
    }

    std::string k = to_lower(key);
    for (auto& entry : s->entries) {
        if (entry.first == k) {
            entry.second = value;
            return;
        }
    }
    s->entries.emplace_back(k, value);
}

void IniFile::write(std::ostream& out) const {
    for (const auto& section : sections_) {
        out << "[" << section.name << "]\n";
        for (const auto& [key, value] : section.entries) {
            // Multi-line values continue on tab-indented lines
            out << key << " = ";
            for (char c : value) {
                out << c;
                if (c == '\n') out << '\t';
            }
            out << "\n";
        }
        out << "\n";
    }
}

}  // namespace reprise::util
