#pragma once

#include <filesystem>

namespace reprise::util {

class Platform {
public:
    // Directory holding the config, the last_played pointer and one file per resume record.
    static std::filesystem::path get_data_directory();
};

}  // namespace reprise::util
