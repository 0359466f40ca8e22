#pragma once

#include <string>

namespace pulse::core {

struct FileSystem {
    static std::string read_text(const std::string& path);
    static bool write_text(const std::string& path, const std::string& text);
};

} // namespace pulse::core
