#pragma once

#include <string>

namespace stacker::core {

struct FileSystem {
    static bool exists(const std::string& path);
    static std::string read_text(const std::string& path);
    static bool write_text(const std::string& path, const std::string& text);
};

} // namespace stacker::core
