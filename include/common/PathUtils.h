#pragma once

#include <string>
#include <filesystem>

namespace cyclebt {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable; falls back to the working directory.
    static std::filesystem::path getExecutableDir();

    // Relative paths resolve against the working directory when the target exists
    // there, otherwise against the executable directory.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace cyclebt
