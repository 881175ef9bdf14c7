#pragma once

#include <string>
#include <filesystem>

namespace microtrend {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable (falls back to cwd)
    static std::filesystem::path getExecutableDir();

    // Resolve a path relative to the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace microtrend
