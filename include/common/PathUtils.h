#pragma once

#include <string>
#include <filesystem>

namespace tugofwar {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable (falls back to the CWD)
    static std::filesystem::path getExecutableDir();
    
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace tugofwar
