#include "path_utils.h"
#include <cstdlib>
#include <string>

namespace voxgate {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::vector<std::string> missing_env_vars(const std::vector<std::string>& required) {
    std::vector<std::string> missing;
    for (const auto& name : required) {
        const char* value = std::getenv(name.c_str());
        if (!value || value[0] == '\0') {
            missing.push_back(name);
        }
    }
    return missing;
}

} // namespace voxgate
