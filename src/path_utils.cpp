#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace voxlink {

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

std::string resolve_relative_to(const std::string& path, const std::string& base_file) {
    std::string expanded = expand_path(path);
    if (expanded.empty() || expanded[0] == '/' || expanded[0] == '\\') {
        return expanded;
    }
    std::string::size_type pos = base_file.find_last_of("/\\");
    if (pos == std::string::npos) {
        return expanded;
    }
    return base_file.substr(0, pos + 1) + expanded;
}

std::string executable_dir() {
    char buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) return "";
    std::string exe(buf, static_cast<size_t>(len));
    std::string::size_type pos = exe.find_last_of('/');
    return pos == std::string::npos ? "" : exe.substr(0, pos);
}

std::string locate_config_file(const std::string& relative) {
    if (std::ifstream(relative).good()) return relative;

    std::string dir = executable_dir();
    if (!dir.empty()) {
        std::string candidate = dir + "/../" + relative;
        if (std::ifstream(candidate).good()) return candidate;
    }
    return relative;
}

Result<std::string> read_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Could not open " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace voxlink
