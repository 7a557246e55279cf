#include "fs_utils.hpp"
#include "logger.hpp"
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

namespace projsync {

bool safe_exists(const std::string& path) {
    std::error_code ec;
    bool result = fs::exists(path, ec);
    if (ec) {
        Logger::debug("[FilesystemSafe] exists() I/O error for " + path + ": " + ec.message());
        return false;
    }
    return result;
}

bool safe_is_directory(const std::string& path) {
    std::error_code ec;
    bool result = fs::is_directory(path, ec);
    if (ec) {
        Logger::debug("[FilesystemSafe] is_directory() I/O error for " + path + ": " + ec.message());
        return false;
    }
    return result;
}

bool safe_create_directories(const std::string& path) {
    if (path.empty()) return false;
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        Logger::error("[FilesystemSafe] Cannot create directory " + path + ": " + ec.message());
        return false;
    }
    if (!safe_is_directory(path)) {
        Logger::error("[FilesystemSafe] Not a directory: " + path);
        return false;
    }
    return true;
}

std::string join_path(const std::string& root, const std::string& relative) {
    if (root.empty()) return relative;
    if (relative.empty()) return root;

    std::string result = root;
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    size_t start = 0;
    while (start < relative.size() && relative[start] == '/') {
        start++;
    }
    if (result != "/") {
        result += "/";
    }
    return result + relative.substr(start);
}

std::string default_config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/project-sync";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/project-sync";
    }
    return "/tmp/project-sync";
}

std::string default_cache_dir() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.cache/project-sync";
    }
    return "/tmp";
}

} // namespace projsync
