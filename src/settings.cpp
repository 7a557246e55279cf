#include "settings.hpp"
#include "command_runner.hpp"
#include "fs_utils.hpp"
#include "json_util.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <cctype>

namespace projsync {

namespace {

const char* kSettingsFile = "settings.json";

bool looks_numeric(const std::string& value) {
    if (value.empty()) return false;
    size_t start = (value[0] == '-') ? 1 : 0;
    if (start == value.size()) return false;
    for (size_t i = start; i < value.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
    }
    return true;
}

} // namespace

SettingsManager::SettingsManager() : config_dir_(default_config_dir()) {}

SettingsManager& SettingsManager::getInstance() {
    static SettingsManager instance;
    return instance;
}

void SettingsManager::set_config_dir(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_dir_ = dir;
    settings_.clear();
    loaded_ = false;
}

std::string SettingsManager::get_config_dir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_dir_;
}

std::string SettingsManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return join_path(config_dir_, kSettingsFile);
}

void SettingsManager::ensure_defaults() {
    if (settings_.find("command_timeout_seconds") == settings_.end())
        settings_["command_timeout_seconds"] = std::to_string(kDefaultCommandTimeoutSeconds);
    if (settings_.find("ssh_connect_timeout_seconds") == settings_.end())
        settings_["ssh_connect_timeout_seconds"] = "10";
    if (settings_.find("rsync_options") == settings_.end())
        settings_["rsync_options"] = "-avz";
    if (settings_.find("git_remote") == settings_.end())
        settings_["git_remote"] = "origin";
    if (settings_.find("show_notifications") == settings_.end())
        settings_["show_notifications"] = "true";
    if (settings_.find("debug_logging") == settings_.end())
        settings_["debug_logging"] = "false";
    if (settings_.find("last_project") == settings_.end())
        settings_["last_project"] = "";
}

bool SettingsManager::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();

    std::string path = join_path(config_dir_, kSettingsFile);
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::info("[Settings] No settings file found, using defaults");
        ensure_defaults();
        loaded_ = true;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    json::FlatObject parsed;
    if (!json::parse_flat_object(buffer.str(), parsed)) {
        Logger::warn("[Settings] Settings file is not valid JSON, using defaults: " + path);
        ensure_defaults();
        loaded_ = true;
        return false;
    }

    settings_ = std::move(parsed);
    ensure_defaults();
    loaded_ = true;
    Logger::info("[Settings] Loaded " + std::to_string(settings_.size()) + " settings");
    return true;
}

bool SettingsManager::save() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_dir_.empty()) {
        Logger::error("[Settings] No config path set");
        return false;
    }
    if (!safe_create_directories(config_dir_)) {
        return false;
    }

    std::string path = join_path(config_dir_, kSettingsFile);
    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("[Settings] Failed to open settings file for writing: " + path);
        return false;
    }

    file << "{\n";
    bool first = true;
    for (const auto& [key, value] : settings_) {
        if (!first) file << ",\n";
        first = false;

        bool is_bool = (value == "true" || value == "false");
        if (looks_numeric(value) || is_bool) {
            file << "  \"" << json::escape(key) << "\": " << value;
        } else {
            file << "  \"" << json::escape(key) << "\": \"" << json::escape(value) << "\"";
        }
    }
    file << "\n}\n";
    file.close();

    if (!file) {
        Logger::error("[Settings] Failed to write settings file: " + path);
        return false;
    }

    Logger::debug("[Settings] Saved " + std::to_string(settings_.size()) + " settings");
    return true;
}

void SettingsManager::set_change_callback(SettingsChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callback_ = std::move(callback);
}

void SettingsManager::notify_change(const std::string& key) {
    SettingsChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = change_callback_;
    }
    if (callback) {
        callback(key);
    }
}

std::string SettingsManager::get_string(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(key);
    return (it != settings_.end()) ? it->second : default_value;
}

void SettingsManager::set_string(const std::string& key, const std::string& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }
    notify_change(key);
}

int SettingsManager::get_int(const std::string& key, int default_value) const {
    std::string value = get_string(key);
    if (!looks_numeric(value)) return default_value;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return default_value;
    }
}

void SettingsManager::set_int(const std::string& key, int value) {
    set_string(key, std::to_string(value));
}

bool SettingsManager::get_bool(const std::string& key, bool default_value) const {
    std::string value = get_string(key);
    if (value == "true") return true;
    if (value == "false") return false;
    return default_value;
}

void SettingsManager::set_bool(const std::string& key, bool value) {
    set_string(key, value ? "true" : "false");
}

int SettingsManager::get_command_timeout_seconds() const {
    int seconds = get_int("command_timeout_seconds", kDefaultCommandTimeoutSeconds);
    return seconds > 0 ? seconds : kDefaultCommandTimeoutSeconds;
}

void SettingsManager::set_command_timeout_seconds(int seconds) {
    set_int("command_timeout_seconds", seconds);
}

int SettingsManager::get_ssh_connect_timeout_seconds() const {
    int seconds = get_int("ssh_connect_timeout_seconds", 10);
    return seconds > 0 ? seconds : 10;
}

void SettingsManager::set_ssh_connect_timeout_seconds(int seconds) {
    set_int("ssh_connect_timeout_seconds", seconds);
}

std::string SettingsManager::get_rsync_options() const {
    return get_string("rsync_options", "-avz");
}

void SettingsManager::set_rsync_options(const std::string& options) {
    set_string("rsync_options", options);
}

std::string SettingsManager::get_git_remote() const {
    std::string remote = get_string("git_remote", "origin");
    return remote.empty() ? "origin" : remote;
}

void SettingsManager::set_git_remote(const std::string& remote) {
    set_string("git_remote", remote);
}

bool SettingsManager::get_show_notifications() const {
    return get_bool("show_notifications", true);
}

void SettingsManager::set_show_notifications(bool enabled) {
    set_bool("show_notifications", enabled);
}

bool SettingsManager::get_debug_logging() const {
    return get_bool("debug_logging", false);
}

void SettingsManager::set_debug_logging(bool enabled) {
    set_bool("debug_logging", enabled);
}

std::string SettingsManager::get_last_project() const {
    return get_string("last_project");
}

void SettingsManager::set_last_project(const std::string& name) {
    set_string("last_project", name);
}

} // namespace projsync
