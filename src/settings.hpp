#pragma once

#include <string>
#include <map>
#include <mutex>
#include <functional>

namespace projsync {

/**
 * Application Settings Manager
 *
 * Flat key/value preferences for the external tools and the UI:
 * - Command timeout and SSH connect timeout
 * - rsync options and the git remote name
 * - Notifications, debug logging, last selected project
 *
 * Settings are persisted to ~/.config/project-sync/settings.json
 */
class SettingsManager {
public:
    static SettingsManager& getInstance();

    // Point the manager at another configuration directory (--config-dir, tests)
    void set_config_dir(const std::string& dir);
    std::string get_config_dir() const;
    std::string get_config_path() const;

    // Load/save settings
    bool load();
    bool save();

    // External tools
    int get_command_timeout_seconds() const;
    void set_command_timeout_seconds(int seconds);

    int get_ssh_connect_timeout_seconds() const;
    void set_ssh_connect_timeout_seconds(int seconds);

    std::string get_rsync_options() const;
    void set_rsync_options(const std::string& options);

    std::string get_git_remote() const;
    void set_git_remote(const std::string& remote);

    // UI
    bool get_show_notifications() const;
    void set_show_notifications(bool enabled);

    bool get_debug_logging() const;
    void set_debug_logging(bool enabled);

    std::string get_last_project() const;
    void set_last_project(const std::string& name);

    // Settings change callback
    using SettingsChangeCallback = std::function<void(const std::string& key)>;
    void set_change_callback(SettingsChangeCallback callback);

    // Generic getters/setters
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    void set_string(const std::string& key, const std::string& value);

    int get_int(const std::string& key, int default_value = 0) const;
    void set_int(const std::string& key, int value);

    bool get_bool(const std::string& key, bool default_value = false) const;
    void set_bool(const std::string& key, bool value);

private:
    SettingsManager();
    ~SettingsManager() = default;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    void notify_change(const std::string& key);
    void ensure_defaults();

    mutable std::mutex mutex_;
    std::map<std::string, std::string> settings_;
    std::string config_dir_;
    SettingsChangeCallback change_callback_;
    bool loaded_ = false;
};

} // namespace projsync
