#pragma once
#include <string>
#include <fstream>
#include <mutex>
#include <functional>

namespace projsync {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    using Listener = std::function<void(LogLevel level, const std::string& message)>;

    static void init(LogLevel level, const std::string& log_file_path = "");
    static void set_level(LogLevel level);
    static LogLevel level();
    static void log(LogLevel level, const std::string& message);

    /**
     * Receives every message that passes the level filter.
     * The GUI uses this to mirror the log into its log panel.
     */
    static void set_listener(Listener listener);

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warn(const std::string& message) { log(LogLevel::WARN, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }

private:
    static LogLevel current_level;
    static std::ofstream log_file;
    static std::mutex log_mutex;
    static Listener listener;
};

} // namespace projsync
