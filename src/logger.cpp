#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <utility>

namespace projsync {

LogLevel Logger::current_level = LogLevel::INFO;
std::ofstream Logger::log_file;
std::mutex Logger::log_mutex;
Logger::Listener Logger::listener;

void Logger::init(LogLevel level, const std::string& log_file_path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
    if (log_file.is_open()) {
        log_file.close();
    }
    if (!log_file_path.empty()) {
        log_file.open(log_file_path, std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "[Logger] Cannot open log file " << log_file_path << std::endl;
        }
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return current_level;
}

void Logger::set_listener(Listener l) {
    std::lock_guard<std::mutex> lock(log_mutex);
    listener = std::move(l);
}

void Logger::log(LogLevel level, const std::string& message) {
    Listener notify;
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (level < current_level) return;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time, &local_tm);

        std::string level_str;
        switch (level) {
            case LogLevel::DEBUG: level_str = "[DEBUG]"; break;
            case LogLevel::INFO:  level_str = "[INFO] "; break;
            case LogLevel::WARN:  level_str = "[WARN] "; break;
            case LogLevel::ERROR: level_str = "[ERROR]"; break;
        }

        if (log_file.is_open()) {
            log_file << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
                     << " " << level_str << " " << message << std::endl;
        }

        std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
        out << std::put_time(&local_tm, "%H:%M:%S")
            << " " << level_str << " " << message << std::endl;

        notify = listener;
    }

    // Called outside the lock so the listener may log again
    if (notify) {
        notify(level, message);
    }
}

} // namespace projsync
