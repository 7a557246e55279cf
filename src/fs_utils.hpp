#pragma once

#include <string>

namespace projsync {

/**
 * Safe filesystem operations that never throw exceptions.
 * These wrappers use std::error_code to handle I/O errors gracefully.
 */

/**
 * Safely check if a path exists (returns false on I/O errors)
 */
bool safe_exists(const std::string& path);

/**
 * Safely check if a path is a directory (returns false on I/O errors)
 */
bool safe_is_directory(const std::string& path);

/**
 * Create a directory and its parents. Returns false and logs on failure.
 */
bool safe_create_directories(const std::string& path);

/**
 * Join a project root and a relative path with exactly one separator
 */
std::string join_path(const std::string& root, const std::string& relative);

/**
 * Per-user configuration directory (~/.config/project-sync)
 */
std::string default_config_dir();

/**
 * Per-user cache directory (~/.cache/project-sync), used for the log file
 */
std::string default_cache_dir();

} // namespace projsync
