#pragma once

#include "conflict_resolution.hpp"
#include "sync_types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace projsync {

enum class StatusKind {
    Info,
    Busy,
    Success,
    Warning,
    Error
};

/**
 * Everything the sync operations need from the user.
 * Each call blocks until the user answers. The GTK front end implements
 * it with modal dialogs; tests implement it with scripted answers.
 */
class UserPrompter {
public:
    virtual ~UserPrompter() = default;

    // nullopt cancels the whole resolution flow
    virtual std::optional<Decision> decide_conflict(const Conflict& conflict,
                                                    std::size_t index,
                                                    std::size_t total) = 0;

    // nullopt when the user cancels; never returns an empty message
    virtual std::optional<std::string> ask_commit_message(const std::string& changes_summary) = 0;

    virtual bool confirm(const std::string& title, const std::string& message) = 0;

    virtual void show_error(const std::string& title, const std::string& message) = 0;

    virtual void show_info(const std::string& title, const std::string& message) = 0;

    virtual void set_status(const std::string& message, StatusKind kind) = 0;
};

} // namespace projsync
