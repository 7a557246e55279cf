#pragma once

#include <gtk/gtk.h>
#include <functional>
#include <string>
#include <utility>
#include "user_prompter.hpp"

namespace projsync {

/**
 * UserPrompter backed by the modal dialogs in dialogs.hpp.
 * Status updates go to a sink (the main window's status label).
 */
class GtkPrompter : public UserPrompter {
public:
    using StatusSink = std::function<void(const std::string& message, StatusKind kind)>;

    GtkPrompter() = default;

    void set_parent(GtkWindow* parent) { parent_ = parent; }
    void set_status_sink(StatusSink sink) { status_sink_ = std::move(sink); }

    std::optional<Decision> decide_conflict(const Conflict& conflict,
                                            std::size_t index,
                                            std::size_t total) override;
    std::optional<std::string> ask_commit_message(const std::string& changes_summary) override;
    bool confirm(const std::string& title, const std::string& message) override;
    void show_error(const std::string& title, const std::string& message) override;
    void show_info(const std::string& title, const std::string& message) override;
    void set_status(const std::string& message, StatusKind kind) override;

private:
    GtkWindow* parent_ = nullptr;
    StatusSink status_sink_;
};

} // namespace projsync
