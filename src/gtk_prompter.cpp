#include "gtk_prompter.hpp"
#include "dialogs.hpp"

namespace projsync {

std::optional<Decision> GtkPrompter::decide_conflict(const Conflict& conflict,
                                                     std::size_t index,
                                                     std::size_t total) {
    return show_conflict_dialog(parent_, conflict, index, total);
}

std::optional<std::string> GtkPrompter::ask_commit_message(const std::string& changes_summary) {
    return show_commit_dialog(parent_, changes_summary);
}

bool GtkPrompter::confirm(const std::string& title, const std::string& message) {
    return show_confirm_dialog(parent_, title, message);
}

void GtkPrompter::show_error(const std::string& title, const std::string& message) {
    show_message_dialog(parent_, title, message, true);
}

void GtkPrompter::show_info(const std::string& title, const std::string& message) {
    show_message_dialog(parent_, title, message, false);
}

void GtkPrompter::set_status(const std::string& message, StatusKind kind) {
    if (status_sink_) {
        status_sink_(message, kind);
    }

    // Operations run on the main thread; let the label repaint before the
    // next external command blocks
    while (g_main_context_pending(nullptr)) {
        g_main_context_iteration(nullptr, FALSE);
    }
}

} // namespace projsync
