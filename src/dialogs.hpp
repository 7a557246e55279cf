#pragma once

#include <gtk/gtk.h>
#include <cstddef>
#include <optional>
#include <string>
#include "conflict_resolution.hpp"
#include "project.hpp"
#include "sync_types.hpp"

namespace projsync {

/**
 * Modal dialogs (GTK4)
 *
 * Every function blocks in a nested main loop until its window is
 * destroyed and then returns the user's answer, so callers can be
 * written as straight-line code.
 */

/**
 * Present a window and run a local event loop until it is destroyed
 */
void run_modal(GtkWidget* dialog);

/**
 * Add/edit project form. Re-prompts on validation errors; nullopt on Cancel.
 */
std::optional<Project> show_project_dialog(GtkWindow* parent,
                                           const std::string& title,
                                           const std::optional<Project>& existing);

/**
 * Commit message form showing the `git status` summary.
 * An empty message is rejected; nullopt on Cancel.
 */
std::optional<std::string> show_commit_dialog(GtkWindow* parent, const std::string& changes_summary);

/**
 * "Conflict i of n" with Use Local / Use Remote / Skip, the
 * "Apply to all remaining conflicts" check box and Cancel All.
 * nullopt means Cancel All (or the window was closed).
 */
std::optional<Decision> show_conflict_dialog(GtkWindow* parent,
                                             const Conflict& conflict,
                                             std::size_t index,
                                             std::size_t total);

bool show_confirm_dialog(GtkWindow* parent, const std::string& title, const std::string& message);

void show_message_dialog(GtkWindow* parent, const std::string& title,
                         const std::string& message, bool is_error);

} // namespace projsync
