#pragma once

#include <gtk/gtk.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "command_runner.hpp"
#include "gtk_prompter.hpp"
#include "project_store.hpp"
#include "sync_session.hpp"

namespace projsync {

/**
 * Main Application Window (GTK4)
 *
 * - Project selector with the selected project's details
 * - Operation buttons: Test SSH, Full Sync, untracked sync both ways,
 *   git push and pull
 * - Project management: add, edit, remove
 * - Status line and log panel at the bottom
 *
 * Operations run synchronously on the GTK main thread; user input they
 * need is collected through modal dialogs.
 */
class AppWindow {
public:
    static AppWindow& getInstance();

    /**
     * Build the widgets, load the project store and restore the last
     * selection.
     * @return true on success
     */
    bool initialize();

    GtkWidget* get_window() const { return window_; }

    void show();

    /**
     * Append a line to the log panel
     */
    void append_log(const std::string& message);

    /**
     * Update the status line
     */
    void set_status(const std::string& message, StatusKind kind);

    /**
     * Detach from the logger before the widgets go away
     */
    void shutdown();

private:
    AppWindow() = default;
    ~AppWindow() = default;

    AppWindow(const AppWindow&) = delete;
    AppWindow& operator=(const AppWindow&) = delete;

    // UI construction (app_window.cpp)
    GtkWidget* build_project_section();
    GtkWidget* build_operations_section();
    GtkWidget* build_log_section();

    // Project list
    void refresh_projects();
    void select_project(const std::string& name);
    void on_project_selected(guint position);
    void update_project_details();
    void update_button_sensitivity();
    std::optional<Project> current_project() const;

    // Actions (app_window_actions.cpp)
    void on_add_project();
    void on_edit_project();
    void on_remove_project();
    void on_test_connection();
    void on_full_sync();
    void on_sync_to_remote();
    void on_sync_from_remote();
    void on_push();
    void on_pull();

    // Guards against re-entry while a modal operation is running
    bool begin_operation();
    void end_operation();

    // Window components
    GtkWidget* window_ = nullptr;
    GtkWidget* project_dropdown_ = nullptr;
    GtkStringList* project_model_ = nullptr;
    GtkWidget* local_path_label_ = nullptr;
    GtkWidget* remote_label_ = nullptr;
    GtkWidget* branch_label_ = nullptr;
    GtkWidget* status_label_ = nullptr;
    GtkWidget* logs_view_ = nullptr;

    GtkWidget* edit_btn_ = nullptr;
    GtkWidget* remove_btn_ = nullptr;
    std::vector<GtkWidget*> operation_buttons_;

    // Selection changes made by refresh_projects() must not be handled as user input
    bool updating_dropdown_ = false;
    bool busy_ = false;

    // Application state
    std::unique_ptr<ProjectStore> store_;
    std::unique_ptr<ShellCommandRunner> runner_;
    std::unique_ptr<GtkPrompter> prompter_;
    std::unique_ptr<SyncSession> session_;
};

} // namespace projsync
