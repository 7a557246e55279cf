#include "app_window.hpp"
#include "dialogs.hpp"
#include "logger.hpp"
#include "notifications.hpp"

namespace projsync {

bool AppWindow::begin_operation() {
    if (busy_ || !current_project()) return false;
    busy_ = true;
    update_button_sensitivity();
    return true;
}

void AppWindow::end_operation() {
    busy_ = false;
    update_button_sensitivity();
}

// ============================================================================
// Project management
// ============================================================================

void AppWindow::on_add_project() {
    if (busy_) return;

    auto project = show_project_dialog(GTK_WINDOW(window_), "Add Project", std::nullopt);
    if (!project) return;

    std::string error;
    if (!store_->add(*project, &error)) {
        show_message_dialog(GTK_WINDOW(window_), "Error", error, true);
        return;
    }

    Logger::info("[Projects] Added project " + project->name);
    refresh_projects();
    select_project(project->name);
    set_status("Project added: " + project->name, StatusKind::Success);
}

void AppWindow::on_edit_project() {
    auto existing = current_project();
    if (busy_ || !existing) return;

    auto project = show_project_dialog(GTK_WINDOW(window_), "Edit Project", existing);
    if (!project) return;

    std::string error;
    if (!store_->update(existing->name, *project, &error)) {
        show_message_dialog(GTK_WINDOW(window_), "Error", error, true);
        return;
    }

    Logger::info("[Projects] Updated project " + project->name);
    refresh_projects();
    select_project(project->name);
    set_status("Project updated: " + project->name, StatusKind::Success);
}

void AppWindow::on_remove_project() {
    auto project = current_project();
    if (busy_ || !project) return;

    if (!show_confirm_dialog(GTK_WINDOW(window_), "Confirm", "Remove project '" + project->name + "'?")) {
        return;
    }

    if (!store_->remove(project->name)) {
        show_message_dialog(GTK_WINDOW(window_), "Error", "Could not remove project: " + project->name, true);
        return;
    }

    Logger::info("[Projects] Removed project " + project->name);
    refresh_projects();
    select_project(store_->empty() ? "" : store_->projects().front().name);
    set_status("Project removed", StatusKind::Info);
}

// ============================================================================
// Operations
// ============================================================================

void AppWindow::on_test_connection() {
    if (!begin_operation()) return;
    Project project = *current_project();

    prompter_->set_status("Testing SSH connection to " + project.remote_host + "...", StatusKind::Busy);

    std::string output;
    if (session_->test_connection(project, &output)) {
        prompter_->set_status("SSH connection OK", StatusKind::Success);
        prompter_->show_info("Success", "Successfully connected to " + project.remote_host);
    } else {
        prompter_->set_status("SSH connection failed", StatusKind::Error);
        prompter_->show_error("Connection Failed",
            "Could not connect to " + project.remote_host + "\n\n" +
            (output.empty() ? std::string("(no output)") : output) + "\n\n"
            "Check that:\n"
            "  - the host is reachable\n"
            "  - key-based login works (ssh " + project.remote_host + " without a password prompt)\n"
            "  - the host alias exists in ~/.ssh/config");
    }

    end_operation();
}

void AppWindow::on_full_sync() {
    if (!begin_operation()) return;
    Project project = *current_project();

    FullSyncReport report = session_->full_sync(project);

    NotificationManager::getInstance().notify_full_sync(project.name, report);

    end_operation();
}

void AppWindow::on_sync_to_remote() {
    if (!begin_operation()) return;
    session_->sync_to_remote(*current_project());
    end_operation();
}

void AppWindow::on_sync_from_remote() {
    if (!begin_operation()) return;
    session_->sync_from_remote(*current_project());
    end_operation();
}

void AppWindow::on_push() {
    if (!begin_operation()) return;
    session_->push(*current_project());
    end_operation();
}

void AppWindow::on_pull() {
    if (!begin_operation()) return;
    session_->pull(*current_project());
    end_operation();
}

} // namespace projsync
