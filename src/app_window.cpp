#include "app_window.hpp"
#include "fs_utils.hpp"
#include "logger.hpp"
#include "settings.hpp"
#include <ctime>
#include <initializer_list>

namespace projsync {

namespace {

const char* const kStatusClasses[] = {"dim-label", "accent", "success", "warning", "error"};

const char* status_class(StatusKind kind) {
    switch (kind) {
        case StatusKind::Info: return "dim-label";
        case StatusKind::Busy: return "accent";
        case StatusKind::Success: return "success";
        case StatusKind::Warning: return "warning";
        case StatusKind::Error: return "error";
    }
    return "dim-label";
}

GtkWidget* new_detail_label(GtkWidget* grid, int row, const char* caption) {
    GtkWidget* caption_label = gtk_label_new(caption);
    gtk_label_set_xalign(GTK_LABEL(caption_label), 0);
    gtk_widget_add_css_class(caption_label, "dim-label");
    gtk_grid_attach(GTK_GRID(grid), caption_label, 0, row, 1, 1);

    GtkWidget* value_label = gtk_label_new("");
    gtk_label_set_xalign(GTK_LABEL(value_label), 0);
    gtk_label_set_selectable(GTK_LABEL(value_label), TRUE);
    gtk_label_set_ellipsize(GTK_LABEL(value_label), PANGO_ELLIPSIZE_MIDDLE);
    gtk_widget_set_hexpand(value_label, TRUE);
    gtk_grid_attach(GTK_GRID(grid), value_label, 1, row, 1, 1);
    return value_label;
}

} // namespace

AppWindow& AppWindow::getInstance() {
    static AppWindow instance;
    return instance;
}

bool AppWindow::initialize() {
    if (window_) return true;

    auto& settings = SettingsManager::getInstance();

    store_ = std::make_unique<ProjectStore>(join_path(settings.get_config_dir(), "projects.json"));
    if (!store_->load()) {
        Logger::info("[Init] Starting with an empty project list");
    }

    runner_ = std::make_unique<ShellCommandRunner>(settings.get_command_timeout_seconds());
    prompter_ = std::make_unique<GtkPrompter>();

    ToolOptions options;
    options.ssh_connect_timeout_seconds = settings.get_ssh_connect_timeout_seconds();
    options.rsync_options = settings.get_rsync_options();
    options.git_remote = settings.get_git_remote();
    session_ = std::make_unique<SyncSession>(*runner_, *prompter_, options);

    window_ = gtk_window_new();
    if (!window_) {
        Logger::error("[AppWindow] Failed to create window");
        return false;
    }
    gtk_window_set_title(GTK_WINDOW(window_), "Project Sync");
    gtk_window_set_default_size(GTK_WINDOW(window_), 640, 600);

    // Status updates pump the main loop mid-operation; the window must stay alive until it ends
    g_signal_connect(window_, "close-request", G_CALLBACK(+[](GtkWindow* /*win*/, gpointer data) -> gboolean {
        auto* self = static_cast<AppWindow*>(data);
        if (self->busy_ || self->session_->busy()) {
            Logger::info("[AppWindow] Close ignored while an operation is running");
            self->set_status("Wait for the current operation to finish before closing", StatusKind::Warning);
            return TRUE;
        }
        return FALSE;
    }), this);

    GtkWidget* main_box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 12);
    gtk_widget_set_margin_start(main_box, 16);
    gtk_widget_set_margin_end(main_box, 16);
    gtk_widget_set_margin_top(main_box, 16);
    gtk_widget_set_margin_bottom(main_box, 16);
    gtk_window_set_child(GTK_WINDOW(window_), main_box);

    gtk_box_append(GTK_BOX(main_box), build_project_section());
    gtk_box_append(GTK_BOX(main_box), gtk_separator_new(GTK_ORIENTATION_HORIZONTAL));
    gtk_box_append(GTK_BOX(main_box), build_operations_section());
    gtk_box_append(GTK_BOX(main_box), gtk_separator_new(GTK_ORIENTATION_HORIZONTAL));
    gtk_box_append(GTK_BOX(main_box), build_log_section());

    prompter_->set_parent(GTK_WINDOW(window_));
    prompter_->set_status_sink([this](const std::string& message, StatusKind kind) {
        set_status(message, kind);
    });

    // Mirror log messages into the panel; posted through the main loop
    // because the logger may be called while a dialog is being built
    Logger::set_listener([](LogLevel level, const std::string& message) {
        if (level < LogLevel::INFO) return;
        struct LogData {
            std::string message;
        };
        auto* data = new LogData{message};
        g_idle_add(+[](gpointer user_data) -> gboolean {
            auto* d = static_cast<LogData*>(user_data);
            AppWindow::getInstance().append_log(d->message);
            delete d;
            return G_SOURCE_REMOVE;
        }, data);
    });

    refresh_projects();

    std::string last = settings.get_last_project();
    if (!last.empty() && store_->find(last)) {
        select_project(last);
    } else if (!store_->empty()) {
        select_project(store_->projects().front().name);
    } else {
        select_project("");
    }

    set_status("Ready", StatusKind::Info);
    return true;
}

void AppWindow::show() {
    if (!window_) return;
    gtk_widget_set_visible(window_, TRUE);
    gtk_window_present(GTK_WINDOW(window_));
}

void AppWindow::shutdown() {
    Logger::set_listener(nullptr);
    logs_view_ = nullptr;
    status_label_ = nullptr;
}

// ============================================================================
// UI construction
// ============================================================================

GtkWidget* AppWindow::build_project_section() {
    GtkWidget* section = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);

    GtkWidget* select_row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    GtkWidget* caption = gtk_label_new("Project:");
    gtk_box_append(GTK_BOX(select_row), caption);

    project_model_ = gtk_string_list_new(nullptr);
    project_dropdown_ = gtk_drop_down_new(G_LIST_MODEL(project_model_), nullptr);
    gtk_widget_set_hexpand(project_dropdown_, TRUE);
    gtk_box_append(GTK_BOX(select_row), project_dropdown_);
    g_signal_connect(project_dropdown_, "notify::selected", G_CALLBACK(+[](GObject* dropdown, GParamSpec*, gpointer user_data) {
        auto* self = static_cast<AppWindow*>(user_data);
        if (self->updating_dropdown_) return;
        self->on_project_selected(gtk_drop_down_get_selected(GTK_DROP_DOWN(dropdown)));
    }), this);

    GtkWidget* add_btn = gtk_button_new_with_label("+ Add Project");
    edit_btn_ = gtk_button_new_with_label("Edit Project");
    remove_btn_ = gtk_button_new_with_label("Remove");
    gtk_widget_add_css_class(remove_btn_, "destructive-action");
    gtk_box_append(GTK_BOX(select_row), add_btn);
    gtk_box_append(GTK_BOX(select_row), edit_btn_);
    gtk_box_append(GTK_BOX(select_row), remove_btn_);

    g_signal_connect(add_btn, "clicked", G_CALLBACK(+[](GtkButton*, gpointer user_data) {
        static_cast<AppWindow*>(user_data)->on_add_project();
    }), this);
    g_signal_connect(edit_btn_, "clicked", G_CALLBACK(+[](GtkButton*, gpointer user_data) {
        static_cast<AppWindow*>(user_data)->on_edit_project();
    }), this);
    g_signal_connect(remove_btn_, "clicked", G_CALLBACK(+[](GtkButton*, gpointer user_data) {
        static_cast<AppWindow*>(user_data)->on_remove_project();
    }), this);

    gtk_box_append(GTK_BOX(section), select_row);

    GtkWidget* details = gtk_grid_new();
    gtk_grid_set_row_spacing(GTK_GRID(details), 4);
    gtk_grid_set_column_spacing(GTK_GRID(details), 12);
    local_path_label_ = new_detail_label(details, 0, "Local:");
    remote_label_ = new_detail_label(details, 1, "Remote:");
    branch_label_ = new_detail_label(details, 2, "Branch:");
    gtk_box_append(GTK_BOX(section), details);

    return section;
}

GtkWidget* AppWindow::build_operations_section() {
    GtkWidget* section = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);

    struct ButtonSpec {
        const char* label;
        const char* tooltip;
        void (AppWindow::*handler)();
    };

    auto add_row = [this, section](std::initializer_list<ButtonSpec> specs) {
        GtkWidget* row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
        gtk_box_set_homogeneous(GTK_BOX(row), TRUE);
        for (const auto& spec : specs) {
            GtkWidget* btn = gtk_button_new_with_label(spec.label);
            gtk_widget_set_tooltip_text(btn, spec.tooltip);

            // Member function pointer is stored on the button, the window is the signal data
            auto* handler = new ButtonSpec(spec);
            g_object_set_data_full(G_OBJECT(btn), "handler", handler, +[](gpointer p) {
                delete static_cast<ButtonSpec*>(p);
            });
            g_signal_connect(btn, "clicked", G_CALLBACK(+[](GtkButton* button, gpointer user_data) {
                auto* self = static_cast<AppWindow*>(user_data);
                auto* h = static_cast<ButtonSpec*>(g_object_get_data(G_OBJECT(button), "handler"));
                (self->*(h->handler))();
            }), this);

            gtk_box_append(GTK_BOX(row), btn);
            operation_buttons_.push_back(btn);
        }
        gtk_box_append(GTK_BOX(section), row);
        return row;
    };

    add_row({
        {"Test SSH", "Check that the remote host accepts a non-interactive ssh login", &AppWindow::on_test_connection},
        {"Full Sync", "Sync untracked files up, push, pull, then sync untracked files down", &AppWindow::on_full_sync},
    });
    add_row({
        {"Sync to Remote →", "Copy gitignored files to the remote machine", &AppWindow::on_sync_to_remote},
        {"← Sync from Remote", "Copy gitignored files from the remote machine", &AppWindow::on_sync_from_remote},
    });
    add_row({
        {"Push to Remote", "Commit local changes if needed and git push", &AppWindow::on_push},
        {"Pull from Remote", "git pull the configured branch", &AppWindow::on_pull},
    });

    // The full sync button is the primary action
    if (operation_buttons_.size() > 1) {
        gtk_widget_add_css_class(operation_buttons_[1], "suggested-action");
    }

    return section;
}

GtkWidget* AppWindow::build_log_section() {
    GtkWidget* section = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_widget_set_vexpand(section, TRUE);

    status_label_ = gtk_label_new("");
    gtk_label_set_xalign(GTK_LABEL(status_label_), 0);
    gtk_label_set_ellipsize(GTK_LABEL(status_label_), PANGO_ELLIPSIZE_END);
    gtk_box_append(GTK_BOX(section), status_label_);

    GtkWidget* scroll = gtk_scrolled_window_new();
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll), GTK_POLICY_AUTOMATIC, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_vexpand(scroll, TRUE);
    gtk_widget_set_size_request(scroll, -1, 160);

    logs_view_ = gtk_text_view_new();
    gtk_text_view_set_editable(GTK_TEXT_VIEW(logs_view_), FALSE);
    gtk_text_view_set_cursor_visible(GTK_TEXT_VIEW(logs_view_), FALSE);
    gtk_text_view_set_monospace(GTK_TEXT_VIEW(logs_view_), TRUE);
    gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(logs_view_), GTK_WRAP_WORD_CHAR);
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroll), logs_view_);
    gtk_box_append(GTK_BOX(section), scroll);

    return section;
}

// ============================================================================
// Status and log
// ============================================================================

void AppWindow::append_log(const std::string& message) {
    if (!logs_view_) return;

    time_t now = time(nullptr);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char time_buf[32];
    strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::string full_msg = std::string(time_buf) + " " + message + "\n";

    GtkTextBuffer* buffer = gtk_text_view_get_buffer(GTK_TEXT_VIEW(logs_view_));
    GtkTextIter end;
    gtk_text_buffer_get_end_iter(buffer, &end);
    gtk_text_buffer_insert(buffer, &end, full_msg.c_str(), -1);

    // Auto-scroll
    gtk_text_buffer_get_end_iter(buffer, &end);
    GtkTextMark* mark = gtk_text_buffer_get_insert(buffer);
    gtk_text_buffer_place_cursor(buffer, &end);
    gtk_text_view_scroll_to_mark(GTK_TEXT_VIEW(logs_view_), mark, 0.0, TRUE, 0.0, 1.0);
}

void AppWindow::set_status(const std::string& message, StatusKind kind) {
    if (!status_label_) return;
    for (const char* css : kStatusClasses) {
        gtk_widget_remove_css_class(status_label_, css);
    }
    gtk_widget_add_css_class(status_label_, status_class(kind));
    gtk_label_set_text(GTK_LABEL(status_label_), message.c_str());
}

// ============================================================================
// Project list
// ============================================================================

void AppWindow::refresh_projects() {
    updating_dropdown_ = true;

    guint old_count = g_list_model_get_n_items(G_LIST_MODEL(project_model_));
    std::vector<std::string> names = store_->names();
    std::vector<const char*> items;
    for (const auto& name : names) {
        items.push_back(name.c_str());
    }
    items.push_back(nullptr);
    gtk_string_list_splice(project_model_, 0, old_count, items.data());

    updating_dropdown_ = false;
}

void AppWindow::select_project(const std::string& name) {
    if (name.empty() || !store_->select(name)) {
        store_->clear_selection();
    }

    updating_dropdown_ = true;
    guint position = GTK_INVALID_LIST_POSITION;
    std::vector<std::string> names = store_->names();
    for (guint i = 0; i < names.size(); i++) {
        if (names[i] == store_->selected_name()) {
            position = i;
            break;
        }
    }
    gtk_drop_down_set_selected(GTK_DROP_DOWN(project_dropdown_), position);
    updating_dropdown_ = false;

    auto& settings = SettingsManager::getInstance();
    if (settings.get_last_project() != store_->selected_name()) {
        settings.set_last_project(store_->selected_name());
        settings.save();
    }

    update_project_details();
    update_button_sensitivity();
}

void AppWindow::on_project_selected(guint position) {
    std::vector<std::string> names = store_->names();
    if (position == GTK_INVALID_LIST_POSITION || position >= names.size()) {
        select_project("");
        return;
    }
    Logger::debug("[Projects] Selected " + names[position]);
    select_project(names[position]);
}

void AppWindow::update_project_details() {
    auto project = current_project();
    gtk_label_set_text(GTK_LABEL(local_path_label_), project ? project->local_path.c_str() : "-");
    gtk_label_set_text(GTK_LABEL(remote_label_), project ? project->remote_spec().c_str() : "-");
    gtk_label_set_text(GTK_LABEL(branch_label_), project ? project->git_branch.c_str() : "-");
}

void AppWindow::update_button_sensitivity() {
    bool has_project = current_project().has_value();
    bool enabled = has_project && !busy_;
    for (GtkWidget* btn : operation_buttons_) {
        gtk_widget_set_sensitive(btn, enabled);
    }
    gtk_widget_set_sensitive(edit_btn_, enabled);
    gtk_widget_set_sensitive(remove_btn_, enabled);
    gtk_widget_set_sensitive(project_dropdown_, !busy_);
}

std::optional<Project> AppWindow::current_project() const {
    if (!store_) return std::nullopt;
    return store_->selected();
}

} // namespace projsync
