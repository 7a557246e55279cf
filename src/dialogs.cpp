/**
 * dialogs.cpp
 *
 * Modal dialogs used by the main window and by GtkPrompter.
 */

#include "dialogs.hpp"
#include "logger.hpp"

namespace projsync {

namespace {

struct DialogFrame {
    GtkWidget* window;
    GtkWidget* vbox;
};

DialogFrame new_dialog(GtkWindow* parent, const std::string& title, int width) {
    GtkWidget* dialog = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(dialog), title.c_str());
    if (parent) {
        gtk_window_set_transient_for(GTK_WINDOW(dialog), parent);
    }
    gtk_window_set_modal(GTK_WINDOW(dialog), TRUE);
    gtk_window_set_default_size(GTK_WINDOW(dialog), width, -1);

    GtkWidget* vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 12);
    gtk_widget_set_margin_start(vbox, 20);
    gtk_widget_set_margin_end(vbox, 20);
    gtk_widget_set_margin_top(vbox, 20);
    gtk_widget_set_margin_bottom(vbox, 20);
    gtk_window_set_child(GTK_WINDOW(dialog), vbox);

    return {dialog, vbox};
}

GtkWidget* add_action_box(GtkWidget* vbox) {
    GtkWidget* action_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_set_halign(action_box, GTK_ALIGN_END);
    gtk_widget_set_margin_top(action_box, 12);
    gtk_box_append(GTK_BOX(vbox), action_box);
    return action_box;
}

GtkWidget* add_label(GtkWidget* vbox, const std::string& text, const char* css_class = nullptr) {
    GtkWidget* label = gtk_label_new(text.c_str());
    gtk_label_set_xalign(GTK_LABEL(label), 0);
    gtk_label_set_wrap(GTK_LABEL(label), TRUE);
    gtk_label_set_selectable(GTK_LABEL(label), TRUE);
    if (css_class) {
        gtk_widget_add_css_class(label, css_class);
    }
    gtk_box_append(GTK_BOX(vbox), label);
    return label;
}

GtkWidget* add_read_only_text(GtkWidget* vbox, const std::string& text, int height) {
    GtkWidget* scroll = gtk_scrolled_window_new();
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll), GTK_POLICY_AUTOMATIC, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_size_request(scroll, -1, height);
    gtk_widget_set_vexpand(scroll, TRUE);

    GtkWidget* text_view = gtk_text_view_new();
    gtk_text_view_set_editable(GTK_TEXT_VIEW(text_view), FALSE);
    gtk_text_view_set_monospace(GTK_TEXT_VIEW(text_view), TRUE);
    gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(text_view), GTK_WRAP_WORD_CHAR);
    gtk_text_buffer_set_text(gtk_text_view_get_buffer(GTK_TEXT_VIEW(text_view)), text.c_str(), -1);

    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroll), text_view);
    gtk_box_append(GTK_BOX(vbox), scroll);
    return text_view;
}

std::string entry_text(GtkWidget* entry) {
    const char* text = gtk_editable_get_text(GTK_EDITABLE(entry));
    return text ? text : "";
}

} // namespace

void run_modal(GtkWidget* dialog) {
    gtk_widget_set_visible(dialog, TRUE);
    gtk_window_present(GTK_WINDOW(dialog));

    // Block until window is closed (run a local event loop)
    GMainLoop* loop = g_main_loop_new(nullptr, FALSE);
    g_signal_connect_swapped(dialog, "destroy", G_CALLBACK(g_main_loop_quit), loop);
    g_main_loop_run(loop);
    g_main_loop_unref(loop);
}

// ============================================================================
// Message and confirmation
// ============================================================================

void show_message_dialog(GtkWindow* parent, const std::string& title,
                         const std::string& message, bool is_error) {
    DialogFrame frame = new_dialog(parent, title, 460);

    GtkWidget* header_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 10);
    GtkWidget* icon = gtk_image_new_from_icon_name(is_error ? "dialog-error" : "dialog-information");
    gtk_image_set_pixel_size(GTK_IMAGE(icon), 32);
    GtkWidget* heading = gtk_label_new(nullptr);
    char* markup = g_markup_printf_escaped("<b>%s</b>", title.c_str());
    gtk_label_set_markup(GTK_LABEL(heading), markup);
    g_free(markup);
    gtk_box_append(GTK_BOX(header_box), icon);
    gtk_box_append(GTK_BOX(header_box), heading);
    gtk_box_append(GTK_BOX(frame.vbox), header_box);

    // Tool output can be long, keep it scrollable
    if (message.size() > 300 || message.find('\n') != std::string::npos) {
        add_read_only_text(frame.vbox, message, 180);
    } else {
        add_label(frame.vbox, message);
    }

    GtkWidget* action_box = add_action_box(frame.vbox);
    GtkWidget* ok_btn = gtk_button_new_with_label("OK");
    gtk_widget_set_size_request(ok_btn, 100, -1);
    gtk_box_append(GTK_BOX(action_box), ok_btn);
    g_signal_connect_swapped(ok_btn, "clicked", G_CALLBACK(gtk_window_destroy), frame.window);

    run_modal(frame.window);
}

bool show_confirm_dialog(GtkWindow* parent, const std::string& title, const std::string& message) {
    DialogFrame frame = new_dialog(parent, title, 420);
    add_label(frame.vbox, message);

    struct ConfirmState {
        GtkWidget* dialog;
        bool confirmed = false;
    } state{frame.window};

    GtkWidget* action_box = add_action_box(frame.vbox);
    GtkWidget* no_btn = gtk_button_new_with_label("No");
    GtkWidget* yes_btn = gtk_button_new_with_label("Yes");
    gtk_widget_add_css_class(yes_btn, "suggested-action");
    gtk_box_append(GTK_BOX(action_box), no_btn);
    gtk_box_append(GTK_BOX(action_box), yes_btn);

    g_signal_connect_swapped(no_btn, "clicked", G_CALLBACK(gtk_window_destroy), frame.window);
    g_signal_connect(yes_btn, "clicked", G_CALLBACK(+[](GtkButton*, gpointer user_data) {
        auto* s = static_cast<ConfirmState*>(user_data);
        s->confirmed = true;
        gtk_window_destroy(GTK_WINDOW(s->dialog));
    }), &state);

    run_modal(frame.window);
    return state.confirmed;
}

// ============================================================================
// Project form
// ============================================================================

std::optional<Project> show_project_dialog(GtkWindow* parent,
                                           const std::string& title,
                                           const std::optional<Project>& existing) {
    DialogFrame frame = new_dialog(parent, title, 500);

    GtkWidget* grid = gtk_grid_new();
    gtk_grid_set_row_spacing(GTK_GRID(grid), 8);
    gtk_grid_set_column_spacing(GTK_GRID(grid), 12);
    gtk_box_append(GTK_BOX(frame.vbox), grid);

    struct FormState {
        GtkWidget* dialog = nullptr;
        GtkWidget* name = nullptr;
        GtkWidget* local = nullptr;
        GtkWidget* host = nullptr;
        GtkWidget* remote = nullptr;
        GtkWidget* branch = nullptr;
        std::optional<Project> result;
    } state;
    state.dialog = frame.window;

    auto add_row = [grid](int row, const char* caption, const std::string& value) {
        GtkWidget* label = gtk_label_new(caption);
        gtk_label_set_xalign(GTK_LABEL(label), 0);
        gtk_grid_attach(GTK_GRID(grid), label, 0, row, 1, 1);

        GtkWidget* entry = gtk_entry_new();
        gtk_editable_set_text(GTK_EDITABLE(entry), value.c_str());
        gtk_widget_set_hexpand(entry, TRUE);
        gtk_grid_attach(GTK_GRID(grid), entry, 1, row, 1, 1);
        return entry;
    };

    state.name = add_row(0, "Project Name:", existing ? existing->name : "");
    state.local = add_row(1, "Local Path:", existing ? existing->local_path : "");
    state.host = add_row(2, "Remote Host:", existing ? existing->remote_host : "");
    state.remote = add_row(3, "Remote Path:", existing ? existing->remote_path : "");
    state.branch = add_row(4, "Git Branch:", existing ? existing->git_branch : kDefaultBranch);

    GtkWidget* browse_btn = gtk_button_new_with_label("...");
    gtk_widget_set_tooltip_text(browse_btn, "Select Local Project Folder");
    gtk_grid_attach(GTK_GRID(grid), browse_btn, 2, 1, 1, 1);
    g_signal_connect(browse_btn, "clicked", G_CALLBACK(+[](GtkButton*, gpointer user_data) {
        auto* s = static_cast<FormState*>(user_data);
        GtkFileDialog* chooser = gtk_file_dialog_new();
        gtk_file_dialog_set_title(chooser, "Select Local Project Folder");

        // The entry outlives the async chooser only if we hold a reference
        gtk_file_dialog_select_folder(chooser, GTK_WINDOW(s->dialog), nullptr,
            [](GObject* source, GAsyncResult* result, gpointer data) {
                GtkWidget* entry = GTK_WIDGET(data);
                GFile* file = gtk_file_dialog_select_folder_finish(GTK_FILE_DIALOG(source), result, nullptr);
                if (file) {
                    char* path = g_file_get_path(file);
                    if (path) {
                        gtk_editable_set_text(GTK_EDITABLE(entry), path);
                        g_free(path);
                    }
                    g_object_unref(file);
                }
                g_object_unref(entry);
            }, g_object_ref(s->local));

        g_object_unref(chooser);
    }), &state);

    add_label(frame.vbox, "Remote Host: SSH alias from ~/.ssh/config or user@hostname", "dim-label");

    GtkWidget* action_box = add_action_box(frame.vbox);
    GtkWidget* cancel_btn = gtk_button_new_with_label("Cancel");
    GtkWidget* save_btn = gtk_button_new_with_label("Save");
    gtk_widget_add_css_class(save_btn, "suggested-action");
    gtk_box_append(GTK_BOX(action_box), cancel_btn);
    gtk_box_append(GTK_BOX(action_box), save_btn);

    g_signal_connect_swapped(cancel_btn, "clicked", G_CALLBACK(gtk_window_destroy), frame.window);
    g_signal_connect(save_btn, "clicked", G_CALLBACK(+[](GtkButton*, gpointer user_data) {
        auto* s = static_cast<FormState*>(user_data);
        std::string error;
        auto project = Project::create(entry_text(s->name), entry_text(s->local), entry_text(s->host),
                                       entry_text(s->remote), entry_text(s->branch), &error);
        if (!project) {
            Logger::warn("[Projects] Invalid project input: " + error);
            show_message_dialog(GTK_WINDOW(s->dialog), "Error", error, true);
            return;
        }
        s->result = project;
        gtk_window_destroy(GTK_WINDOW(s->dialog));
    }), &state);

    run_modal(frame.window);
    return state.result;
}

// ============================================================================
// Commit message
// ============================================================================

std::optional<std::string> show_commit_dialog(GtkWindow* parent, const std::string& changes_summary) {
    DialogFrame frame = new_dialog(parent, "Uncommitted Changes Detected", 450);
    add_label(frame.vbox, "You have uncommitted changes.");

    if (!changes_summary.empty()) {
        add_read_only_text(frame.vbox, changes_summary, 90);
    }

    add_label(frame.vbox, "Commit message:");
    GtkWidget* entry = gtk_entry_new();
    gtk_box_append(GTK_BOX(frame.vbox), entry);

    struct CommitState {
        GtkWidget* dialog;
        GtkWidget* entry;
        std::optional<std::string> message;
    } state{frame.window, entry, std::nullopt};

    GtkWidget* action_box = add_action_box(frame.vbox);
    GtkWidget* cancel_btn = gtk_button_new_with_label("Cancel");
    GtkWidget* commit_btn = gtk_button_new_with_label("Commit & Push");
    gtk_widget_add_css_class(commit_btn, "suggested-action");
    gtk_box_append(GTK_BOX(action_box), cancel_btn);
    gtk_box_append(GTK_BOX(action_box), commit_btn);

    auto on_commit = +[](GtkWidget*, gpointer user_data) {
        auto* s = static_cast<CommitState*>(user_data);
        std::string message = entry_text(s->entry);
        const char* ws = " \t\r\n";
        if (message.find_first_not_of(ws) == std::string::npos) {
            show_message_dialog(GTK_WINDOW(s->dialog), "Error", "Commit message is required", true);
            return;
        }
        s->message = message.substr(message.find_first_not_of(ws),
                                    message.find_last_not_of(ws) - message.find_first_not_of(ws) + 1);
        gtk_window_destroy(GTK_WINDOW(s->dialog));
    };

    g_signal_connect_swapped(cancel_btn, "clicked", G_CALLBACK(gtk_window_destroy), frame.window);
    g_signal_connect(commit_btn, "clicked", G_CALLBACK(on_commit), &state);
    g_signal_connect(entry, "activate", G_CALLBACK(on_commit), &state);

    gtk_widget_grab_focus(entry);
    run_modal(frame.window);
    return state.message;
}

// ============================================================================
// Conflicts
// ============================================================================

std::optional<Decision> show_conflict_dialog(GtkWindow* parent,
                                             const Conflict& conflict,
                                             std::size_t index,
                                             std::size_t total) {
    DialogFrame frame = new_dialog(parent, "Conflicts Detected", 500);

    GtkWidget* heading = gtk_label_new(nullptr);
    std::string heading_text = "Conflict " + std::to_string(index + 1) + " of " + std::to_string(total);
    char* markup = g_markup_printf_escaped("<span size='large' weight='bold'>%s</span>", heading_text.c_str());
    gtk_label_set_markup(GTK_LABEL(heading), markup);
    g_free(markup);
    gtk_label_set_xalign(GTK_LABEL(heading), 0);
    gtk_box_append(GTK_BOX(frame.vbox), heading);

    add_label(frame.vbox, "File: " + conflict.file);
    add_label(frame.vbox, "Modified on both local and remote", "dim-label");
    add_label(frame.vbox, "Local:  " + conflict.local_time);
    add_label(frame.vbox, "Remote: " + conflict.remote_time);

    struct ConflictState {
        GtkWidget* dialog;
        GtkWidget* apply_all;
        std::optional<Decision> decision;
    } state{frame.window, nullptr, std::nullopt};

    GtkWidget* choice_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_set_halign(choice_box, GTK_ALIGN_CENTER);
    gtk_widget_set_margin_top(choice_box, 8);
    gtk_box_append(GTK_BOX(frame.vbox), choice_box);

    struct ChoiceButton {
        const char* label;
        Choice choice;
    };
    const ChoiceButton buttons[] = {
        {"Use Local", Choice::Local},
        {"Use Remote", Choice::Remote},
        {"Skip", Choice::Skip},
    };
    for (const auto& b : buttons) {
        GtkWidget* btn = gtk_button_new_with_label(b.label);
        g_object_set_data(G_OBJECT(btn), "choice", GINT_TO_POINTER(static_cast<int>(b.choice)));
        g_signal_connect(btn, "clicked", G_CALLBACK(+[](GtkButton* button, gpointer user_data) {
            auto* s = static_cast<ConflictState*>(user_data);
            Decision decision;
            decision.choice = static_cast<Choice>(GPOINTER_TO_INT(g_object_get_data(G_OBJECT(button), "choice")));
            decision.apply_to_remaining = gtk_check_button_get_active(GTK_CHECK_BUTTON(s->apply_all));
            s->decision = decision;
            gtk_window_destroy(GTK_WINDOW(s->dialog));
        }), &state);
        gtk_box_append(GTK_BOX(choice_box), btn);
    }

    state.apply_all = gtk_check_button_new_with_label("Apply to all remaining conflicts");
    gtk_widget_set_sensitive(state.apply_all, index + 1 < total);
    gtk_box_append(GTK_BOX(frame.vbox), state.apply_all);

    gtk_box_append(GTK_BOX(frame.vbox), gtk_separator_new(GTK_ORIENTATION_HORIZONTAL));

    GtkWidget* cancel_btn = gtk_button_new_with_label("Cancel All");
    gtk_widget_set_halign(cancel_btn, GTK_ALIGN_CENTER);
    gtk_widget_add_css_class(cancel_btn, "destructive-action");
    gtk_box_append(GTK_BOX(frame.vbox), cancel_btn);
    g_signal_connect_swapped(cancel_btn, "clicked", G_CALLBACK(gtk_window_destroy), frame.window);

    run_modal(frame.window);
    return state.decision;
}

} // namespace projsync
