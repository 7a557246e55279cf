#include <gtk/gtk.h>
#include <iostream>
#include <string>
#include <vector>
#include "app_window.hpp"
#include "fs_utils.hpp"
#include "logger.hpp"
#include "notifications.hpp"
#include "settings.hpp"

using namespace projsync;

int main(int argc, char* argv[]) {
    // Parse arguments and build new argv without consumed options
    bool debug_mode = false;
    std::string config_dir;
    std::vector<char*> new_argv;
    new_argv.push_back(argv[0]);  // Program name

    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "--debug") {
            debug_mode = true;
        } else if (arg == "--config-dir") {
            if (i + 1 >= argc) {
                std::cerr << "--config-dir requires a directory argument\n";
                return 2;
            }
            config_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Project Sync - keep a project in step between two machines\n\n"
                      << "Usage: project-sync [options]\n\n"
                      << "Options:\n"
                      << "  --debug              Enable debug logging\n"
                      << "  --config-dir <dir>   Read projects and settings from <dir>\n"
                      << "  --help               Show this help message\n";
            return 0;
        } else {
            // Keep unconsumed arguments for GTK
            new_argv.push_back(argv[i]);
        }
    }
    new_argv.push_back(nullptr);

    int new_argc = static_cast<int>(new_argv.size()) - 1;

    // Init logger with file output
    std::string log_dir = default_cache_dir();
    std::string log_file = safe_create_directories(log_dir) ? log_dir + "/project-sync.log" : "";
    Logger::init(debug_mode ? LogLevel::DEBUG : LogLevel::INFO, log_file);
    Logger::info("Project Sync - Starting...");

    auto& settings = SettingsManager::getInstance();
    if (!config_dir.empty()) {
        settings.set_config_dir(config_dir);
    }
    settings.load();
    Logger::info("[Init] Settings loaded from " + settings.get_config_path());

    if (settings.get_debug_logging() && !debug_mode) {
        Logger::set_level(LogLevel::DEBUG);
    }
    if (Logger::level() == LogLevel::DEBUG) Logger::debug("Debug mode enabled");

    NotificationManager::getInstance().set_enabled(settings.get_show_notifications());

    GtkApplication* app = gtk_application_new("io.github.projectsync", G_APPLICATION_NON_UNIQUE);

    g_signal_connect(app, "activate", G_CALLBACK(+[](GtkApplication* app, gpointer) {
        Logger::debug("[Activate] GTK activate signal received");

        AppWindow& app_window = AppWindow::getInstance();
        if (!app_window.initialize()) {
            Logger::error("Fatal: Failed to initialize application window. Exiting.");
            g_application_quit(G_APPLICATION(app));
            return;
        }

        NotificationManager::getInstance().init(G_APPLICATION(app));

        gtk_application_add_window(app, GTK_WINDOW(app_window.get_window()));
        app_window.show();
        app_window.append_log("Project Sync started");
    }), nullptr);

    int status = g_application_run(G_APPLICATION(app), new_argc, new_argv.data());

    AppWindow::getInstance().shutdown();
    g_object_unref(app);

    Logger::info("Project Sync - Exiting.");
    return status;
}
