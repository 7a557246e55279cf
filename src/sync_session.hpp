#pragma once

#include "command_runner.hpp"
#include "conflict_detector.hpp"
#include "full_sync.hpp"
#include "git_operations.hpp"
#include "mtime_resolver.hpp"
#include "remote_shell.hpp"
#include "sync_operations.hpp"
#include "untracked_files.hpp"
#include "user_prompter.hpp"
#include <string>

namespace projsync {

// Tool settings the operations are built with
struct ToolOptions {
    int ssh_connect_timeout_seconds = 10;
    std::string rsync_options = "-avz";
    std::string git_remote = "origin";
};

/**
 * Wires the sync components to one command runner and one prompter.
 * The application window owns one session; tests build one around a
 * scripted runner and prompter.
 */
class SyncSession {
public:
    SyncSession(CommandRunner& runner, UserPrompter& prompter, const ToolOptions& options = ToolOptions());

    SyncSession(const SyncSession&) = delete;
    SyncSession& operator=(const SyncSession&) = delete;

    SyncResult sync_to_remote(const Project& project);
    SyncResult sync_from_remote(const Project& project);
    StepResult push(const Project& project);
    StepResult pull(const Project& project);
    FullSyncReport full_sync(const Project& project);
    bool test_connection(const Project& project, std::string* output);

    // True while one of the operations above is running
    bool busy() const { return busy_; }

    UntrackedSync& untracked() { return untracked_; }
    GitOperations& git() { return git_; }

private:
    RemoteShell shell_;
    UntrackedFileLister lister_;
    MtimeResolver resolver_;
    ConflictDetector detector_;
    UntrackedSync untracked_;
    GitOperations git_;
    FullSyncOrchestrator orchestrator_;
    bool busy_ = false;
};

} // namespace projsync
