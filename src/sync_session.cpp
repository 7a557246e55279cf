#include "sync_session.hpp"

namespace projsync {

namespace {

// Marks the session busy for the lifetime of one operation
class BusyScope {
public:
    explicit BusyScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~BusyScope() { flag_ = false; }

    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;

private:
    bool& flag_;
};

} // namespace

SyncSession::SyncSession(CommandRunner& runner, UserPrompter& prompter, const ToolOptions& options)
    : shell_(runner, options.ssh_connect_timeout_seconds),
      lister_(runner),
      resolver_(runner),
      detector_(lister_, resolver_),
      untracked_(runner, lister_, detector_, prompter, options.rsync_options),
      git_(runner, prompter, options.git_remote),
      orchestrator_(untracked_, git_, prompter) {}

SyncResult SyncSession::sync_to_remote(const Project& project) {
    BusyScope scope(busy_);
    return untracked_.sync(project, SyncDirection::ToRemote);
}

SyncResult SyncSession::sync_from_remote(const Project& project) {
    BusyScope scope(busy_);
    return untracked_.sync(project, SyncDirection::FromRemote);
}

StepResult SyncSession::push(const Project& project) {
    BusyScope scope(busy_);
    return git_.push(project);
}

StepResult SyncSession::pull(const Project& project) {
    BusyScope scope(busy_);
    return git_.pull(project);
}

FullSyncReport SyncSession::full_sync(const Project& project) {
    BusyScope scope(busy_);
    return orchestrator_.run(project);
}

bool SyncSession::test_connection(const Project& project, std::string* output) {
    BusyScope scope(busy_);
    return shell_.test_connection(project, output);
}

} // namespace projsync
