#include "git_operations.hpp"
#include "logger.hpp"

namespace projsync {

GitOperations::GitOperations(CommandRunner& runner, UserPrompter& prompter, std::string remote)
    : runner_(runner), prompter_(prompter), remote_(remote.empty() ? "origin" : std::move(remote)) {}

bool GitOperations::is_dirty(const Project& project, std::string* summary) const {
    CommandResult status = runner_.run("git status --porcelain", project.local_path);
    if (!status.success) {
        Logger::warn("[Git] Error checking git status: " + status.output);
        if (summary) *summary = "Error checking git status";
        return false;
    }
    if (summary) *summary = status.output;
    return !status.output.empty();
}

StepResult GitOperations::push(const Project& project) {
    prompter_.set_status("Checking for uncommitted changes...", StatusKind::Busy);

    std::string summary;
    if (is_dirty(project, &summary)) {
        std::optional<std::string> message = prompter_.ask_commit_message(summary);
        if (!message || message->empty()) {
            Logger::info("[Git] Push cancelled at commit message");
            prompter_.set_status("Push cancelled", StatusKind::Info);
            return StepResult::Cancelled;
        }

        prompter_.set_status("Committing changes...", StatusKind::Busy);
        CommandResult commit = runner_.run("git add -A && git commit -m " + shell_escape(*message),
                                           project.local_path);
        if (!commit.success) {
            Logger::error("[Git] Commit failed: " + commit.output);
            prompter_.set_status("Commit failed", StatusKind::Error);
            prompter_.show_error("Commit Failed", "Commit failed:\n" + commit.output);
            return StepResult::Failed;
        }
        Logger::info("[Git] Committed changes in " + project.name);
    }

    prompter_.set_status("Pushing to remote...", StatusKind::Busy);
    CommandResult push = runner_.run("git push " + shell_escape(remote_) + " " + shell_escape(project.git_branch),
                                     project.local_path);
    if (!push.success) {
        Logger::error("[Git] Push failed: " + push.output);
        prompter_.set_status("Push failed", StatusKind::Error);
        prompter_.show_error("Push Failed", "Push failed:\n" + push.output);
        return StepResult::Failed;
    }

    Logger::info("[Git] Pushed " + project.git_branch + " to " + remote_);
    prompter_.set_status("Push successful", StatusKind::Success);
    return StepResult::Success;
}

StepResult GitOperations::pull(const Project& project) {
    if (is_dirty(project, nullptr)) {
        bool proceed = prompter_.confirm(
            "Warning",
            "You have uncommitted changes. Pull may fail or create merge conflicts.\n\nContinue anyway?");
        if (!proceed) {
            Logger::info("[Git] Pull cancelled because of uncommitted changes");
            prompter_.set_status("Pull cancelled", StatusKind::Info);
            return StepResult::Cancelled;
        }
    }

    prompter_.set_status("Pulling from remote...", StatusKind::Busy);
    CommandResult pull = runner_.run("git pull " + shell_escape(remote_) + " " + shell_escape(project.git_branch),
                                     project.local_path);
    if (!pull.success) {
        Logger::error("[Git] Pull failed: " + pull.output);
        prompter_.set_status("Pull failed", StatusKind::Error);
        prompter_.show_error("Pull Failed", "Pull failed:\n" + pull.output);
        return StepResult::Failed;
    }

    Logger::info("[Git] Pulled " + project.git_branch + " from " + remote_);
    prompter_.set_status("Pull successful", StatusKind::Success);
    return StepResult::Success;
}

} // namespace projsync
