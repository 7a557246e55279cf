#include "sync_operations.hpp"
#include "conflict_resolution.hpp"
#include "logger.hpp"
#include <glib.h>
#include <glib/gstdio.h>
#include <fstream>
#include <unistd.h>

namespace projsync {

namespace {

/**
 * Temporary --files-from list, removed when the transfer is done
 */
class FileListFile {
public:
    explicit FileListFile(const std::vector<std::string>& files) {
        GError* error = nullptr;
        gchar* name = nullptr;
        int fd = g_file_open_tmp("project-sync-files-XXXXXX.txt", &name, &error);
        if (fd < 0) {
            error_ = (error && error->message) ? error->message : "Cannot create temporary file";
            if (error) g_error_free(error);
            return;
        }
        close(fd);
        path_ = name;
        g_free(name);

        std::ofstream out(path_, std::ios::trunc);
        for (size_t i = 0; i < files.size(); i++) {
            out << files[i];
            if (i + 1 < files.size()) out << "\n";
        }
        out.close();
        if (!out) {
            error_ = "Cannot write file list " + path_;
        }
    }

    ~FileListFile() {
        if (!path_.empty() && g_remove(path_.c_str()) != 0) {
            Logger::debug("[Rsync] Could not remove file list " + path_);
        }
    }

    FileListFile(const FileListFile&) = delete;
    FileListFile& operator=(const FileListFile&) = delete;

    bool ok() const { return error_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
};

std::string with_trailing_slash(const std::string& path) {
    if (!path.empty() && path.back() == '/') return path;
    return path + "/";
}

} // namespace

StepResult SyncResult::step_result() const {
    switch (outcome) {
        case SyncOutcome::Transferred:
        case SyncOutcome::NothingToDo:
            return StepResult::Success;
        case SyncOutcome::Cancelled:
            return StepResult::Cancelled;
        case SyncOutcome::Failed:
            break;
    }
    return StepResult::Failed;
}

UntrackedSync::UntrackedSync(CommandRunner& runner,
                             const UntrackedFileLister& lister,
                             const ConflictDetector& detector,
                             UserPrompter& prompter,
                             std::string rsync_options)
    : runner_(runner),
      lister_(lister),
      detector_(detector),
      prompter_(prompter),
      rsync_options_(std::move(rsync_options)) {}

std::set<std::string> UntrackedSync::exclusions_for(const Resolution& resolution, SyncDirection direction) {
    Choice keep = (direction == SyncDirection::ToRemote) ? Choice::Local : Choice::Remote;
    std::set<std::string> excluded;
    for (const auto& [file, choice] : resolution) {
        if (choice != keep) {
            excluded.insert(file);
        }
    }
    return excluded;
}

std::vector<std::string> UntrackedSync::filter_files(const std::vector<std::string>& files,
                                                     const std::set<std::string>& excluded) {
    std::vector<std::string> result;
    result.reserve(files.size());
    for (const auto& file : files) {
        if (excluded.find(file) == excluded.end()) {
            result.push_back(file);
        }
    }
    return result;
}

std::string UntrackedSync::transfer_command(const Project& project, SyncDirection direction,
                                            const std::string& list_file) const {
    std::string local_root = shell_escape(with_trailing_slash(project.local_path));
    std::string remote_root = shell_escape(with_trailing_slash(project.remote_spec()));

    std::string cmd = "rsync";
    if (!rsync_options_.empty()) {
        cmd += " " + rsync_options_;
    }
    cmd += " --files-from=" + shell_escape(list_file);
    if (direction == SyncDirection::ToRemote) {
        cmd += " " + local_root + " " + remote_root;
    } else {
        cmd += " " + remote_root + " " + local_root;
    }
    return cmd;
}

SyncResult UntrackedSync::sync(const Project& project, SyncDirection direction, bool resolve_conflicts) {
    SyncResult result;
    const bool to_remote = (direction == SyncDirection::ToRemote);

    std::set<std::string> excluded;
    if (resolve_conflicts) {
        prompter_.set_status("Checking for conflicts...", StatusKind::Busy);
        std::vector<Conflict> conflicts = detector_.detect(project, direction);
        if (!conflicts.empty()) {
            ResolutionOutcome outcome = projsync::resolve_conflicts(
                conflicts, [this](const Conflict& conflict, std::size_t index, std::size_t total) {
                    return prompter_.decide_conflict(conflict, index, total);
                });
            if (outcome.cancelled) {
                prompter_.set_status("Sync cancelled", StatusKind::Info);
                result.outcome = SyncOutcome::Cancelled;
                return result;
            }
            excluded = exclusions_for(outcome.resolution, direction);
        }
    }

    prompter_.set_status(to_remote ? "Syncing untracked files to remote..."
                                   : "Syncing untracked files from remote...",
                         StatusKind::Busy);

    std::vector<std::string> files = lister_.list(project, to_remote ? Side::Local : Side::Remote);
    result.files = filter_files(files, excluded);
    if (!excluded.empty()) {
        Logger::info("[Rsync] Excluding " + std::to_string(files.size() - result.files.size()) +
                     " files by conflict resolution");
    }

    if (result.files.empty()) {
        Logger::info("[Rsync] No untracked files to sync");
        prompter_.set_status("No untracked files to sync", StatusKind::Info);
        result.outcome = SyncOutcome::NothingToDo;
        return result;
    }

    FileListFile list_file(result.files);
    if (!list_file.ok()) {
        Logger::error("[Rsync] " + list_file.error());
        prompter_.set_status("Sync failed", StatusKind::Error);
        prompter_.show_error("Sync Failed", list_file.error());
        result.outcome = SyncOutcome::Failed;
        result.output = list_file.error();
        return result;
    }

    Logger::info("[Rsync] Transferring " + std::to_string(result.files.size()) + " files " +
                 (to_remote ? "to " : "from ") + project.remote_spec());
    CommandResult transfer = runner_.run(transfer_command(project, direction, list_file.path()));
    result.output = transfer.output;

    if (!transfer.success) {
        Logger::error("[Rsync] Transfer failed: " + transfer.output);
        prompter_.set_status("Sync failed", StatusKind::Error);
        prompter_.show_error("Sync Failed", "Sync failed:\n" + transfer.output);
        result.outcome = SyncOutcome::Failed;
        return result;
    }

    std::string done = "Synced " + std::to_string(result.files.size()) + " files " +
                       (to_remote ? "to remote" : "from remote");
    Logger::info("[Rsync] " + done);
    prompter_.set_status(done, StatusKind::Success);
    result.outcome = SyncOutcome::Transferred;
    return result;
}

} // namespace projsync
