#pragma once

#include "command_runner.hpp"
#include "conflict_detector.hpp"
#include "project.hpp"
#include "sync_types.hpp"
#include "untracked_files.hpp"
#include "user_prompter.hpp"
#include <set>
#include <string>
#include <vector>

namespace projsync {

enum class SyncOutcome {
    Transferred,
    NothingToDo,
    Cancelled,
    Failed
};

struct SyncResult {
    SyncOutcome outcome = SyncOutcome::Failed;
    std::vector<std::string> files;  // the exact list handed to rsync
    std::string output;              // raw rsync output, or the failure message

    bool ok() const { return outcome == SyncOutcome::Transferred || outcome == SyncOutcome::NothingToDo; }
    StepResult step_result() const;
};

/**
 * Mirrors gitignored files between the two machines with rsync.
 *
 * Only the files reported by the gitignored-file query are transferred,
 * through an explicit --files-from list, so nothing else in the tree is
 * touched. Conflicting files are resolved with the user first.
 */
class UntrackedSync {
public:
    UntrackedSync(CommandRunner& runner,
                  const UntrackedFileLister& lister,
                  const ConflictDetector& detector,
                  UserPrompter& prompter,
                  std::string rsync_options = "-avz");

    SyncResult sync(const Project& project, SyncDirection direction, bool resolve_conflicts = true);

    /**
     * Files that must not be transferred: for ToRemote everything not
     * resolved as Local, for FromRemote everything not resolved as Remote.
     */
    static std::set<std::string> exclusions_for(const Resolution& resolution, SyncDirection direction);

    static std::vector<std::string> filter_files(const std::vector<std::string>& files,
                                                 const std::set<std::string>& excluded);

    std::string transfer_command(const Project& project, SyncDirection direction,
                                 const std::string& list_file) const;

private:
    CommandRunner& runner_;
    const UntrackedFileLister& lister_;
    const ConflictDetector& detector_;
    UserPrompter& prompter_;
    std::string rsync_options_;
};

} // namespace projsync
