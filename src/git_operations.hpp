#pragma once

#include "command_runner.hpp"
#include "project.hpp"
#include "sync_types.hpp"
#include "user_prompter.hpp"
#include <string>

namespace projsync {

/**
 * Commit/push and pull of the tracked part of a project.
 * Tracked-file merge conflicts are left to git's own pull behaviour.
 */
class GitOperations {
public:
    GitOperations(CommandRunner& runner, UserPrompter& prompter, std::string remote = "origin");

    /**
     * True when `git status --porcelain` lists anything. The porcelain
     * output is returned through summary for display. A failing status
     * query counts as clean (logged).
     */
    bool is_dirty(const Project& project, std::string* summary) const;

    // Commit pending changes (asking for a message) and push the branch
    StepResult push(const Project& project);

    // Pull the branch, asking first when the working tree is dirty
    StepResult pull(const Project& project);

    const std::string& remote() const { return remote_; }

private:
    CommandRunner& runner_;
    UserPrompter& prompter_;
    std::string remote_;
};

} // namespace projsync
