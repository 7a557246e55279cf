#pragma once

#include "git_operations.hpp"
#include "project.hpp"
#include "sync_operations.hpp"
#include "sync_types.hpp"
#include "user_prompter.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace projsync {

struct FullSyncReport {
    StepResult result = StepResult::Success;
    std::size_t steps_completed = 0;
    std::size_t steps_total = 0;
    std::string stopped_at;  // name of the step that failed or was cancelled

    bool ok() const { return result == StepResult::Success; }
};

/**
 * Full sync: untracked files up, git push, git pull, untracked files down.
 *
 * Steps run strictly in order and the first step that does not succeed
 * stops the pipeline. Completed steps are not rolled back.
 */
class FullSyncOrchestrator {
public:
    struct Step {
        std::string name;
        std::function<StepResult()> run;
    };

    FullSyncOrchestrator(UntrackedSync& untracked, GitOperations& git, UserPrompter& prompter);

    FullSyncReport run(const Project& project);

    std::vector<Step> steps_for(const Project& project);

    static FullSyncReport run_steps(const std::vector<Step>& steps, UserPrompter* prompter);

private:
    UntrackedSync& untracked_;
    GitOperations& git_;
    UserPrompter& prompter_;
};

} // namespace projsync
