#include "full_sync.hpp"
#include "logger.hpp"

namespace projsync {

FullSyncOrchestrator::FullSyncOrchestrator(UntrackedSync& untracked, GitOperations& git, UserPrompter& prompter)
    : untracked_(untracked), git_(git), prompter_(prompter) {}

std::vector<FullSyncOrchestrator::Step> FullSyncOrchestrator::steps_for(const Project& project) {
    return {
        {"Syncing untracked to remote", [this, project]() {
             return untracked_.sync(project, SyncDirection::ToRemote).step_result();
         }},
        {"Pushing to git", [this, project]() { return git_.push(project); }},
        {"Pulling from git", [this, project]() { return git_.pull(project); }},
        {"Syncing untracked from remote", [this, project]() {
             return untracked_.sync(project, SyncDirection::FromRemote).step_result();
         }},
    };
}

FullSyncReport FullSyncOrchestrator::run_steps(const std::vector<Step>& steps, UserPrompter* prompter) {
    FullSyncReport report;
    report.steps_total = steps.size();

    for (const auto& step : steps) {
        Logger::info("[FullSync] " + step.name + "...");
        if (prompter) prompter->set_status(step.name + "...", StatusKind::Busy);

        StepResult result = step.run ? step.run() : StepResult::Failed;
        if (result != StepResult::Success) {
            report.result = result;
            report.stopped_at = step.name;
            Logger::warn("[FullSync] Stopped at: " + step.name + " (" + to_string(result) + ")");
            if (prompter) prompter->set_status("Full sync stopped at: " + step.name, StatusKind::Warning);
            return report;
        }
        report.steps_completed++;
    }

    Logger::info("[FullSync] Full sync complete");
    if (prompter) prompter->set_status("Full sync complete!", StatusKind::Success);
    return report;
}

FullSyncReport FullSyncOrchestrator::run(const Project& project) {
    Logger::info("[FullSync] Starting full sync of " + project.name);
    FullSyncReport report = run_steps(steps_for(project), &prompter_);
    if (report.ok()) {
        prompter_.show_info("Success", "Full sync completed successfully!");
    }
    return report;
}

} // namespace projsync
