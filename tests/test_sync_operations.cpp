#include <gtest/gtest.h>
#include <algorithm>
#include "full_sync.hpp"
#include "git_operations.hpp"
#include "sync_operations.hpp"
#include "sync_session.hpp"
#include "test_support.hpp"

using namespace projsync;
using namespace projsync::test;

namespace {

constexpr time_t kBaseTime = 1700000000;

// Pull the --files-from path out of an rsync command line
std::string files_from_path(const std::string& command) {
    const std::string marker = "--files-from='";
    size_t start = command.find(marker);
    if (start == std::string::npos) return "";
    start += marker.size();
    size_t end = command.find('\'', start);
    return command.substr(start, end - start);
}

/**
 * Shared fixture: a local project directory, a scripted runner and
 * prompter, and a SyncSession wired to them. rsync calls are answered
 * by a handler that captures the transferred file list.
 */
class SyncFixture : public ::testing::Test {
protected:
    SyncFixture() : session_(runner_, prompter_) {}

    Project project() const { return make_project(dir_.path()); }

    // Registered first so the listing rules below never see rsync commands
    void capture_rsync(bool success = true, const std::string& output = "sent 1 file") {
        runner_.on_call("rsync ", [this, success, output](const std::string& command, const std::string&) {
            std::vector<std::string> files = read_lines(files_from_path(command));
            std::sort(files.begin(), files.end());
            transfers_.push_back(files);
            CommandResult result;
            result.success = success;
            result.exit_code = success ? 0 : 23;
            result.output = output;
            return result;
        });
    }

    void remote_files(const std::string& listing) { runner_.on("&& git ls-files", listing); }
    void remote_time(const std::string& file, time_t mtime) {
        runner_.on("/srv/webapp/" + file, std::to_string(mtime));
    }
    void local_files(const std::string& listing) { runner_.on("git ls-files", listing); }

    TempDir dir_;
    FakeCommandRunner runner_;
    ScriptedPrompter prompter_;
    SyncSession session_;
    std::vector<std::vector<std::string>> transfers_;
};

bool contains(const std::vector<std::string>& items, const std::string& needle) {
    return std::any_of(items.begin(), items.end(), [&needle](const std::string& item) {
        return item.find(needle) != std::string::npos;
    });
}

} // namespace

// ============================================================================
// Untracked file sync
// ============================================================================

TEST(UntrackedSyncStatic, ExclusionsKeepOnlyTheWinningSide) {
    Resolution resolution{{"a", Choice::Local}, {"b", Choice::Remote}, {"c", Choice::Skip}};

    EXPECT_EQ(UntrackedSync::exclusions_for(resolution, SyncDirection::ToRemote),
              (std::set<std::string>{"b", "c"}));
    EXPECT_EQ(UntrackedSync::exclusions_for(resolution, SyncDirection::FromRemote),
              (std::set<std::string>{"a", "c"}));
}

TEST(UntrackedSyncStatic, FilterKeepsOrderOfRemainingFiles) {
    auto files = UntrackedSync::filter_files({"z", "a", "m", "b"}, {"a", "b"});
    EXPECT_EQ(files, (std::vector<std::string>{"z", "m"}));
}

TEST_F(SyncFixture, TransferCommandSwapsRootsByDirection) {
    Project p = project();
    p.local_path = "/home/dev/webapp";
    UntrackedSync& sync = session_.untracked();

    EXPECT_EQ(sync.transfer_command(p, SyncDirection::ToRemote, "/tmp/list.txt"),
              "rsync -avz --files-from='/tmp/list.txt' '/home/dev/webapp/' 'devbox:/srv/webapp/'");
    EXPECT_EQ(sync.transfer_command(p, SyncDirection::FromRemote, "/tmp/list.txt"),
              "rsync -avz --files-from='/tmp/list.txt' 'devbox:/srv/webapp/' '/home/dev/webapp/'");
}

TEST_F(SyncFixture, ResolutionExcludesRemoteAndSkippedFilesWhenSyncingUp) {
    dir_.write("A", "a", kBaseTime);
    dir_.write("B", "b", kBaseTime);
    dir_.write("C", "c", kBaseTime);
    capture_rsync();
    remote_files("A\nB");
    remote_time("A", kBaseTime + 100);
    remote_time("B", kBaseTime + 200);
    local_files("A\nB\nC");

    prompter_.file_decisions["A"] = ScriptedPrompter::choose(Choice::Remote);
    prompter_.file_decisions["B"] = ScriptedPrompter::choose(Choice::Skip);

    SyncResult result = session_.sync_to_remote(project());

    EXPECT_EQ(result.outcome, SyncOutcome::Transferred);
    EXPECT_EQ(prompter_.conflicts_shown, 2);
    EXPECT_EQ(result.files, std::vector<std::string>{"C"});
    ASSERT_EQ(transfers_.size(), 1u);
    EXPECT_EQ(transfers_[0], std::vector<std::string>{"C"});
    EXPECT_TRUE(prompter_.errors.empty());
}

TEST_F(SyncFixture, FromRemoteTransfersRemoteChoicesAndNonConflicting) {
    dir_.write("A", "a", kBaseTime);
    dir_.write("B", "b", kBaseTime);
    capture_rsync();
    remote_files("A\nB\nD");
    remote_time("A", kBaseTime + 100);
    remote_time("B", kBaseTime + 200);
    local_files("A\nB");

    prompter_.file_decisions["A"] = ScriptedPrompter::choose(Choice::Remote);
    prompter_.file_decisions["B"] = ScriptedPrompter::choose(Choice::Local);

    SyncResult result = session_.sync_from_remote(project());

    EXPECT_EQ(result.outcome, SyncOutcome::Transferred);
    ASSERT_EQ(transfers_.size(), 1u);
    EXPECT_EQ(transfers_[0], (std::vector<std::string>{"A", "D"}));

    auto rsync = runner_.find("rsync ");
    ASSERT_TRUE(rsync.has_value());
    EXPECT_LT(rsync->command.find("'devbox:/srv/webapp/'"), rsync->command.find("'" + dir_.path() + "/'"));
}

TEST_F(SyncFixture, CancelledResolutionTransfersNothing) {
    dir_.write("A", "a", kBaseTime);
    capture_rsync();
    remote_files("A");
    remote_time("A", kBaseTime + 100);
    local_files("A\nB");
    // No scripted decisions: the prompter answers Cancel All

    SyncResult result = session_.sync_to_remote(project());

    EXPECT_EQ(result.outcome, SyncOutcome::Cancelled);
    EXPECT_EQ(result.step_result(), StepResult::Cancelled);
    EXPECT_EQ(runner_.count("rsync "), 0);
    EXPECT_TRUE(prompter_.errors.empty());
    EXPECT_TRUE(contains(prompter_.statuses, "Sync cancelled"));
}

TEST_F(SyncFixture, EmptyListIsNothingToDo) {
    capture_rsync();
    remote_files("");
    local_files("");

    SyncResult result = session_.sync_to_remote(project());

    EXPECT_EQ(result.outcome, SyncOutcome::NothingToDo);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runner_.count("rsync "), 0);
    EXPECT_TRUE(contains(prompter_.statuses, "No untracked files to sync"));
}

TEST_F(SyncFixture, EverythingExcludedIsNothingToDo) {
    dir_.write("A", "a", kBaseTime);
    capture_rsync();
    remote_files("A");
    remote_time("A", kBaseTime + 100);
    local_files("A");
    prompter_.file_decisions["A"] = ScriptedPrompter::choose(Choice::Skip);

    SyncResult result = session_.sync_to_remote(project());

    EXPECT_EQ(result.outcome, SyncOutcome::NothingToDo);
    EXPECT_EQ(runner_.count("rsync "), 0);
}

TEST_F(SyncFixture, RsyncFailureIsReportedVerbatim) {
    capture_rsync(false, "rsync: connection unexpectedly closed");
    remote_files("");
    local_files("big.bin");

    SyncResult result = session_.sync_to_remote(project());

    EXPECT_EQ(result.outcome, SyncOutcome::Failed);
    EXPECT_EQ(result.step_result(), StepResult::Failed);
    EXPECT_EQ(result.output, "rsync: connection unexpectedly closed");
    ASSERT_EQ(prompter_.errors.size(), 1u);
    EXPECT_EQ(prompter_.errors[0], "Sync Failed: Sync failed:\nrsync: connection unexpectedly closed");
}

TEST_F(SyncFixture, ConflictCheckCanBeSkipped) {
    dir_.write("A", "a", kBaseTime);
    capture_rsync();
    remote_files("A");
    remote_time("A", kBaseTime + 100);
    local_files("A");

    SyncResult result = session_.untracked().sync(project(), SyncDirection::ToRemote, false);

    EXPECT_EQ(result.outcome, SyncOutcome::Transferred);
    EXPECT_EQ(prompter_.conflicts_shown, 0);
    EXPECT_EQ(runner_.count("stat -f %m"), 0);
}

TEST_F(SyncFixture, FileListIsRemovedAfterTransfer) {
    std::string list_path;
    runner_.on_call("rsync ", [&list_path](const std::string& command, const std::string&) {
        list_path = files_from_path(command);
        CommandResult result;
        result.success = true;
        result.exit_code = 0;
        return result;
    });
    remote_files("");
    local_files("a.env");

    session_.sync_to_remote(project());

    ASSERT_FALSE(list_path.empty());
    EXPECT_FALSE(std::filesystem::exists(list_path));
}

// ============================================================================
// Git operations
// ============================================================================

TEST_F(SyncFixture, PushOnCleanTreeSkipsCommit) {
    runner_.on("git status --porcelain", "");

    EXPECT_EQ(session_.push(project()), StepResult::Success);
    EXPECT_EQ(prompter_.commit_prompts, 0);
    EXPECT_EQ(runner_.count("git commit"), 0);

    auto push = runner_.find("git push");
    ASSERT_TRUE(push.has_value());
    EXPECT_EQ(push->command, "git push 'origin' 'main'");
    EXPECT_EQ(push->cwd, dir_.path());
}

TEST_F(SyncFixture, PushOnDirtyTreeCommitsWithMessage) {
    runner_.on("git status --porcelain", " M src/app.cpp\n?? notes.md");
    prompter_.commit_message = "Fix login";

    EXPECT_EQ(session_.push(project()), StepResult::Success);
    EXPECT_EQ(prompter_.commit_prompts, 1);

    auto commit = runner_.find("git commit");
    ASSERT_TRUE(commit.has_value());
    EXPECT_EQ(commit->command, "git add -A && git commit -m 'Fix login'");
    EXPECT_EQ(runner_.count("git push"), 1);
}

TEST_F(SyncFixture, CancelledCommitMessageCancelsPush) {
    runner_.on("git status --porcelain", " M src/app.cpp");
    prompter_.commit_message = std::nullopt;

    EXPECT_EQ(session_.push(project()), StepResult::Cancelled);
    EXPECT_EQ(runner_.count("git commit"), 0);
    EXPECT_EQ(runner_.count("git push"), 0);
    EXPECT_TRUE(prompter_.errors.empty());
}

TEST_F(SyncFixture, CommitFailureAbortsPush) {
    runner_.on("git status --porcelain", " M src/app.cpp");
    runner_.on("git commit", "Author identity unknown", false);
    prompter_.commit_message = "wip";

    EXPECT_EQ(session_.push(project()), StepResult::Failed);
    EXPECT_EQ(runner_.count("git push"), 0);
    ASSERT_EQ(prompter_.errors.size(), 1u);
    EXPECT_NE(prompter_.errors[0].find("Author identity unknown"), std::string::npos);
}

TEST_F(SyncFixture, PushFailureSurfacesOutput) {
    runner_.on("git push", "! [rejected] main -> main (fetch first)", false);

    EXPECT_EQ(session_.push(project()), StepResult::Failed);
    ASSERT_EQ(prompter_.errors.size(), 1u);
    EXPECT_EQ(prompter_.errors[0], "Push Failed: Push failed:\n! [rejected] main -> main (fetch first)");
}

TEST_F(SyncFixture, PullOnDirtyTreeAsksFirst) {
    runner_.on("git status --porcelain", " M README.md");
    prompter_.confirm_answer = false;

    EXPECT_EQ(session_.pull(project()), StepResult::Cancelled);
    EXPECT_EQ(prompter_.confirmations, 1);
    EXPECT_EQ(runner_.count("git pull"), 0);
}

TEST_F(SyncFixture, PullOnDirtyTreeProceedsWhenConfirmed) {
    runner_.on("git status --porcelain", " M README.md");
    prompter_.confirm_answer = true;

    EXPECT_EQ(session_.pull(project()), StepResult::Success);
    auto pull = runner_.find("git pull");
    ASSERT_TRUE(pull.has_value());
    EXPECT_EQ(pull->command, "git pull 'origin' 'main'");
}

TEST_F(SyncFixture, PullFailureSurfacesOutput) {
    runner_.on("git pull", "CONFLICT (content): Merge conflict in app.cpp", false);

    EXPECT_EQ(session_.pull(project()), StepResult::Failed);
    ASSERT_EQ(prompter_.errors.size(), 1u);
    EXPECT_NE(prompter_.errors[0].find("Merge conflict in app.cpp"), std::string::npos);
}

TEST_F(SyncFixture, FailingStatusQueryCountsAsClean) {
    runner_.on("git status --porcelain", "fatal: not a git repository", false);

    std::string summary;
    EXPECT_FALSE(session_.git().is_dirty(project(), &summary));
    EXPECT_EQ(session_.pull(project()), StepResult::Success);
    EXPECT_EQ(prompter_.confirmations, 0);
}

TEST(GitOperations, UsesConfiguredRemote) {
    TempDir dir;
    FakeCommandRunner runner;
    ScriptedPrompter prompter;
    GitOperations git(runner, prompter, "upstream");

    EXPECT_EQ(git.push(make_project(dir.path(), "webapp", "devbox", "/srv/webapp", "release")),
              StepResult::Success);
    EXPECT_EQ(runner.count("git push 'upstream' 'release'"), 1);
}

// ============================================================================
// Full sync
// ============================================================================

TEST_F(SyncFixture, FullSyncRunsAllFourStepsInOrder) {
    capture_rsync();
    remote_files("remote.env");
    local_files("local.env");

    FullSyncReport report = session_.full_sync(project());

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.steps_completed, 4u);
    EXPECT_EQ(report.steps_total, 4u);
    EXPECT_TRUE(report.stopped_at.empty());
    ASSERT_EQ(transfers_.size(), 2u);
    EXPECT_EQ(transfers_[0], std::vector<std::string>{"local.env"});
    EXPECT_EQ(transfers_[1], std::vector<std::string>{"remote.env"});

    // rsync up, push, pull, rsync down
    std::vector<std::string> order;
    for (const auto& call : runner_.calls()) {
        if (call.command.rfind("rsync ", 0) == 0) order.push_back("rsync");
        else if (call.command.rfind("git push", 0) == 0) order.push_back("push");
        else if (call.command.rfind("git pull", 0) == 0) order.push_back("pull");
    }
    EXPECT_EQ(order, (std::vector<std::string>{"rsync", "push", "pull", "rsync"}));

    EXPECT_TRUE(contains(prompter_.infos, "Full sync completed successfully!"));
    EXPECT_EQ(prompter_.statuses.back(), "Full sync complete!");
}

TEST_F(SyncFixture, FullSyncStopsWhenPushFails) {
    capture_rsync();
    runner_.on("git push", "fatal: could not read from remote repository", false);
    remote_files("");
    local_files("local.env");

    FullSyncReport report = session_.full_sync(project());

    EXPECT_EQ(report.result, StepResult::Failed);
    EXPECT_EQ(report.steps_completed, 1u);
    EXPECT_EQ(report.steps_total, 4u);
    EXPECT_EQ(report.stopped_at, "Pushing to git");

    EXPECT_EQ(runner_.count("rsync "), 1);
    EXPECT_EQ(runner_.count("git push"), 1);
    EXPECT_EQ(runner_.count("git pull"), 0);
    EXPECT_EQ(transfers_.size(), 1u);

    EXPECT_TRUE(prompter_.infos.empty());
    EXPECT_EQ(prompter_.statuses.back(), "Full sync stopped at: Pushing to git");
}

TEST_F(SyncFixture, FullSyncStopsWhenFirstSyncIsCancelled) {
    dir_.write("A", "a", kBaseTime);
    capture_rsync();
    remote_files("A");
    remote_time("A", kBaseTime + 100);
    local_files("A");

    FullSyncReport report = session_.full_sync(project());

    EXPECT_EQ(report.result, StepResult::Cancelled);
    EXPECT_EQ(report.steps_completed, 0u);
    EXPECT_EQ(report.stopped_at, "Syncing untracked to remote");
    EXPECT_EQ(runner_.count("rsync "), 0);
    EXPECT_EQ(runner_.count("git "), 2);  // the two gitignored-file listings only
    EXPECT_EQ(runner_.count("git push"), 0);
}

TEST_F(SyncFixture, FullSyncStopsWhenPullIsDeclined) {
    capture_rsync();
    runner_.on("git status --porcelain", " M README.md");
    prompter_.commit_message = "sync";
    prompter_.confirm_answer = false;
    remote_files("");
    local_files("local.env");

    FullSyncReport report = session_.full_sync(project());

    EXPECT_EQ(report.result, StepResult::Cancelled);
    EXPECT_EQ(report.steps_completed, 2u);
    EXPECT_EQ(report.stopped_at, "Pulling from git");
    EXPECT_EQ(runner_.count("git pull"), 0);
    EXPECT_EQ(runner_.count("rsync "), 1);
}

TEST(FullSyncSteps, StopsAtFirstNonSuccess) {
    std::vector<std::string> ran;
    auto step = [&ran](const std::string& name, StepResult result) {
        return FullSyncOrchestrator::Step{name, [&ran, name, result]() {
            ran.push_back(name);
            return result;
        }};
    };

    ScriptedPrompter prompter;
    FullSyncReport report = FullSyncOrchestrator::run_steps(
        {step("one", StepResult::Success), step("two", StepResult::Failed), step("three", StepResult::Success)},
        &prompter);

    EXPECT_EQ(ran, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(report.result, StepResult::Failed);
    EXPECT_EQ(report.steps_completed, 1u);
    EXPECT_EQ(report.stopped_at, "two");
}

TEST(FullSyncSteps, StepNamesMatchPipeline) {
    TempDir dir;
    FakeCommandRunner runner;
    ScriptedPrompter prompter;
    SyncSession session(runner, prompter);
    FullSyncOrchestrator orchestrator(session.untracked(), session.git(), prompter);

    auto steps = orchestrator.steps_for(make_project(dir.path()));
    ASSERT_EQ(steps.size(), 4u);
    EXPECT_EQ(steps[0].name, "Syncing untracked to remote");
    EXPECT_EQ(steps[1].name, "Pushing to git");
    EXPECT_EQ(steps[2].name, "Pulling from git");
    EXPECT_EQ(steps[3].name, "Syncing untracked from remote");
    EXPECT_TRUE(runner.calls().empty());
}

TEST(SyncSession, AppliesToolOptions) {
    TempDir dir;
    FakeCommandRunner runner;
    ScriptedPrompter prompter;
    ToolOptions options;
    options.rsync_options = "-az --partial";
    options.git_remote = "backup";
    options.ssh_connect_timeout_seconds = 3;
    SyncSession session(runner, prompter, options);

    runner.on("git ls-files", "x.env");
    Project p = make_project(dir.path());

    session.untracked().sync(p, SyncDirection::ToRemote, false);
    session.push(p);
    std::string output;
    session.test_connection(p, &output);

    EXPECT_EQ(runner.count("rsync -az --partial --files-from="), 1);
    EXPECT_EQ(runner.count("git push 'backup' 'main'"), 1);
    EXPECT_EQ(runner.count("ConnectTimeout=3"), 1);
}

TEST_F(SyncFixture, SessionIsBusyOnlyWhileAnOperationRuns) {
    std::vector<bool> busy_during;
    runner_.on_call("git push", [this, &busy_during](const std::string&, const std::string&) {
        busy_during.push_back(session_.busy());
        CommandResult result;
        result.output = "rejected";
        return result;
    });
    runner_.on_call("ssh -o", [this, &busy_during](const std::string&, const std::string&) {
        busy_during.push_back(session_.busy());
        CommandResult result;
        result.success = true;
        result.exit_code = 0;
        result.output = "connected";
        return result;
    });

    EXPECT_FALSE(session_.busy());
    EXPECT_EQ(session_.push(project()), StepResult::Failed);
    EXPECT_FALSE(session_.busy());
    EXPECT_TRUE(session_.test_connection(project(), nullptr));
    EXPECT_FALSE(session_.busy());

    EXPECT_EQ(busy_during, (std::vector<bool>{true, true}));
}
