#include <gtest/gtest.h>
#include <algorithm>
#include <initializer_list>
#include "conflict_detector.hpp"
#include "conflict_resolution.hpp"
#include "mtime_resolver.hpp"
#include "untracked_files.hpp"
#include "test_support.hpp"

using namespace projsync;
using namespace projsync::test;

namespace {

constexpr time_t kBaseTime = 1700000000;

std::vector<Conflict> make_conflicts(std::initializer_list<const char*> files) {
    std::vector<Conflict> conflicts;
    for (const char* file : files) {
        Conflict c;
        c.file = file;
        c.local_time = "2024-01-01 10:00:00";
        c.remote_time = "2024-01-01 11:00:00";
        conflicts.push_back(c);
    }
    return conflicts;
}

std::vector<std::string> conflict_files(std::vector<Conflict> conflicts) {
    std::vector<std::string> files;
    for (const auto& c : conflicts) files.push_back(c.file);
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

// ============================================================================
// File lists and modification times
// ============================================================================

TEST(UntrackedFileLister, ParsesOneFilePerLine) {
    auto files = UntrackedFileLister::parse_file_list("a.txt\r\n\nconfig/.env\nbuild/out.bin\n");
    EXPECT_EQ(files, (std::vector<std::string>{"a.txt", "config/.env", "build/out.bin"}));
}

TEST(UntrackedFileLister, ListsLocallyInProjectRoot) {
    TempDir dir;
    FakeCommandRunner runner;
    runner.on("git ls-files", ".env\nnode_modules/x.js");
    UntrackedFileLister lister(runner);

    auto files = lister.list(make_project(dir.path()), Side::Local);
    EXPECT_EQ(files.size(), 2u);
    ASSERT_EQ(runner.calls().size(), 1u);
    EXPECT_EQ(runner.calls()[0].command, kListIgnoredFilesCommand);
    EXPECT_EQ(runner.calls()[0].cwd, dir.path());
}

TEST(UntrackedFileLister, ListsRemotelyOverSsh) {
    TempDir dir;
    FakeCommandRunner runner;
    runner.on("git ls-files", ".env");
    UntrackedFileLister lister(runner);

    auto files = lister.list(make_project(dir.path(), "webapp", "devbox", "~/webapp"), Side::Remote);
    EXPECT_EQ(files, std::vector<std::string>{".env"});
    ASSERT_EQ(runner.calls().size(), 1u);
    const std::string& cmd = runner.calls()[0].command;
    EXPECT_EQ(cmd.rfind("ssh 'devbox' ", 0), 0u);
    EXPECT_NE(cmd.find("cd ~/"), std::string::npos);
    EXPECT_NE(cmd.find(kListIgnoredFilesCommand), std::string::npos);
}

TEST(UntrackedFileLister, FailedQueryYieldsEmptyList) {
    TempDir dir;
    FakeCommandRunner runner;
    runner.on("git ls-files", "fatal: not a git repository", false);
    UntrackedFileLister lister(runner);
    EXPECT_TRUE(lister.list(make_project(dir.path()), Side::Local).empty());
}

TEST(MtimeResolver, ParsesEpochFromLastLine) {
    EXPECT_EQ(MtimeResolver::parse_epoch("1700000000\n"), std::optional<std::time_t>(1700000000));
    EXPECT_EQ(MtimeResolver::parse_epoch("  File: \"x\"\n    ID: 0 Namelen: 255\n1700000001"),
              std::optional<std::time_t>(1700000001));
    EXPECT_FALSE(MtimeResolver::parse_epoch("").has_value());
    EXPECT_FALSE(MtimeResolver::parse_epoch("stat: cannot stat 'x'").has_value());
    EXPECT_FALSE(MtimeResolver::parse_epoch("17e9").has_value());
}

TEST(MtimeResolver, FormatsToWholeSeconds) {
    std::string text = MtimeResolver::format_time(kBaseTime);
    ASSERT_EQ(text.size(), 19u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[13], ':');
}

TEST(MtimeResolver, RemoteStatTriesBsdThenGnuForm) {
    TempDir dir;
    FakeCommandRunner runner;
    MtimeResolver resolver(runner);
    std::string cmd = resolver.remote_stat_command(make_project(dir.path()), "config/.env");

    size_t bsd = cmd.find("stat -f %m");
    size_t fallback = cmd.find(" || ");
    size_t gnu = cmd.find("stat -c %Y");
    ASSERT_NE(bsd, std::string::npos);
    ASSERT_NE(fallback, std::string::npos);
    ASSERT_NE(gnu, std::string::npos);
    EXPECT_LT(bsd, fallback);
    EXPECT_LT(fallback, gnu);
    EXPECT_NE(cmd.find("/srv/webapp/config/.env"), std::string::npos);
}

TEST(MtimeResolver, ResolvesLocalTimeFromDisk) {
    TempDir dir;
    dir.write("a.txt", "x", kBaseTime);
    FakeCommandRunner runner;
    MtimeResolver resolver(runner);

    auto local = resolver.resolve(make_project(dir.path()), "a.txt", Side::Local);
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(*local, MtimeResolver::format_time(kBaseTime));
    EXPECT_FALSE(resolver.resolve(make_project(dir.path()), "missing.txt", Side::Local).has_value());
    EXPECT_TRUE(runner.calls().empty());
}

// ============================================================================
// Conflict detection
// ============================================================================

namespace {

class ConflictDetectorTest : public ::testing::Test {
protected:
    ConflictDetectorTest() : lister_(runner_), resolver_(runner_), detector_(lister_, resolver_) {}

    // Remote rules must come before the local listing rule: the remote
    // listing command also contains "git ls-files"
    void remote_files(const std::string& listing) { runner_.on("&& git ls-files", listing); }
    void remote_time(const std::string& file, time_t mtime) {
        runner_.on("/srv/webapp/" + file, std::to_string(mtime));
    }
    void remote_time_fails(const std::string& file) {
        runner_.on("/srv/webapp/" + file, "stat: cannot stat", false);
    }
    void local_files(const std::string& listing) { runner_.on("git ls-files", listing); }

    Project project() const { return make_project(dir_.path()); }

    TempDir dir_;
    FakeCommandRunner runner_;
    UntrackedFileLister lister_;
    MtimeResolver resolver_;
    ConflictDetector detector_;
};

} // namespace

TEST_F(ConflictDetectorTest, IdenticalTimestampsAreNotConflicts) {
    dir_.write("a.txt", "local", kBaseTime);
    dir_.write("b.txt", "local", kBaseTime + 60);
    remote_files("a.txt\nb.txt");
    remote_time("a.txt", kBaseTime);
    remote_time("b.txt", kBaseTime + 60);
    local_files("a.txt\nb.txt");

    EXPECT_TRUE(detector_.detect(project(), SyncDirection::ToRemote).empty());
}

TEST_F(ConflictDetectorTest, DifferingTimestampsAreReported) {
    dir_.write("a.txt", "local", kBaseTime);
    dir_.write("b.txt", "local", kBaseTime);
    dir_.write("same.txt", "local", kBaseTime);
    remote_files("same.txt\nb.txt\na.txt");
    remote_time("a.txt", kBaseTime + 3600);
    remote_time("b.txt", kBaseTime - 10);
    remote_time("same.txt", kBaseTime);
    local_files("a.txt\nb.txt\nsame.txt");

    auto conflicts = detector_.detect(project(), SyncDirection::FromRemote);
    EXPECT_EQ(conflict_files(conflicts), (std::vector<std::string>{"a.txt", "b.txt"}));

    for (const auto& c : conflicts) {
        EXPECT_EQ(c.local_time, MtimeResolver::format_time(kBaseTime));
        if (c.file == "a.txt") {
            EXPECT_EQ(c.remote_time, MtimeResolver::format_time(kBaseTime + 3600));
        } else {
            EXPECT_EQ(c.remote_time, MtimeResolver::format_time(kBaseTime - 10));
        }
    }
}

TEST_F(ConflictDetectorTest, FilesOnOneSideOnlyAreNotConflicts) {
    dir_.write("local-only.txt", "x", kBaseTime);
    dir_.write("shared.txt", "x", kBaseTime);
    remote_files("remote-only.txt\nshared.txt");
    remote_time("remote-only.txt", kBaseTime + 5);
    remote_time("shared.txt", kBaseTime + 5);
    local_files("local-only.txt\nshared.txt");

    auto conflicts = detector_.detect(project(), SyncDirection::ToRemote);
    EXPECT_EQ(conflict_files(conflicts), std::vector<std::string>{"shared.txt"});
}

TEST_F(ConflictDetectorTest, UnresolvableRemoteTimeIsDropped) {
    dir_.write("a.txt", "x", kBaseTime);
    dir_.write("b.txt", "x", kBaseTime);
    remote_files("a.txt\nb.txt");
    remote_time_fails("a.txt");
    remote_time("b.txt", kBaseTime + 1);
    local_files("a.txt\nb.txt");

    auto conflicts = detector_.detect(project(), SyncDirection::ToRemote);
    EXPECT_EQ(conflict_files(conflicts), std::vector<std::string>{"b.txt"});
}

TEST_F(ConflictDetectorTest, UnresolvableLocalTimeIsDroppedWithoutRemoteQuery) {
    // ghost.txt is reported by git but has vanished from disk
    dir_.write("b.txt", "x", kBaseTime);
    remote_files("ghost.txt\nb.txt");
    remote_time("ghost.txt", kBaseTime + 1);
    remote_time("b.txt", kBaseTime + 1);
    local_files("ghost.txt\nb.txt");

    auto conflicts = detector_.detect(project(), SyncDirection::ToRemote);
    EXPECT_EQ(conflict_files(conflicts), std::vector<std::string>{"b.txt"});
    EXPECT_EQ(runner_.count("/srv/webapp/ghost.txt"), 0);
}

TEST_F(ConflictDetectorTest, FailedListingMeansNoConflicts) {
    dir_.write("a.txt", "x", kBaseTime);
    runner_.on("&& git ls-files", "ssh: Could not resolve hostname devbox", false);
    local_files("a.txt");

    EXPECT_TRUE(detector_.detect(project(), SyncDirection::ToRemote).empty());
}

// ============================================================================
// Resolution flow
// ============================================================================

TEST(ConflictResolutionFlow, EmptyListStartsResolved) {
    ConflictResolutionFlow flow({});
    EXPECT_EQ(flow.state(), ConflictResolutionFlow::State::Resolved);
    EXPECT_TRUE(flow.resolution().empty());
    EXPECT_FALSE(flow.decide(Choice::Local));
}

TEST(ConflictResolutionFlow, IndividualDecisionsAdvance) {
    ConflictResolutionFlow flow(make_conflicts({"a", "b", "c"}));
    EXPECT_EQ(flow.current().file, "a");
    EXPECT_TRUE(flow.decide(Choice::Local));
    EXPECT_EQ(flow.index(), 1u);
    EXPECT_TRUE(flow.decide(Choice::Remote));
    EXPECT_EQ(flow.state(), ConflictResolutionFlow::State::Presenting);
    EXPECT_TRUE(flow.decide(Choice::Skip));
    EXPECT_EQ(flow.state(), ConflictResolutionFlow::State::Resolved);

    Resolution expected{{"a", Choice::Local}, {"b", Choice::Remote}, {"c", Choice::Skip}};
    EXPECT_EQ(flow.resolution(), expected);
}

TEST(ConflictResolutionFlow, ApplyToRemainingFillsTheRest) {
    const std::vector<Choice> choices = {Choice::Local, Choice::Remote, Choice::Skip};
    const size_t n = 5;

    for (size_t k = 0; k < n; k++) {
        for (Choice chosen : choices) {
            ConflictResolutionFlow flow(make_conflicts({"f0", "f1", "f2", "f3", "f4"}));
            std::vector<Choice> individual;
            for (size_t i = 0; i < k; i++) {
                Choice c = choices[(i + 1) % choices.size()];
                individual.push_back(c);
                ASSERT_TRUE(flow.decide(c));
            }
            ASSERT_TRUE(flow.decide(chosen, true));
            EXPECT_EQ(flow.state(), ConflictResolutionFlow::State::Resolved);

            const Resolution& r = flow.resolution();
            ASSERT_EQ(r.size(), n) << "k=" << k;
            for (size_t i = 0; i < n; i++) {
                std::string file = "f" + std::to_string(i);
                Choice expected = (i < k) ? individual[i] : chosen;
                EXPECT_EQ(r.at(file), expected) << "k=" << k << " file=" << file;
            }
        }
    }
}

TEST(ConflictResolutionFlow, CancelDiscardsDecisions) {
    ConflictResolutionFlow flow(make_conflicts({"a", "b"}));
    ASSERT_TRUE(flow.decide(Choice::Local));
    EXPECT_TRUE(flow.cancel());
    EXPECT_EQ(flow.state(), ConflictResolutionFlow::State::Cancelled);
    EXPECT_TRUE(flow.resolution().empty());
    EXPECT_FALSE(flow.decide(Choice::Remote));
    EXPECT_FALSE(flow.cancel());
}

TEST(ResolveConflicts, CallbackSeesIndexAndTotal) {
    auto conflicts = make_conflicts({"a", "b", "c"});
    std::vector<std::pair<size_t, size_t>> seen;
    auto outcome = resolve_conflicts(conflicts, [&seen](const Conflict&, size_t index, size_t total) {
        seen.emplace_back(index, total);
        return std::optional<Decision>(ScriptedPrompter::choose(Choice::Remote));
    });

    EXPECT_FALSE(outcome.cancelled);
    EXPECT_EQ(outcome.resolution.size(), 3u);
    EXPECT_EQ(seen, (std::vector<std::pair<size_t, size_t>>{{0, 3}, {1, 3}, {2, 3}}));
}

TEST(ResolveConflicts, ApplyToRemainingStopsAsking) {
    auto conflicts = make_conflicts({"a", "b", "c", "d"});
    int calls = 0;
    auto outcome = resolve_conflicts(conflicts, [&calls](const Conflict&, size_t index, size_t) {
        calls++;
        return std::optional<Decision>(
            ScriptedPrompter::choose(index == 0 ? Choice::Skip : Choice::Local, index == 1));
    });

    EXPECT_EQ(calls, 2);
    ASSERT_FALSE(outcome.cancelled);
    EXPECT_EQ(outcome.resolution.at("a"), Choice::Skip);
    EXPECT_EQ(outcome.resolution.at("b"), Choice::Local);
    EXPECT_EQ(outcome.resolution.at("c"), Choice::Local);
    EXPECT_EQ(outcome.resolution.at("d"), Choice::Local);
}

TEST(ResolveConflicts, CancelAtAnyPointYieldsNoResolution) {
    auto conflicts = make_conflicts({"a", "b", "c"});
    for (size_t cancel_at = 0; cancel_at < conflicts.size(); cancel_at++) {
        auto outcome = resolve_conflicts(conflicts, [cancel_at](const Conflict&, size_t index, size_t) {
            if (index == cancel_at) return std::optional<Decision>();
            return std::optional<Decision>(ScriptedPrompter::choose(Choice::Local));
        });
        EXPECT_TRUE(outcome.cancelled) << "cancel_at=" << cancel_at;
        EXPECT_TRUE(outcome.resolution.empty());
    }
}

TEST(ResolveConflicts, EmptyCallbackCancels) {
    auto outcome = resolve_conflicts(make_conflicts({"a"}), DecisionCallback());
    EXPECT_TRUE(outcome.cancelled);
}
