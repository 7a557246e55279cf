#pragma once

#include <string>

namespace projsync {

// Every external tool invocation is bounded by this unless configured otherwise
constexpr int kDefaultCommandTimeoutSeconds = 120;

// Exit status reported by coreutils `timeout` when the limit is hit
constexpr int kTimeoutExitCode = 124;

struct CommandResult {
    bool success = false;
    int exit_code = -1;
    bool timed_out = false;
    std::string output;  // stdout and stderr combined, surrounding whitespace trimmed
};

/**
 * Boundary to every external tool (git, ssh, rsync).
 * The shell implementation is used by the application; tests substitute
 * a scripted runner to observe and answer commands.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * Run a shell command line, optionally inside a working directory.
     * Blocks until the command exits or the timeout elapses.
     */
    virtual CommandResult run(const std::string& command, const std::string& cwd = "") = 0;
};

class ShellCommandRunner : public CommandRunner {
public:
    explicit ShellCommandRunner(int timeout_seconds = kDefaultCommandTimeoutSeconds);

    CommandResult run(const std::string& command, const std::string& cwd = "") override;

    int timeout_seconds() const { return timeout_seconds_; }

private:
    int timeout_seconds_;
};

/**
 * Escape a string for safe use in shell commands.
 * Uses single-quoting and escapes embedded single quotes.
 */
std::string shell_escape(const std::string& arg);

/**
 * Strip leading and trailing whitespace (spaces, tabs, CR, LF)
 */
std::string trim(const std::string& text);

/**
 * Ensure valid working directory for shell commands
 */
void ensure_valid_cwd_for_shell();

} // namespace projsync
