#include "command_runner.hpp"
#include "logger.hpp"
#include <array>
#include <chrono>
#include <memory>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include <limits.h>
#include <sys/wait.h>

namespace projsync {

std::string shell_escape(const std::string& arg) {
    // Example: "it's here" -> 'it'"'"'s here'
    std::string result = "'";
    for (char c : arg) {
        if (c == '\'') {
            result += "'\"'\"'";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

void ensure_valid_cwd_for_shell() {
    char cwd[PATH_MAX];
    if (getcwd(cwd, sizeof(cwd)) == nullptr) {
        const char* home = std::getenv("HOME");
        if (home && chdir(home) == 0) {
            // Successfully switched to home
        } else if (chdir("/tmp") != 0) {
            Logger::warn("[Command] Failed to set valid working directory");
        }
    }
}

ShellCommandRunner::ShellCommandRunner(int timeout_seconds)
    : timeout_seconds_(timeout_seconds > 0 ? timeout_seconds : kDefaultCommandTimeoutSeconds) {}

CommandResult ShellCommandRunner::run(const std::string& command, const std::string& cwd) {
    CommandResult result;

    // The working directory change happens in the subshell so the process cwd is untouched.
    // `timeout -k` makes sure a command ignoring SIGTERM is still reaped.
    std::string cmd = "(";
    if (!cwd.empty()) {
        cmd += "cd " + shell_escape(cwd) + " && ";
    }
    cmd += "timeout -k 5 " + std::to_string(timeout_seconds_) + " sh -c " + shell_escape(command);
    cmd += ") 2>&1";

    Logger::debug("[Command] Executing" + (cwd.empty() ? std::string() : " in " + cwd) + ": " + command);

    ensure_valid_cwd_for_shell();

    std::array<char, 256> buffer;
    std::string output;
    auto started = std::chrono::steady_clock::now();
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) {
        Logger::warn("[Command] popen failed for command: " + command);
        result.output = "Failed to start command";
        return result;
    }
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        output += buffer.data();
    }
    int status = pclose(pipe.release());
    auto elapsed = std::chrono::steady_clock::now() - started;

    if (status == -1) {
        Logger::warn("[Command] pclose failed for command: " + command);
        result.output = trim(output);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    // `timeout` exits 124, or 137 after the -k follow-up SIGKILL. A command can
    // exit with those codes itself, so the limit must also have been reached.
    bool timeout_code = result.exit_code == kTimeoutExitCode || result.exit_code == 128 + 9;
    if (timeout_code && elapsed >= std::chrono::seconds(timeout_seconds_)) {
        result.timed_out = true;
        result.success = false;
        result.output = "Command timed out";
        Logger::warn("[Command] Timed out after " + std::to_string(timeout_seconds_) + "s: " + command);
        return result;
    }

    result.success = (result.exit_code == 0);
    result.output = trim(output);
    if (!result.success) {
        Logger::debug("[Command] Exit code " + std::to_string(result.exit_code) + ": " + command);
    }
    return result;
}

} // namespace projsync
