#pragma once

#include "command_runner.hpp"
#include "project.hpp"
#include <string>

namespace projsync {

/**
 * Runs commands on a project's remote machine through ssh.
 */
class RemoteShell {
public:
    explicit RemoteShell(CommandRunner& runner, int connect_timeout_seconds = 10);

    /**
     * Build `ssh <host> '<command>'`. The command is interpreted by the
     * remote login shell, so paths inside it must already be quoted
     * with quote_remote_path().
     */
    static std::string wrap(const std::string& host, const std::string& remote_command);

    /**
     * Quote a remote path for the remote shell, keeping a leading "~/"
     * unquoted so it still expands to the remote home directory.
     */
    static std::string quote_remote_path(const std::string& path);

    /**
     * Non-interactive connectivity check with a short connect timeout.
     * Succeeds only when the remote side echoes the sentinel back.
     */
    bool test_connection(const Project& project, std::string* output);

private:
    CommandRunner& runner_;
    int connect_timeout_seconds_;
};

} // namespace projsync
