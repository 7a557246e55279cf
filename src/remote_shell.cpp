#include "remote_shell.hpp"
#include "logger.hpp"

namespace projsync {

namespace {
const char* kConnectionSentinel = "connected";
}

RemoteShell::RemoteShell(CommandRunner& runner, int connect_timeout_seconds)
    : runner_(runner),
      connect_timeout_seconds_(connect_timeout_seconds > 0 ? connect_timeout_seconds : 10) {}

std::string RemoteShell::wrap(const std::string& host, const std::string& remote_command) {
    return "ssh " + shell_escape(host) + " " + shell_escape(remote_command);
}

std::string RemoteShell::quote_remote_path(const std::string& path) {
    if (path == "~") {
        return "~";
    }
    if (path.size() > 2 && path.compare(0, 2, "~/") == 0) {
        return "~/" + shell_escape(path.substr(2));
    }
    return shell_escape(path);
}

bool RemoteShell::test_connection(const Project& project, std::string* output) {
    std::string cmd = "ssh -o ConnectTimeout=" + std::to_string(connect_timeout_seconds_) +
                      " -o BatchMode=yes " + shell_escape(project.remote_host) +
                      " " + shell_escape(std::string("echo ") + kConnectionSentinel);

    Logger::info("[SSH] Testing connection to " + project.remote_host);
    CommandResult result = runner_.run(cmd);
    if (output) *output = result.output;

    bool ok = result.success && result.output.find(kConnectionSentinel) != std::string::npos;
    if (ok) {
        Logger::info("[SSH] Connection to " + project.remote_host + " succeeded");
    } else {
        Logger::warn("[SSH] Connection to " + project.remote_host + " failed: " + result.output);
    }
    return ok;
}

} // namespace projsync
