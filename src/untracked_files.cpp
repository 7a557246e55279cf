#include "untracked_files.hpp"
#include "logger.hpp"
#include "remote_shell.hpp"
#include <sstream>

namespace projsync {

UntrackedFileLister::UntrackedFileLister(CommandRunner& runner) : runner_(runner) {}

std::vector<std::string> UntrackedFileLister::parse_file_list(const std::string& output) {
    std::vector<std::string> files;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            files.push_back(line);
        }
    }
    return files;
}

std::vector<std::string> UntrackedFileLister::list(const Project& project, Side side) const {
    CommandResult result;
    if (side == Side::Local) {
        result = runner_.run(kListIgnoredFilesCommand, project.local_path);
    } else {
        std::string remote_cmd = "cd " + RemoteShell::quote_remote_path(project.remote_path) +
                                 " && " + kListIgnoredFilesCommand;
        result = runner_.run(RemoteShell::wrap(project.remote_host, remote_cmd));
    }

    const char* side_name = (side == Side::Local) ? "local" : "remote";
    if (!result.success) {
        Logger::warn(std::string("[Untracked] Could not list ") + side_name +
                     " gitignored files: " + result.output);
        return {};
    }

    std::vector<std::string> files = parse_file_list(result.output);
    Logger::debug(std::string("[Untracked] ") + std::to_string(files.size()) + " " + side_name +
                  " gitignored files");
    return files;
}

} // namespace projsync
