#include "project.hpp"
#include "command_runner.hpp"
#include "fs_utils.hpp"

namespace projsync {

std::optional<Project> Project::create(const std::string& name,
                                       const std::string& local_path,
                                       const std::string& remote_host,
                                       const std::string& remote_path,
                                       const std::string& git_branch,
                                       std::string* error) {
    Project project;
    project.name = trim(name);
    project.local_path = trim(local_path);
    project.remote_host = trim(remote_host);
    project.remote_path = trim(remote_path);
    project.git_branch = trim(git_branch);
    if (project.git_branch.empty()) {
        project.git_branch = kDefaultBranch;
    }

    if (!validate(project, error)) {
        return std::nullopt;
    }
    return project;
}

bool Project::validate(const Project& project, std::string* error) {
    if (project.name.empty() || project.local_path.empty() ||
        project.remote_host.empty() || project.remote_path.empty()) {
        if (error) *error = "All fields except branch are required";
        return false;
    }

    if (!safe_is_directory(project.local_path)) {
        if (error) *error = "Local path does not exist: " + project.local_path;
        return false;
    }

    return true;
}

} // namespace projsync
