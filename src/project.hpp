#pragma once

#include <string>
#include <optional>

namespace projsync {

constexpr const char* kDefaultBranch = "main";

/**
 * A local working copy paired with its counterpart on a remote machine.
 *
 * remote_host is anything ssh accepts as a destination: an alias from
 * ~/.ssh/config or user@hostname. The name is the user-facing key and is
 * unique within a ProjectStore.
 */
struct Project {
    std::string name;
    std::string local_path;
    std::string remote_host;
    std::string remote_path;
    std::string git_branch = kDefaultBranch;

    /**
     * Build a project from user input. Fields are trimmed and an empty
     * branch becomes "main". Returns nullopt and fills *error when
     * validation fails.
     */
    static std::optional<Project> create(const std::string& name,
                                         const std::string& local_path,
                                         const std::string& remote_host,
                                         const std::string& remote_path,
                                         const std::string& git_branch,
                                         std::string* error);

    /**
     * Required fields are non-empty and local_path is an existing directory
     */
    static bool validate(const Project& project, std::string* error);

    // "host:path" as shown in the UI and used as an rsync endpoint
    std::string remote_spec() const { return remote_host + ":" + remote_path; }

    bool operator==(const Project& other) const {
        return name == other.name && local_path == other.local_path &&
               remote_host == other.remote_host && remote_path == other.remote_path &&
               git_branch == other.git_branch;
    }
    bool operator!=(const Project& other) const { return !(*this == other); }
};

} // namespace projsync
