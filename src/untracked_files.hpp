#pragma once

#include "command_runner.hpp"
#include "project.hpp"
#include "sync_types.hpp"
#include <string>
#include <vector>

namespace projsync {

// Files present in the working tree but excluded by .gitignore rules
constexpr const char* kListIgnoredFilesCommand = "git ls-files --others --ignored --exclude-standard";

/**
 * Lists the gitignored files of a project on either machine.
 * The order is whatever git reports; callers must not rely on it.
 */
class UntrackedFileLister {
public:
    explicit UntrackedFileLister(CommandRunner& runner);

    /**
     * Relative paths of gitignored files. A failing query yields an
     * empty list (logged), matching "nothing to sync".
     */
    std::vector<std::string> list(const Project& project, Side side) const;

    static std::vector<std::string> parse_file_list(const std::string& output);

private:
    CommandRunner& runner_;
};

} // namespace projsync
