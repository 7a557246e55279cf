#pragma once

#include "command_runner.hpp"
#include "project.hpp"
#include "sync_types.hpp"
#include <ctime>
#include <optional>
#include <string>

namespace projsync {

/**
 * Resolves file modification times on either machine.
 *
 * Local times come from stat(2). Remote times come from `stat` run over
 * ssh, first with the BSD flag form (-f %m) and then the GNU form
 * (-c %Y), so both macOS and Linux remotes work.
 */
class MtimeResolver {
public:
    explicit MtimeResolver(CommandRunner& runner);

    std::optional<std::time_t> local_mtime(const Project& project, const std::string& file) const;
    std::optional<std::time_t> remote_mtime(const Project& project, const std::string& file) const;

    /**
     * Modification time formatted to whole seconds, or nullopt when the
     * file cannot be stat'ed on that side.
     */
    std::optional<std::string> resolve(const Project& project, const std::string& file, Side side) const;

    // Local time, "YYYY-MM-DD HH:MM:SS"
    static std::string format_time(std::time_t time);

    // Epoch seconds from stat output; the last non-empty line must be all digits
    static std::optional<std::time_t> parse_epoch(const std::string& output);

    std::string remote_stat_command(const Project& project, const std::string& file) const;

private:
    CommandRunner& runner_;
};

} // namespace projsync
