#include "mtime_resolver.hpp"
#include "fs_utils.hpp"
#include "logger.hpp"
#include "remote_shell.hpp"
#include <cctype>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>

namespace projsync {

MtimeResolver::MtimeResolver(CommandRunner& runner) : runner_(runner) {}

std::string MtimeResolver::format_time(std::time_t time) {
    std::tm local_tm{};
    localtime_r(&time, &local_tm);
    std::ostringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::optional<std::time_t> MtimeResolver::parse_epoch(const std::string& output) {
    // GNU stat given the BSD flags prints file system details before failing,
    // so only the last line is trusted
    std::istringstream stream(output);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!line.empty()) last = line;
    }
    if (last.empty() || last.size() > 18) return std::nullopt;
    for (char c : last) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return static_cast<std::time_t>(std::stoll(last));
}

std::optional<std::time_t> MtimeResolver::local_mtime(const Project& project, const std::string& file) const {
    std::string full_path = join_path(project.local_path, file);
    struct stat st;
    if (stat(full_path.c_str(), &st) != 0) {
        Logger::debug("[Mtime] Cannot stat local file " + full_path);
        return std::nullopt;
    }
    return st.st_mtime;
}

std::string MtimeResolver::remote_stat_command(const Project& project, const std::string& file) const {
    std::string target = RemoteShell::quote_remote_path(join_path(project.remote_path, file));
    return RemoteShell::wrap(project.remote_host, "stat -f %m " + target) + " 2>/dev/null || " +
           RemoteShell::wrap(project.remote_host, "stat -c %Y " + target) + " 2>/dev/null";
}

std::optional<std::time_t> MtimeResolver::remote_mtime(const Project& project, const std::string& file) const {
    CommandResult result = runner_.run(remote_stat_command(project, file));
    if (!result.success) {
        Logger::debug("[Mtime] Remote stat failed for " + file);
        return std::nullopt;
    }
    auto epoch = parse_epoch(result.output);
    if (!epoch) {
        Logger::debug("[Mtime] Unexpected remote stat output for " + file + ": " + result.output);
    }
    return epoch;
}

std::optional<std::string> MtimeResolver::resolve(const Project& project, const std::string& file, Side side) const {
    auto mtime = (side == Side::Local) ? local_mtime(project, file) : remote_mtime(project, file);
    if (!mtime) return std::nullopt;
    return format_time(*mtime);
}

} // namespace projsync
