#include "conflict_detector.hpp"
#include "logger.hpp"
#include <unordered_set>

namespace projsync {

ConflictDetector::ConflictDetector(const UntrackedFileLister& lister, const MtimeResolver& resolver)
    : lister_(lister), resolver_(resolver) {}

std::vector<Conflict> ConflictDetector::detect(const Project& project, SyncDirection direction) const {
    Logger::info(std::string("[Conflicts] Checking for conflicts (") + to_string(direction) + ") in " +
                 project.name);

    std::vector<std::string> local_files = lister_.list(project, Side::Local);
    std::vector<std::string> remote_list = lister_.list(project, Side::Remote);
    std::unordered_set<std::string> local_set(local_files.begin(), local_files.end());
    std::unordered_set<std::string> remote_set(remote_list.begin(), remote_list.end());

    std::vector<Conflict> conflicts;
    size_t common = 0;
    for (const auto& file : local_set) {
        if (remote_set.find(file) == remote_set.end()) continue;
        common++;

        auto local_time = resolver_.resolve(project, file, Side::Local);
        if (!local_time) continue;
        auto remote_time = resolver_.resolve(project, file, Side::Remote);
        if (!remote_time) continue;

        if (*local_time != *remote_time) {
            Conflict conflict;
            conflict.file = file;
            conflict.local_time = *local_time;
            conflict.remote_time = *remote_time;
            conflicts.push_back(conflict);
        }
    }

    Logger::info("[Conflicts] " + std::to_string(common) + " files on both sides, " +
                 std::to_string(conflicts.size()) + " with differing times");
    return conflicts;
}

} // namespace projsync
