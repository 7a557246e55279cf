#pragma once

#include "mtime_resolver.hpp"
#include "project.hpp"
#include "sync_types.hpp"
#include "untracked_files.hpp"
#include <vector>

namespace projsync {

/**
 * Finds gitignored files present on both machines whose modification
 * times differ.
 *
 * Files whose time cannot be resolved on either side are dropped without
 * being reported. Equal times (to the second) are never a conflict, even
 * if the contents differ. The order of the result is unspecified.
 */
class ConflictDetector {
public:
    ConflictDetector(const UntrackedFileLister& lister, const MtimeResolver& resolver);

    std::vector<Conflict> detect(const Project& project, SyncDirection direction) const;

private:
    const UntrackedFileLister& lister_;
    const MtimeResolver& resolver_;
};

} // namespace projsync
