#pragma once

#include <string>
#include <map>

namespace projsync {

enum class SyncDirection {
    ToRemote,
    FromRemote
};

// Which copy of a conflicting file should win
enum class Choice {
    Local,
    Remote,
    Skip
};

// Which machine a query runs against
enum class Side {
    Local,
    Remote
};

constexpr const char* kUnknownTime = "unknown";

/**
 * A gitignored file present on both machines whose modification
 * times differ (whole-second precision).
 */
struct Conflict {
    std::string file;                      // relative to the project root
    std::string local_time = kUnknownTime;
    std::string remote_time = kUnknownTime;
};

// file -> decision, one entry per conflict the user went through
using Resolution = std::map<std::string, Choice>;

// Outcome of one step of a user-facing operation
enum class StepResult {
    Success,
    Cancelled,
    Failed
};

inline const char* to_string(SyncDirection direction) {
    return direction == SyncDirection::ToRemote ? "to_remote" : "from_remote";
}

inline const char* to_string(Choice choice) {
    switch (choice) {
        case Choice::Local:  return "local";
        case Choice::Remote: return "remote";
        case Choice::Skip:   return "skip";
    }
    return "skip";
}

inline const char* to_string(StepResult result) {
    switch (result) {
        case StepResult::Success:   return "success";
        case StepResult::Cancelled: return "cancelled";
        case StepResult::Failed:    return "failed";
    }
    return "failed";
}

} // namespace projsync
