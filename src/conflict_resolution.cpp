#include "conflict_resolution.hpp"
#include "logger.hpp"

namespace projsync {

ConflictResolutionFlow::ConflictResolutionFlow(std::vector<Conflict> conflicts)
    : conflicts_(std::move(conflicts)) {
    if (conflicts_.empty()) {
        state_ = State::Resolved;
    }
}

bool ConflictResolutionFlow::decide(Choice choice, bool apply_to_remaining) {
    if (state_ != State::Presenting) return false;

    resolution_[conflicts_[index_].file] = choice;

    if (apply_to_remaining) {
        for (std::size_t i = index_ + 1; i < conflicts_.size(); i++) {
            resolution_[conflicts_[i].file] = choice;
        }
        index_ = conflicts_.size();
        state_ = State::Resolved;
        return true;
    }

    index_++;
    if (index_ == conflicts_.size()) {
        state_ = State::Resolved;
    }
    return true;
}

bool ConflictResolutionFlow::cancel() {
    if (state_ != State::Presenting) return false;
    resolution_.clear();
    state_ = State::Cancelled;
    return true;
}

ResolutionOutcome resolve_conflicts(const std::vector<Conflict>& conflicts, const DecisionCallback& decide) {
    ConflictResolutionFlow flow(conflicts);

    while (flow.state() == ConflictResolutionFlow::State::Presenting) {
        std::optional<Decision> decision;
        if (decide) {
            decision = decide(flow.current(), flow.index(), flow.total());
        }
        if (!decision) {
            flow.cancel();
            break;
        }
        Logger::debug(std::string("[Conflicts] ") + flow.current().file + " -> " +
                      to_string(decision->choice) +
                      (decision->apply_to_remaining ? " (applied to remaining)" : ""));
        flow.decide(decision->choice, decision->apply_to_remaining);
    }

    ResolutionOutcome outcome;
    if (flow.state() == ConflictResolutionFlow::State::Cancelled) {
        Logger::info("[Conflicts] Conflict resolution cancelled");
        outcome.cancelled = true;
        return outcome;
    }
    outcome.resolution = flow.resolution();
    return outcome;
}

} // namespace projsync
