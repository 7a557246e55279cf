#pragma once

#include "sync_types.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace projsync {

struct Decision {
    Choice choice = Choice::Skip;
    bool apply_to_remaining = false;
};

/**
 * Walks the user through a list of conflicts one at a time.
 *
 *   Presenting(i) --decide--> Presenting(i+1) | Resolved
 *   Presenting(i) --decide with apply_to_remaining--> Resolved
 *   Presenting(i) --cancel--> Cancelled
 *
 * An empty list starts out Resolved.
 */
class ConflictResolutionFlow {
public:
    enum class State {
        Presenting,
        Resolved,
        Cancelled
    };

    explicit ConflictResolutionFlow(std::vector<Conflict> conflicts);

    State state() const { return state_; }
    std::size_t index() const { return index_; }
    std::size_t total() const { return conflicts_.size(); }

    // Only valid while Presenting
    const Conflict& current() const { return conflicts_.at(index_); }

    // Returns false when the flow is no longer presenting
    bool decide(Choice choice, bool apply_to_remaining = false);
    bool cancel();

    // Complete once Resolved, empty once Cancelled
    const Resolution& resolution() const { return resolution_; }

private:
    std::vector<Conflict> conflicts_;
    Resolution resolution_;
    std::size_t index_ = 0;
    State state_ = State::Presenting;
};

struct ResolutionOutcome {
    bool cancelled = false;
    Resolution resolution;
};

/**
 * Asked once per presented conflict. Returning nullopt cancels the flow.
 */
using DecisionCallback =
    std::function<std::optional<Decision>(const Conflict& conflict, std::size_t index, std::size_t total)>;

/**
 * Drive a ConflictResolutionFlow to completion with a synchronous callback
 */
ResolutionOutcome resolve_conflicts(const std::vector<Conflict>& conflicts, const DecisionCallback& decide);

} // namespace projsync
