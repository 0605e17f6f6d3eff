#pragma once

#include "spill/utils/ErrorHandling.hh"
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace spill {

// Allowed (from, to) pairs. Built once and shared by every machine of a kind,
// so per-object machines cost one state value and a pointer.
template <typename StateEnum> class TransitionTable {
  public:
    void add(StateEnum from, StateEnum to) { transitions_.insert({from, to}); }

    bool allows(StateEnum from, StateEnum to) const { return transitions_.count({from, to}) > 0; }

    size_t size() const { return transitions_.size(); }

  private:
    std::set<std::pair<StateEnum, StateEnum>> transitions_;
};

// State machine over a shared transition table. Self-transitions are no-ops.
// Not synchronized: each machine belongs to one single-threaded owner.
template <typename StateEnum> class StateMachine {
  public:
    using Table = TransitionTable<StateEnum>;
    using ToStringFn = std::string (*)(StateEnum);

    StateMachine(StateEnum initialState, std::shared_ptr<const Table> table, ToStringFn toStringFn)
        : currentState_(initialState), table_(std::move(table)), toStringFn_(toStringFn) {
        if (!table_) {
            throwError("StateMachine requires a transition table");
        }
    }

    // Throws on a transition the table does not allow.
    void setState(StateEnum state) {
        if (currentState_ == state) {
            return;
        }

        if (!table_->allows(currentState_, state)) {
            throwError("Invalid state transition from " + toStringFn_(currentState_) + " to " + toStringFn_(state));
        }

        currentState_ = state;
    }

    // Non-throwing variant for guards on hot paths.
    bool tryTransition(StateEnum state) {
        if (!isValidTransition(currentState_, state)) {
            return false;
        }
        currentState_ = state;
        return true;
    }

    // Unconditional jump, for resetting pooled objects.
    void reset(StateEnum state) { currentState_ = state; }

    StateEnum getState() const { return currentState_; }

    bool isValidTransition(StateEnum from, StateEnum to) const {
        if (from == to)
            return true;
        return table_->allows(from, to);
    }

    std::string stateName() const { return toStringFn_(currentState_); }

  private:
    StateEnum currentState_;
    std::shared_ptr<const Table> table_;
    ToStringFn toStringFn_;
};

} // namespace spill
