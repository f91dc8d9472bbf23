#pragma once

#include "Types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mv {

/// One observable change: a state transition, or a context switch
/// (from == to).
struct StateChange {
    SessionState    from       = SessionState::idle;
    SessionState    to         = SessionState::idle;
    int64_t         context_id = 0;
    std::string     trigger;
};

using StateChangeListener = std::function<void(const StateChange&)>;

/// Owns the session state and the active context id.
///
///   Idle             + start                        -> Recording
///   Recording        + key toggle | voice Pause     -> Paused
///   Paused           + key toggle | voice Resume    -> Recording
///   Recording|Paused + voice Stop | external stop   -> Stopped
///   Stopped          + anything                     -> Stopped
///
/// Every other pair is a no-op.  A voice SetContext in Recording or Paused
/// switches the context id.
///
/// State lives under one mutex with a condition variable for waiters.
/// Listeners run outside that mutex, in the order the changes happened,
/// on whichever thread triggered them.
class SessionStateMachine {
public:
    explicit SessionStateMachine(int64_t default_context_id = 100);

    SessionStateMachine(const SessionStateMachine&) = delete;
    SessionStateMachine& operator=(const SessionStateMachine&) = delete;

    SessionState state() const;

    // ---- Triggers (return true if anything changed) ----

    bool start();
    bool key_toggle();
    bool apply(const Command& command);
    bool external_stop(const std::string& trigger = "external_stop");

    // ---- Context ----

    int64_t context_id() const;

    /// Every context id that was active, oldest first, starting with the
    /// default.
    std::vector<int64_t> context_history() const;

    // ---- Observation ----

    void add_listener(StateChangeListener listener);

    /// Block until the state differs from `from` or the timeout expires.
    /// Returns the state at return time.
    SessionState wait_for_state_change(SessionState from,
                                       std::chrono::milliseconds timeout);

    void wait_until_stopped();
    bool wait_until_stopped(std::chrono::milliseconds timeout);

private:
    /// Caller holds mu_.  Queues the change for delivery.
    void transition_locked(SessionState to, const std::string& trigger);
    bool set_context_locked(int64_t context_id);

    /// Hand queued changes to listeners, in order, outside mu_.
    void deliver();

    mutable std::mutex                  mu_;
    std::condition_variable             cv_;
    SessionState                        state_ = SessionState::idle;
    int64_t                             context_id_;
    std::vector<int64_t>                context_history_;

    std::vector<StateChangeListener>    listeners_;
    std::deque<StateChange>             pending_;
    std::recursive_mutex                deliver_mu_;
};

} // namespace mv
