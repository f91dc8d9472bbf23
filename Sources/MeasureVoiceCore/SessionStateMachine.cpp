#include "SessionStateMachine.hpp"

#include "Logger.hpp"

namespace mv {

SessionStateMachine::SessionStateMachine(int64_t default_context_id)
    : context_id_(default_context_id) {
    context_history_.push_back(default_context_id);
}

SessionState SessionStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

int64_t SessionStateMachine::context_id() const {
    std::lock_guard<std::mutex> lock(mu_);
    return context_id_;
}

std::vector<int64_t> SessionStateMachine::context_history() const {
    std::lock_guard<std::mutex> lock(mu_);
    return context_history_;
}

void SessionStateMachine::add_listener(StateChangeListener listener) {
    std::lock_guard<std::mutex> lock(mu_);
    listeners_.push_back(std::move(listener));
}

// ---------------------------------------------------------------------------
// Triggers
// ---------------------------------------------------------------------------

bool SessionStateMachine::start() {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ == SessionState::idle) {
            transition_locked(SessionState::recording, "start");
            changed = true;
        }
    }
    if (changed) deliver();
    return changed;
}

bool SessionStateMachine::key_toggle() {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ == SessionState::recording) {
            transition_locked(SessionState::paused, "key_toggle");
            changed = true;
        } else if (state_ == SessionState::paused) {
            transition_locked(SessionState::recording, "key_toggle");
            changed = true;
        }
    }
    if (changed) deliver();
    return changed;
}

bool SessionStateMachine::apply(const Command& command) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        const bool active = state_ == SessionState::recording ||
                            state_ == SessionState::paused;
        switch (command.kind) {
            case CommandKind::pause:
                if (state_ == SessionState::recording) {
                    transition_locked(SessionState::paused, "voice_pause");
                    changed = true;
                }
                break;
            case CommandKind::resume:
                if (state_ == SessionState::paused) {
                    transition_locked(SessionState::recording, "voice_resume");
                    changed = true;
                }
                break;
            case CommandKind::stop:
                if (active) {
                    transition_locked(SessionState::stopped, "voice_stop");
                    changed = true;
                }
                break;
            case CommandKind::set_context:
                if (active && command.context_value) {
                    changed = set_context_locked(*command.context_value);
                }
                break;
            case CommandKind::unknown:
                break;
        }
        if (!changed) {
            Logger::debug(std::string("Command ") + command_kind_to_string(command.kind) +
                          " ignored in state " + session_state_to_string(state_));
        }
    }
    if (changed) deliver();
    return changed;
}

bool SessionStateMachine::external_stop(const std::string& trigger) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ == SessionState::recording || state_ == SessionState::paused) {
            transition_locked(SessionState::stopped, trigger);
            changed = true;
        }
    }
    if (changed) deliver();
    return changed;
}

// ---------------------------------------------------------------------------
// Waiting
// ---------------------------------------------------------------------------

SessionState SessionStateMachine::wait_for_state_change(SessionState from,
                                                        std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, timeout, [&] { return state_ != from; });
    return state_;
}

void SessionStateMachine::wait_until_stopped() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [&] { return state_ == SessionState::stopped; });
}

bool SessionStateMachine::wait_until_stopped(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [&] { return state_ == SessionState::stopped; });
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

void SessionStateMachine::transition_locked(SessionState to, const std::string& trigger) {
    StateChange change;
    change.from       = state_;
    change.to         = to;
    change.context_id = context_id_;
    change.trigger    = trigger;

    state_ = to;
    Logger::info(std::string("Session ") + session_state_to_string(change.from) + " -> " +
                 session_state_to_string(to) + " (" + trigger + ")");
    pending_.push_back(std::move(change));
    cv_.notify_all();
}

bool SessionStateMachine::set_context_locked(int64_t context_id) {
    if (context_id == context_id_) return false;

    StateChange change;
    change.from       = state_;
    change.to         = state_;
    change.context_id = context_id;
    change.trigger    = "set_context";

    Logger::info("Context " + std::to_string(context_id_) + " -> " + std::to_string(context_id));
    context_id_ = context_id;
    context_history_.push_back(context_id);
    pending_.push_back(std::move(change));
    cv_.notify_all();
    return true;
}

void SessionStateMachine::deliver() {
    // A listener may trigger another change; the recursive lock lets that
    // nested call drain the queue without reordering it.
    std::lock_guard<std::recursive_mutex> order(deliver_mu_);
    for (;;) {
        StateChange change;
        std::vector<StateChangeListener> listeners;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (pending_.empty()) return;
            change = std::move(pending_.front());
            pending_.pop_front();
            listeners = listeners_;
        }
        for (const auto& listener : listeners) {
            if (listener) listener(change);
        }
    }
}

} // namespace mv
