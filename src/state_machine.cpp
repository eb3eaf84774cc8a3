#include "state_machine.h"
#include "logger.h"

namespace duplex_voice {

class SessionStateMachine::Impl {
public:
    Impl() : state_(SessionState::Idle) {}

    SessionState get_state() const {
        return state_;
    }

    bool transition(SessionState to) {
        if (!is_valid_transition(state_, to)) {
            LOG_DEBUG(std::string("Ignored transition ") + session_state_name(state_) + " -> " +
                      session_state_name(to));
            return false;
        }
        LOG_SESSION(std::string("State ") + session_state_name(state_) + " -> " + session_state_name(to));
        state_ = to;
        return true;
    }

    void reset() {
        state_ = SessionState::Idle;
    }

private:
    SessionState state_;
};

SessionStateMachine::SessionStateMachine() : pimpl_(std::make_unique<Impl>()) {}
SessionStateMachine::~SessionStateMachine() = default;

SessionState SessionStateMachine::get_state() const {
    return pimpl_->get_state();
}

bool SessionStateMachine::begin_connect() {
    return pimpl_->transition(SessionState::Connecting);
}

bool SessionStateMachine::on_connected() {
    return pimpl_->transition(SessionState::Connected);
}

bool SessionStateMachine::on_failure() {
    return pimpl_->transition(SessionState::Error);
}

bool SessionStateMachine::on_disconnect() {
    return pimpl_->transition(SessionState::Disconnected);
}

bool SessionStateMachine::is_active() const {
    SessionState s = pimpl_->get_state();
    return s == SessionState::Connecting || s == SessionState::Connected;
}

bool SessionStateMachine::is_terminal() const {
    SessionState s = pimpl_->get_state();
    return s == SessionState::Disconnected || s == SessionState::Error;
}

void SessionStateMachine::reset() {
    pimpl_->reset();
}

bool SessionStateMachine::is_valid_transition(SessionState from, SessionState to) {
    switch (from) {
        case SessionState::Idle:
            return to == SessionState::Connecting || to == SessionState::Disconnected;
        case SessionState::Connecting:
            return to == SessionState::Connected || to == SessionState::Error ||
                   to == SessionState::Disconnected;
        case SessionState::Connected:
            return to == SessionState::Error || to == SessionState::Disconnected;
        case SessionState::Disconnected:
        case SessionState::Error:
            return false;
    }
    return false;
}

} // namespace duplex_voice
