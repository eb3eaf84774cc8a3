/**
 * Session lifecycle transitions.
 */

#include "state_machine.h"
#include "logger.h"
#include <iostream>

using namespace duplex_voice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    // Happy path
    {
        SessionStateMachine sm;
        ASSERT(sm.get_state() == SessionState::Idle);
        ASSERT(!sm.is_active() && !sm.is_terminal());
        ASSERT(sm.begin_connect());
        ASSERT(sm.get_state() == SessionState::Connecting && sm.is_active());
        ASSERT(sm.on_connected());
        ASSERT(sm.get_state() == SessionState::Connected && sm.is_active());
        ASSERT(sm.on_disconnect());
        ASSERT(sm.get_state() == SessionState::Disconnected && sm.is_terminal());
    }

    // Failure while connecting; terminal states reject everything
    {
        SessionStateMachine sm;
        sm.begin_connect();
        ASSERT(sm.on_failure());
        ASSERT(sm.get_state() == SessionState::Error);
        ASSERT(!sm.on_connected());
        ASSERT(!sm.on_disconnect());
        ASSERT(!sm.begin_connect());
        ASSERT(!sm.on_failure());
        ASSERT(sm.get_state() == SessionState::Error);

        sm.reset();
        ASSERT(sm.get_state() == SessionState::Idle);
        ASSERT(sm.begin_connect());
    }

    // Invalid events leave the state alone
    {
        SessionStateMachine sm;
        ASSERT(!sm.on_connected());
        ASSERT(!sm.on_failure());
        ASSERT(sm.get_state() == SessionState::Idle);
        sm.begin_connect();
        ASSERT(!sm.begin_connect());
        ASSERT(sm.get_state() == SessionState::Connecting);
        ASSERT(sm.on_disconnect());  // cancel mid-connect
        ASSERT(sm.get_state() == SessionState::Disconnected);
    }

    // Transition table
    ASSERT(SessionStateMachine::is_valid_transition(SessionState::Idle, SessionState::Connecting));
    ASSERT(SessionStateMachine::is_valid_transition(SessionState::Idle, SessionState::Disconnected));
    ASSERT(SessionStateMachine::is_valid_transition(SessionState::Connecting, SessionState::Error));
    ASSERT(SessionStateMachine::is_valid_transition(SessionState::Connected, SessionState::Error));
    ASSERT(!SessionStateMachine::is_valid_transition(SessionState::Idle, SessionState::Connected));
    ASSERT(!SessionStateMachine::is_valid_transition(SessionState::Idle, SessionState::Error));
    ASSERT(!SessionStateMachine::is_valid_transition(SessionState::Connected, SessionState::Connecting));
    ASSERT(!SessionStateMachine::is_valid_transition(SessionState::Error, SessionState::Connecting));
    ASSERT(!SessionStateMachine::is_valid_transition(SessionState::Disconnected, SessionState::Error));

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All state machine tests passed.\n";
    return 0;
}
