#include "ConnectionStateMachine.hpp"

namespace quietmqtt
{

    const char *toString(ConnectionEvent event)
    {
        switch (event)
        {
        case ConnectionEvent::CONNECT_REQUESTED:
            return "connect requested";
        case ConnectionEvent::TRANSPORT_CONNECTED:
            return "transport connected";
        case ConnectionEvent::TRANSPORT_DROPPED_RETRY:
            return "transport dropped, retry pending";
        case ConnectionEvent::TRANSPORT_CLOSED:
            return "transport closed";
        case ConnectionEvent::TRANSPORT_ERROR:
            return "transport error";
        }
        return "unknown";
    }

    SessionState ConnectionStateMachine::next(SessionState current, ConnectionEvent event)
    {
        switch (event)
        {
        case ConnectionEvent::CONNECT_REQUESTED:
            return current == SessionState::OFFLINE ? SessionState::CONNECTING : current;
        case ConnectionEvent::TRANSPORT_CONNECTED:
            return SessionState::ONLINE;
        case ConnectionEvent::TRANSPORT_DROPPED_RETRY:
            return current == SessionState::ONLINE ? SessionState::RECONNECTING : SessionState::CONNECTING;
        case ConnectionEvent::TRANSPORT_CLOSED:
            return SessionState::OFFLINE;
        case ConnectionEvent::TRANSPORT_ERROR:
            return SessionState::ERROR;
        }
        return current;
    }

    ConnectionStateMachine::ConnectionStateMachine() : state_(SessionState::OFFLINE) {}

    bool ConnectionStateMachine::apply(ConnectionEvent event)
    {
        SessionState previous = state_;
        state_ = next(state_, event);
        return state_ != previous;
    }

    SessionState ConnectionStateMachine::getState() const
    {
        return state_;
    }

    void ConnectionStateMachine::reset()
    {
        state_ = SessionState::OFFLINE;
    }

} // namespace quietmqtt
