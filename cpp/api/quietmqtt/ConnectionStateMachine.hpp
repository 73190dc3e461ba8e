#ifndef QUIETMQTT_CONNECTION_STATE_MACHINE_HPP_
#define QUIETMQTT_CONNECTION_STATE_MACHINE_HPP_

#include <cstdint>
#include "SessionHandler.hpp"
#include "dllexport.h"

namespace quietmqtt
{

    enum class ConnectionEvent : int32_t
    {
        CONNECT_REQUESTED = 0,
        TRANSPORT_CONNECTED = 1,
        TRANSPORT_DROPPED_RETRY = 2,
        TRANSPORT_CLOSED = 3,
        TRANSPORT_ERROR = 4
    };

    QUIETMQTT_DLLEXPORT const char *toString(ConnectionEvent event);

    //   OFFLINE               + CONNECT_REQUESTED       -> CONNECTING
    //   any                   + TRANSPORT_CONNECTED     -> ONLINE
    //   ONLINE                + TRANSPORT_DROPPED_RETRY -> RECONNECTING
    //   other                 + TRANSPORT_DROPPED_RETRY -> CONNECTING
    //   any                   + TRANSPORT_CLOSED        -> OFFLINE
    //   any                   + TRANSPORT_ERROR         -> ERROR
    // A connect request outside OFFLINE leaves the state unchanged.
    class ConnectionStateMachine
    {
    public:
        QUIETMQTT_DLLEXPORT static SessionState next(SessionState current, ConnectionEvent event);

        QUIETMQTT_DLLEXPORT ConnectionStateMachine();

        // Applies the event and returns true if the state changed.
        QUIETMQTT_DLLEXPORT bool apply(ConnectionEvent event);

        QUIETMQTT_DLLEXPORT SessionState getState() const;

        QUIETMQTT_DLLEXPORT void reset();

    private:
        SessionState state_;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_CONNECTION_STATE_MACHINE_HPP_
