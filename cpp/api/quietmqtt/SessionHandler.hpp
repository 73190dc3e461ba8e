#ifndef QUIETMQTT_SESSION_HANDLER_HPP_
#define QUIETMQTT_SESSION_HANDLER_HPP_

#include <cstdint>
#include "dllexport.h"

namespace quietmqtt
{
    class Session;
    enum class SessionState : int32_t
    {
        OFFLINE = 0,
        CONNECTING = 1,
        ONLINE = 2,
        RECONNECTING = 3,
        ERROR = 4
    };

    QUIETMQTT_DLLEXPORT const char *toString(SessionState state);

    class SessionHandler
    {
    public:
        virtual ~SessionHandler() {}
        virtual void onStateChange(SessionState newState) = 0;
        virtual void onError(int errorCode, const char *message) = 0;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_SESSION_HANDLER_HPP_
