#ifndef QUIETMQTT_TRANSPORT_HPP_
#define QUIETMQTT_TRANSPORT_HPP_

#include <memory>
#include <string>
#include <vector>
#include "Message.hpp"
#include "ConnectionConfig.hpp"
#include "dllexport.h"

namespace quietmqtt
{

    // Events raised by a Transport. A transport delivers them from a single
    // ordered stream: no two callbacks of one transport overlap.
    class TransportListener
    {
    public:
        virtual ~TransportListener() {}
        virtual void onConnected() = 0;
        // willRetry is true when the transport has scheduled a reconnect.
        virtual void onConnectionLost(bool willRetry, const char *cause) = 0;
        virtual void onClosed() = 0;
        virtual void onError(int errorCode, const char *message) = 0;
        virtual void onMessage(const Message &message) = 0;
    };

    struct PublishParams
    {
        Message::QoS qos{Message::QoS::AT_MOST_ONCE};
        bool retain{false};
        UserProperties userProperties;
    };

    // Protocol engine behind a Session. Calls are fire-and-forget: a false
    // return means the request was rejected locally, completion and remote
    // failures arrive later through the listener.
    class Transport
    {
    public:
        virtual ~Transport() {}

        // Passing nullptr detaches the current listener. After it returns no
        // further callbacks reach the old listener.
        virtual void setListener(TransportListener *listener) = 0;

        virtual bool connect(const ConnectionConfig &config) = 0;

        // Forcible close; pending work is dropped.
        virtual void close() = 0;

        virtual bool publish(const std::string &topic,
                             const std::vector<uint8_t> &payload,
                             const PublishParams &params) = 0;

        virtual bool subscribe(const std::vector<std::string> &topics,
                               Message::QoS qos,
                               bool noLocal) = 0;

        virtual bool unsubscribe(const std::vector<std::string> &topics) = 0;
    };

    class TransportFactory
    {
    public:
        virtual ~TransportFactory() {}
        virtual std::unique_ptr<Transport> createTransport(const ConnectionConfig &config) = 0;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_TRANSPORT_HPP_
