#ifndef QUIETMQTT_PAHO_TRANSPORT_HPP_
#define QUIETMQTT_PAHO_TRANSPORT_HPP_

#include <memory>
#include <string>
#include <vector>
#include <quietmqtt/Transport.hpp>
#include <quietmqtt/dllexport.h>

namespace quietmqtt
{

    // Transport on the Eclipse Paho MQTT C asynchronous client. With MQTT 5
    // user properties and noLocal are carried on the wire; with 3.1.1 they
    // are dropped and the session falls back to fingerprint matching.
    // Reconnects are left to Paho's automatic reconnect; publishes made while
    // disconnected are buffered by Paho.
    class PahoTransport : public Transport
    {
    public:
        QUIETMQTT_DLLEXPORT PahoTransport();
        QUIETMQTT_DLLEXPORT ~PahoTransport() override;

        PahoTransport(const PahoTransport &) = delete;
        PahoTransport &operator=(const PahoTransport &) = delete;

        QUIETMQTT_DLLEXPORT void setListener(TransportListener *listener) override;
        QUIETMQTT_DLLEXPORT bool connect(const ConnectionConfig &config) override;
        QUIETMQTT_DLLEXPORT void close() override;
        QUIETMQTT_DLLEXPORT bool publish(const std::string &topic,
                                         const std::vector<uint8_t> &payload,
                                         const PublishParams &params) override;
        QUIETMQTT_DLLEXPORT bool subscribe(const std::vector<std::string> &topics,
                                           Message::QoS qos,
                                           bool noLocal) override;
        QUIETMQTT_DLLEXPORT bool unsubscribe(const std::vector<std::string> &topics) override;

    private:
        struct Impl;
        Impl *impl_;
    };

    class PahoTransportFactory : public TransportFactory
    {
    public:
        QUIETMQTT_DLLEXPORT std::unique_ptr<Transport> createTransport(const ConnectionConfig &config) override;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_PAHO_TRANSPORT_HPP_
